#pragma once

#include <dockgrader/common/formatters/macros.hpp>
#include <dockgrader/file_map.hpp>

#include <string>
#include <vector>

namespace dockgrader {

struct LintFinding
{
    std::string file;
    /// 1-indexed
    int line{};
    std::string rule;
    std::string message;
};

/// Static analysis of submitted sources, run only once a submission has passed every test
class Linter
{
public:
    virtual ~Linter() = default;

    /// Findings in a stable order (by file, then line)
    virtual std::vector<LintFinding> analyze(const FileMap& files) = 0;

    /// Human-readable report; empty when there are no findings
    virtual std::string render(const std::vector<LintFinding>& findings) const;
};

} // namespace dockgrader

FMT_SERIALIZE_CLASS(::dockgrader::LintFinding, file, line, rule, message);
