#pragma once

#include <dockgrader/file_map.hpp>
#include <dockgrader/lint/linter.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace dockgrader {

/// Language-agnostic whitespace and layout checks
///
/// Rules:
///   trailing-whitespace   a line ends in spaces or tabs
///   mixed-indentation     a line is indented with both tabs and spaces (recipe files are exempt)
///   line-length           a line is longer than the configured limit
///   final-newline         a non-empty file does not end with a newline
class StyleLinter : public Linter
{
public:
    explicit StyleLinter(std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH);

    std::vector<LintFinding> analyze(const FileMap& files) override;

    static constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 120;

private:
    void analyze_file(std::string_view name, std::string_view contents, std::vector<LintFinding>& findings) const;

    std::size_t max_line_length_;
};

} // namespace dockgrader
