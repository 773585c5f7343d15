#include <dockgrader/lint/style_linter.hpp>

#include <dockgrader/file_map.hpp>
#include <dockgrader/lint/linter.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/take_while.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dockgrader {

namespace {

bool is_recipe_file(std::string_view name) {
    auto slash = name.rfind('/');
    std::string_view base = slash == std::string_view::npos ? name : name.substr(slash + 1);

    return base == "Makefile" || base == "makefile" || base == "GNUmakefile" || base.ends_with(".mk");
}

bool is_blank(char chr) {
    return chr == ' ' || chr == '\t';
}

} // namespace

std::string Linter::render(const std::vector<LintFinding>& findings) const {
    std::string res;

    for (const LintFinding& finding : findings) {
        if (!res.empty()) {
            res += '\n';
        }
        res += fmt::format("{}:{}: [{}] {}", finding.file, finding.line, finding.rule, finding.message);
    }

    return res;
}

StyleLinter::StyleLinter(std::size_t max_line_length)
    : max_line_length_{max_line_length} {}

std::vector<LintFinding> StyleLinter::analyze(const FileMap& files) {
    std::vector<LintFinding> findings;

    // FileMap is ordered by path, so findings come out sorted by file, then line
    for (const auto& [name, contents] : files) {
        analyze_file(name, contents, findings);
    }

    LOG_DEBUG("Style analysis of {} files: {} findings", files.size(), findings.size());

    return findings;
}

void StyleLinter::analyze_file(std::string_view name, std::string_view contents,
                               std::vector<LintFinding>& findings) const {
    auto add = [&](int line, std::string_view rule, std::string message) {
        findings.push_back(
            {.file = std::string{name}, .line = line, .rule = std::string{rule}, .message = std::move(message)});
    };

    const bool check_indentation = !is_recipe_file(name);

    int line_num = 0;
    std::size_t start = 0;
    while (start < contents.size()) {
        ++line_num;

        auto end = contents.find('\n', start);
        if (end == std::string_view::npos) {
            end = contents.size();
        }

        std::string_view line = contents.substr(start, end - start);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }

        if (!line.empty() && is_blank(line.back())) {
            add(line_num, "trailing-whitespace", "trailing whitespace");
        }

        if (check_indentation) {
            auto indent = line | ranges::views::take_while(is_blank);
            auto num_tabs = ranges::count_if(indent, [](char chr) { return chr == '\t'; });
            auto num_spaces = ranges::count_if(indent, [](char chr) { return chr == ' '; });

            if (num_tabs > 0 && num_spaces > 0) {
                add(line_num, "mixed-indentation", "indentation mixes tabs and spaces");
            }
        }

        if (line.size() > max_line_length_) {
            add(line_num, "line-length",
                fmt::format("line is {} characters long (limit is {})", line.size(), max_line_length_));
        }

        start = end + 1;
    }

    if (!contents.empty() && contents.back() != '\n') {
        add(line_num, "final-newline", "no newline at end of file");
    }
}

} // namespace dockgrader
