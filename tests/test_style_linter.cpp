#include "catch2_custom.hpp"

#include <dockgrader/file_map.hpp>
#include <dockgrader/lint/linter.hpp>
#include <dockgrader/lint/style_linter.hpp>

#include <string>
#include <vector>

using dockgrader::FileMap;
using dockgrader::LintFinding;
using dockgrader::StyleLinter;

TEST_CASE("Clean sources produce no findings and an empty report") {
    StyleLinter linter;
    FileMap files{{"main.py", "print(input())\n"}, {"Makefile", "run:\n\tpython3 main.py\n"}};

    auto findings = linter.analyze(files);

    REQUIRE(findings.empty());
    REQUIRE(linter.render(findings).empty());
}

TEST_CASE("Each rule reports file and line") {
    StyleLinter linter{20};
    FileMap files{{"a.c", "int x; \n\t  int y;\nint a_rather_long_line_here;\nint z;"}};

    auto findings = linter.analyze(files);

    REQUIRE(findings.size() == 4);

    CHECK(findings[0].rule == "trailing-whitespace");
    CHECK(findings[0].line == 1);
    CHECK(findings[1].rule == "mixed-indentation");
    CHECK(findings[1].line == 2);
    CHECK(findings[2].rule == "line-length");
    CHECK(findings[2].line == 3);
    CHECK(findings[3].rule == "final-newline");
    CHECK(findings[3].line == 4);

    for (const LintFinding& finding : findings) {
        CHECK(finding.file == "a.c");
    }
}

TEST_CASE("Recipe files may mix tabs and spaces") {
    StyleLinter linter;

    REQUIRE(linter.analyze({{"Makefile", "run:\n\t  python3 main.py\n"}}).empty());
    REQUIRE(linter.analyze({{"sub/rules.mk", "build:\n\t  cc x.c\n"}}).empty());
    REQUIRE(linter.analyze({{"main.py", "if x:\n\t  pass\n"}}).size() == 1);
}

TEST_CASE("Rendered report has one line per finding") {
    StyleLinter linter;
    auto findings = linter.analyze({{"b.txt", "x \ny\t\n"}});

    REQUIRE(linter.render(findings) ==
            "b.txt:1: [trailing-whitespace] trailing whitespace\nb.txt:2: [trailing-whitespace] trailing whitespace");
}
