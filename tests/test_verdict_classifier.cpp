#include "catch2_custom.hpp"

#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/phase_supervisor.hpp>
#include <dockgrader/verdict_classifier.hpp>

#include <optional>
#include <string>

using namespace dockgrader;

TEST_CASE("Recipe targets are detected textually") {
    auto both = inspect_recipe("build:\n\tgcc main.c\nrun:\n\t./a.out\n");
    REQUIRE(both.has_build);
    REQUIRE(both.has_run);

    auto run_only = inspect_recipe("run:\n\tpython3 main.py\n");
    REQUIRE(!run_only.has_build);
    REQUIRE(run_only.has_run);

    // Anywhere in the file, not just at the start of a line
    REQUIRE(inspect_recipe("# prerun: nothing\n").has_run);
    REQUIRE(!inspect_recipe("").has_run);
}

TEST_CASE("Unusable recipes are rejected as build errors") {
    SECTION("Missing recipe file") {
        auto res = validate_recipe({{"main.py", ""}}, "Makefile", 3);

        REQUIRE(res.rejection.has_value());
        REQUIRE(res.rejection->status == Verdict::BuildError);
        REQUIRE(res.rejection->message == "No Makefile found!");
        REQUIRE(res.rejection->tests_total == 3);
        REQUIRE(res.rejection->tests_passed == 0);
    }

    SECTION("Recipe without a run target") {
        auto res = validate_recipe({{"Makefile", "build:\n\tcc main.c\n"}}, "Makefile", 1);

        REQUIRE(res.rejection.has_value());
        REQUIRE(res.rejection->status == Verdict::BuildError);
        REQUIRE(res.rejection->message == R"(Makefile must contain "run:")");
    }

    SECTION("Recipe in a subdirectory does not count") {
        auto res = validate_recipe({{"sub/Makefile", "run:\n"}}, "Makefile", 1);

        REQUIRE(res.rejection.has_value());
    }

    SECTION("Usable recipe") {
        auto res = validate_recipe({{"Makefile", "run:\n\t./prog\nbuild:\n\tcc -o prog main.c\n"}}, "Makefile", 1);

        REQUIRE(!res.rejection.has_value());
        REQUIRE(res.targets.has_build);
    }
}

TEST_CASE("Build outcomes") {
    const Seconds elapsed{1.5};

    SECTION("Timeout") {
        auto res = classify_build({.value = std::nullopt, .elapsed = elapsed, .completed = false}, 4);

        REQUIRE(res.has_value());
        REQUIRE(res->status == Verdict::BuildTimeout);
        REQUIRE(res->build_time.count() == elapsed.count());
        REQUIRE(res->tests_total == 4);
        REQUIRE(res->message.empty());
    }

    SECTION("Failure carries the build output") {
        auto res = classify_build({.value = ExecResult{.exit_code = 2, .output = "main.c:1: error"},
                                   .elapsed = elapsed,
                                   .completed = true},
                                  4);

        REQUIRE(res.has_value());
        REQUIRE(res->status == Verdict::BuildError);
        REQUIRE(res->message == "main.c:1: error");
        REQUIRE(res->tests_passed == 0);
    }

    SECTION("Success") {
        auto res = classify_build({.value = ExecResult{.exit_code = 0, .output = "warning: unused variable"},
                                   .elapsed = elapsed,
                                   .completed = true},
                                  4);

        REQUIRE(!res.has_value());
    }
}

TEST_CASE("Test outcomes") {
    SECTION("Runner verdict is adopted") {
        ResultRecord runner_record{.status = Verdict::CheckError, .message = "nope", .tests_passed = 1,
                                   .tests_total = 2};

        auto res = classify_test({.value = runner_record, .elapsed = Seconds{0.25}, .completed = true}, 2);

        REQUIRE(res.status == Verdict::CheckError);
        REQUIRE(res.message == "nope");
        REQUIRE(res.tests_passed == 1);
        REQUIRE(res.check_time.count() == 0.25);
    }

    SECTION("Timeout discards progress") {
        auto res = classify_test({.value = std::nullopt, .elapsed = Seconds{4.0}, .completed = false}, 2);

        REQUIRE(res.status == Verdict::RuntimeTimeout);
        REQUIRE(res.tests_passed == 0);
        REQUIRE(res.tests_total == 2);
        REQUIRE(res.check_time.count() == 4.0);
    }
}

TEST_CASE("Lint findings annotate but never change an OK verdict") {
    ResultRecord clean{.status = Verdict::Ok, .tests_passed = 1, .tests_total = 1};
    apply_lint(clean, "");

    REQUIRE(clean.status == Verdict::Ok);
    REQUIRE(clean.lint_success);
    REQUIRE(clean.message.empty());

    ResultRecord dirty{.status = Verdict::Ok, .tests_passed = 1, .tests_total = 1};
    apply_lint(dirty, "a.c:1: [trailing-whitespace] trailing whitespace");

    REQUIRE(dirty.status == Verdict::Ok);
    REQUIRE(!dirty.lint_success);
    REQUIRE(dirty.message == "\na.c:1: [trailing-whitespace] trailing whitespace");
}
