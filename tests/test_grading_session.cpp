#include "catch2_custom.hpp"

#include "fake_container_engine.hpp"

#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/exceptions.hpp>
#include <dockgrader/file_map.hpp>
#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/grading_session.hpp>
#include <dockgrader/lint/style_linter.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace dockgrader;
using dockgrader::testing::FakeContainerEngine;

namespace {

const std::string RUN_ONLY_RECIPE = "run:\n\tpython3 main.py\n";
const std::string BUILD_AND_RUN_RECIPE = "build:\n\tgcc -o prog main.c\nrun:\n\t./prog\n";

bool is_build(const std::vector<std::string>& argv) {
    return argv.at(0) == "/bin/sh";
}

struct SessionFixture
{
    GraderConfig config{.build_timeout = Seconds{5.0},
                        .test_timeout = Seconds{5.0},
                        .staging_root = std::filesystem::temp_directory_path() / "dockgrader-tests" / "session"};
    FakeContainerEngine engine;
    StyleLinter linter;

    ResultRecord grade(const FileMap& files, const std::vector<TestVector>& vectors) {
        GradingSession session{engine, linter, config};
        return session.grade(files, vectors);
    }

    /// Echoes the staged input back into the output file
    void echo_input() {
        engine.on_execute = [this](const std::vector<std::string>& argv, const EnvVars& /*env*/) {
            if (!is_build(argv)) {
                engine.set_file(config.output_file, engine.read_mounted("input.txt"));
            }
            return ExecResult{};
        };
    }
};

} // namespace

TEST_CASE_METHOD(SessionFixture, "Submissions without a usable recipe never reach the engine") {
    SECTION("No recipe") {
        auto res = grade({{"main.py", "print(1)\n"}}, {{"", "1"}});

        REQUIRE(res.status == Verdict::BuildError);
        REQUIRE(res.message == "No Makefile found!");
        REQUIRE(res.tests_total == 1);
    }

    SECTION("No run target") {
        auto res = grade({{"Makefile", "build:\n\tcc main.c\n"}}, {{"", "1"}});

        REQUIRE(res.status == Verdict::BuildError);
        REQUIRE(res.message == R"(Makefile must contain "run:")");
    }

    REQUIRE(engine.get_log().empty());
}

TEST_CASE_METHOD(SessionFixture, "Mismatch on the second vector") {
    echo_input();

    auto res = grade({{"Makefile", RUN_ONLY_RECIPE}, {"main.py", "print(input())\n"}}, {{"3\n", "3"}, {"5\n", "6"}});

    REQUIRE(res.status == Verdict::CheckError);
    REQUIRE(res.tests_passed == 1);
    REQUIRE(res.tests_total == 2);
    REQUIRE(res.message == "For \"5\n\" expected \"6\", but got \"5\"");
    REQUIRE(res.build_time.count() == 0.0);

    // No build target, so no build command
    for (const auto& argv : engine.get_executed()) {
        CHECK(!is_build(argv));
    }

    SECTION("The environment is torn down") {
        REQUIRE(engine.count("remove") == 1);
        REQUIRE(engine.get_log().back() == "remove");
    }

    SECTION("The environment is provisioned as requested") {
        ContainerSpec spec = engine.get_spec();

        REQUIRE(spec.image == config.image);
        REQUIRE(spec.memory_limit == "64m");
        REQUIRE(spec.network_disabled);
        REQUIRE(spec.volumes.size() == 1);
        REQUIRE(spec.volumes[0].container_path == "/root/input");
        REQUIRE(spec.volumes[0].read_only);

        // Staging directory is gone afterwards
        REQUIRE(!std::filesystem::exists(spec.volumes[0].host_path));

        REQUIRE(engine.get_archive_path() == "/root");
    }
}

TEST_CASE_METHOD(SessionFixture, "Passing submission gets its style checked") {
    echo_input();

    SECTION("Clean") {
        auto res = grade({{"Makefile", BUILD_AND_RUN_RECIPE}, {"main.c", "int main(void) { return 0; }\n"}},
                         {{"1", "1"}, {"2", "2"}});

        REQUIRE(res.status == Verdict::Ok);
        REQUIRE(res.tests_passed == 2);
        REQUIRE(res.lint_success);
        REQUIRE(res.message.empty());

        auto executed = engine.get_executed();
        REQUIRE(is_build(executed.at(0)));
        REQUIRE(executed.at(0).at(2) == "make build");
        REQUIRE(executed.size() == 3);
    }

    SECTION("With findings") {
        auto res = grade({{"Makefile", BUILD_AND_RUN_RECIPE}, {"main.c", "int main(void) { return 0; } \n"}},
                         {{"1", "1"}});

        REQUIRE(res.status == Verdict::Ok);
        REQUIRE(!res.lint_success);
        REQUIRE(res.message == "\nmain.c:1: [trailing-whitespace] trailing whitespace");
    }
}

TEST_CASE_METHOD(SessionFixture, "Failing build stops before testing") {
    engine.on_execute = [](const std::vector<std::string>& argv, const EnvVars& /*env*/) {
        if (is_build(argv)) {
            return ExecResult{.exit_code = 2, .output = "main.c:1:1: error: expected ';'"};
        }
        return ExecResult{};
    };

    auto res = grade({{"Makefile", BUILD_AND_RUN_RECIPE}, {"main.c", "int main(void) { return 0 }\n"}}, {{"1", "1"}});

    REQUIRE(res.status == Verdict::BuildError);
    REQUIRE(res.message == "main.c:1:1: error: expected ';'");
    REQUIRE(res.tests_passed == 0);
    REQUIRE(res.tests_total == 1);
    REQUIRE(engine.count("execute") == 1);
    REQUIRE(engine.count("remove") == 1);
}

TEST_CASE_METHOD(SessionFixture, "Build exceeding its budget") {
    config.build_timeout = Seconds{0.1};

    engine.on_execute = [this](const std::vector<std::string>& argv, const EnvVars& /*env*/) {
        if (is_build(argv)) {
            return engine.block_until_killed();
        }
        return ExecResult{};
    };

    auto res = grade({{"Makefile", BUILD_AND_RUN_RECIPE}}, {{"1", "1"}, {"2", "2"}});

    REQUIRE(res.status == Verdict::BuildTimeout);
    REQUIRE(res.tests_passed == 0);
    REQUIRE(res.tests_total == 2);
    REQUIRE(res.build_time.count() >= 0.1);
    REQUIRE(engine.count("kill") == 1);
    REQUIRE(engine.count("execute") == 1);
    REQUIRE(engine.count("remove") == 1);
}

TEST_CASE_METHOD(SessionFixture, "Tests exceeding their aggregate budget") {
    config.test_timeout = Seconds{0.05};

    int runs = 0;
    engine.on_execute = [&, this](const std::vector<std::string>& argv, const EnvVars& /*env*/) {
        if (!is_build(argv) && ++runs == 2) {
            return engine.block_until_killed();
        }
        engine.set_file(config.output_file, "1");
        return ExecResult{};
    };

    auto res = grade({{"Makefile", RUN_ONLY_RECIPE}}, {{"1", "1"}, {"1", "1"}, {"1", "1"}});

    REQUIRE(res.status == Verdict::RuntimeTimeout);
    REQUIRE(res.tests_passed == 0);
    REQUIRE(res.tests_total == 3);
    REQUIRE(res.check_time.count() >= 0.15);
    REQUIRE(engine.count("kill") == 1);
    REQUIRE(engine.count("remove") == 1);
}

TEST_CASE_METHOD(SessionFixture, "Infrastructure failures are thrown, not graded") {
    SECTION("Provisioning") {
        engine.fail_create = true;

        REQUIRE_THROWS_AS(grade({{"Makefile", RUN_ONLY_RECIPE}}, {{"1", "1"}}), ProvisionError);
        REQUIRE(engine.count("remove") == 0);
    }

    SECTION("Injection") {
        engine.fail_put_archive = true;

        REQUIRE_THROWS_AS(grade({{"Makefile", RUN_ONLY_RECIPE}}, {{"1", "1"}}), InjectionError);
        REQUIRE(engine.count("execute") == 0);
        REQUIRE(engine.count("remove") == 1);
    }
}
