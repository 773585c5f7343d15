#include "catch2_custom.hpp"

#include "output/json_serializer.hpp"
#include "output/sink.hpp"

#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

using namespace dockgrader;

namespace {

class StringSink : public Sink
{
public:
    void write(std::string_view str) override { buffer += str; }

    void flush() override { ++flushes; }

    std::string buffer;
    int flushes = 0;
};

} // namespace

TEST_CASE("Result records use the wire names, in order") {
    ResultRecord record{.check_time = Seconds{0.123456},
                        .build_time = Seconds{1.5},
                        .status = Verdict::RuntimeTimeout,
                        .message = "",
                        .tests_passed = 0,
                        .tests_total = 3,
                        .lint_success = false};

    REQUIRE(to_json(record).dump() == R"({"checkTime":0.1235,"buildTime":1.5,"checkResult":6,"checkMessage":"",)"
                                      R"("testsPassed":0,"testsTotal":3,"lintSuccess":false})");
}

TEST_CASE("Verdict codes are stable") {
    auto code = [](Verdict verdict) { return to_json(ResultRecord{.status = verdict})["checkResult"].get<int>(); };

    REQUIRE(code(Verdict::Ok) == 0);
    REQUIRE(code(Verdict::Checking) == 1);
    REQUIRE(code(Verdict::BuildError) == 2);
    REQUIRE(code(Verdict::RuntimeError) == 3);
    REQUIRE(code(Verdict::CheckError) == 4);
    REQUIRE(code(Verdict::RuntimeTimeout) == 6);
    REQUIRE(code(Verdict::BuildTimeout) == 7);
    REQUIRE(code(Verdict::LintError) == 8);
    REQUIRE(code(Verdict::Draft) == 9);
}

TEST_CASE("A single document is written on finalize") {
    StringSink sink;
    JsonSerializer serializer{sink};

    serializer.on_session_begin(GraderConfig{}, 2);
    serializer.on_result(ResultRecord{.status = Verdict::Ok, .tests_passed = 2, .tests_total = 2,
                                      .lint_success = true});

    REQUIRE(sink.buffer.empty());

    serializer.finalize();

    REQUIRE(sink.buffer.ends_with("}\n"));
    REQUIRE(sink.flushes == 1);

    auto parsed = nlohmann::json::parse(sink.buffer);
    REQUIRE(parsed["checkResult"].get<int>() == 0);
    REQUIRE(parsed["testsPassed"].get<int>() == 2);
    REQUIRE(parsed["lintSuccess"].get<bool>());
}

TEST_CASE("Errors and undecodable output") {
    StringSink sink;
    JsonSerializer serializer{sink};

    SECTION("Error document") {
        serializer.on_error("Unable to create a container");
        serializer.finalize();

        REQUIRE(sink.buffer == "{\"error\":\"Unable to create a container\"}\n");
    }

    SECTION("Invalid UTF-8 in the message is replaced rather than thrown") {
        serializer.on_result(ResultRecord{.status = Verdict::RuntimeError, .message = "bad \xff byte"});

        REQUIRE_NOTHROW(serializer.finalize());
        REQUIRE(nlohmann::json::parse(sink.buffer)["checkMessage"].get<std::string>() == "bad \xEF\xBF\xBD byte");
    }

    SECTION("Nothing to write") {
        serializer.finalize();

        REQUIRE(sink.buffer.empty());
    }
}
