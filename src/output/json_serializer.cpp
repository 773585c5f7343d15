#include "output/json_serializer.hpp"

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <type_traits>

namespace dockgrader {

using nlohmann::ordered_json;

ordered_json to_json(const ResultRecord& result) {
    // Wire names are independent of ResultRecord's member names
    return ordered_json{
        {"checkTime", round_seconds(result.check_time)},
        {"buildTime", round_seconds(result.build_time)},
        {"checkResult", static_cast<std::underlying_type_t<Verdict>>(result.status)},
        {"checkMessage", result.message},
        {"testsPassed", result.tests_passed},
        {"testsTotal", result.tests_total},
        {"lintSuccess", result.lint_success},
    };
}

JsonSerializer::JsonSerializer(Sink& sink)
    : Serializer{sink, VerbosityLevel::Max} {}

void JsonSerializer::on_session_begin(const GraderConfig& config, int num_vectors) {
    LOG_DEBUG("JSON output for {} vectors with {}", num_vectors, config);
}

void JsonSerializer::on_result(const ResultRecord& result) {
    document_ = to_json(result);
}

void JsonSerializer::on_error(std::string_view what) {
    document_ = ordered_json{{"error", std::string{what}}};
}

void JsonSerializer::finalize() {
    if (document_.is_null()) {
        return;
    }

    // Program output is not guaranteed to be valid UTF-8
    constexpr int NO_INDENT = -1;
    sink_.write(document_.dump(NO_INDENT, ' ', false, ordered_json::error_handler_t::replace));
    sink_.write("\n");
    sink_.flush();
}

} // namespace dockgrader
