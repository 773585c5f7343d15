#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace dockgrader {

/// Wire representation of a result:
///   checkTime, buildTime  seconds, rounded to 0.1ms
///   checkResult           integer verdict code
///   checkMessage          text
///   testsPassed           integer
///   testsTotal            integer
///   lintSuccess           boolean
nlohmann::ordered_json to_json(const ResultRecord& result);

/// Writes a single JSON document once finalized, regardless of verbosity
class JsonSerializer : public Serializer
{
public:
    explicit JsonSerializer(Sink& sink);

    void on_session_begin(const GraderConfig& config, int num_vectors) override;
    void on_result(const ResultRecord& result) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    nlohmann::ordered_json document_;
};

} // namespace dockgrader
