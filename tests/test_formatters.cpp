#include "catch2_custom.hpp"

#include <dockgrader/common/error_types.hpp>
#include <dockgrader/common/formatters/macros.hpp>
#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/exceptions.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/verdict_classifier.hpp>

#include <fmt/format.h>

namespace {

enum class Described { First, Second };
enum class Undescribed {};

struct Point
{
    int x;
    int y;
};

} // namespace

FMT_SERIALIZE_ENUM(Described, First, Second);
FMT_SERIALIZE_CLASS(Point, x, y);

TEST_CASE("Only described types are formattable") {
    STATIC_REQUIRE(fmt::is_formattable<Described>::value);
    STATIC_REQUIRE(!fmt::is_formattable<Undescribed>::value);
    STATIC_REQUIRE(fmt::is_formattable<Point>::value);

    STATIC_REQUIRE(fmt::is_formattable<dockgrader::Verdict>::value);
    STATIC_REQUIRE(fmt::is_formattable<dockgrader::ResultRecord>::value);
    STATIC_REQUIRE(fmt::is_formattable<dockgrader::ContainerStatus>::value);
}

TEST_CASE("Enumerators by name") {
    REQUIRE(fmt::format("{}", Described::Second) == "Second");
    REQUIRE(fmt::format("{:?}", Described::First) == "Described{First}");

    REQUIRE(fmt::format("{}", dockgrader::Verdict::RuntimeTimeout) == "RuntimeTimeout");
    REQUIRE(fmt::format("{}", dockgrader::ErrorKind::EngineFailure) == "EngineFailure");

    // Values without an enumerator fall back to the number
    REQUIRE(fmt::format("{}", static_cast<dockgrader::Verdict>(5)) == "<unknown (5)>");
}

TEST_CASE("Aggregates by member") {
    REQUIRE(fmt::format("{}", Point{1, 2}) == "1, 2");
    REQUIRE(fmt::format("{:?}", Point{1, 2}) == "Point {.x = 1, .y = 2}");

    dockgrader::RecipeTargets targets{.has_run = true, .has_build = false};
    REQUIRE(fmt::format("{:?}", targets) == "::dockgrader::RecipeTargets {.has_run = true, .has_build = false}");
}

TEST_CASE("Infrastructure errors carry their kind") {
    dockgrader::ProvisionError err{"Unable to create a container", dockgrader::ErrorKind::EngineFailure};

    REQUIRE(fmt::format("{}", static_cast<const dockgrader::GradingInfrastructureError&>(err)) ==
            "Unable to create a container : EngineFailure");
}
