#include "catch2_custom.hpp"

#include <dockgrader/staging/staging_area.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;
using dockgrader::StagingArea;

namespace {

std::string read_all(const fs::path& path) {
    std::ifstream file{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

const fs::path STAGING_ROOT = fs::temp_directory_path() / "dockgrader-tests" / "staging";

} // namespace

TEST_CASE("Each session gets its own directory with an input subdirectory") {
    StagingArea first{STAGING_ROOT};
    StagingArea second{STAGING_ROOT};

    REQUIRE(first.get_path() != second.get_path());
    REQUIRE(first.get_path().is_absolute());
    REQUIRE(fs::is_directory(first.get_input_dir()));
    REQUIRE(first.get_input_file() == first.get_input_dir() / "input.txt");
}

TEST_CASE("Input is newline terminated and overwritten on every write") {
    StagingArea staging{STAGING_ROOT};

    staging.write_input("3");
    REQUIRE(read_all(staging.get_input_file()) == "3\n");

    // Already terminated input is written verbatim
    staging.write_input("5\n");
    REQUIRE(read_all(staging.get_input_file()) == "5\n");

    staging.write_input("");
    REQUIRE(read_all(staging.get_input_file()) == "\n");
}

TEST_CASE("The whole tree is removed on destruction and by destroy()") {
    fs::path path;
    {
        StagingArea staging{STAGING_ROOT};
        staging.write_input("data");
        path = staging.get_path();
        REQUIRE(fs::exists(path));
    }
    REQUIRE(!fs::exists(path));

    StagingArea staging{STAGING_ROOT};
    staging.destroy();
    REQUIRE(!fs::exists(staging.get_path()));

    // Idempotent
    REQUIRE_NOTHROW(staging.destroy());
}
