#include "user/submission_loader.hpp"

#include <dockgrader/common/expected.hpp>
#include <dockgrader/file_map.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace dockgrader {

namespace fs = std::filesystem;

namespace {

// Value and error are both strings, so errors must be tagged with UnexpectedT
Expected<std::string, std::string> read_file(const fs::path& path) {
    std::ifstream file{path, std::ios::binary};

    if (!file) {
        return {UnexpectedT{}, fmt::format("Unable to open {}", path)};
    }

    std::string contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};

    if (file.bad()) {
        return {UnexpectedT{}, fmt::format("Unable to read {}", path)};
    }

    return contents;
}

bool is_hidden(const fs::path& path) {
    return path.filename().string().starts_with('.');
}

Expected<TestVector, std::string> parse_vector(const nlohmann::json& elem, std::size_t idx) {
    auto as_string = [idx](const nlohmann::json& val, std::string_view what) -> Expected<std::string, std::string> {
        if (!val.is_string()) {
            return {UnexpectedT{},
                    fmt::format("Test {}: {} must be a string, got {}", idx + 1, what, val.type_name())};
        }
        return val.get<std::string>();
    };

    if (elem.is_array()) {
        if (elem.size() != 2) {
            return fmt::format("Test {}: expected a [stdin, expected] pair, got {} elements", idx + 1, elem.size());
        }

        std::string input = TRY(as_string(elem[0], "stdin"));
        std::string expected = TRY(as_string(elem[1], "expected output"));

        return TestVector{.input = std::move(input), .expected_output = std::move(expected)};
    }

    if (elem.is_object()) {
        if (!elem.contains("input") || !elem.contains("output")) {
            return fmt::format(R"(Test {}: objects must have both "input" and "output")", idx + 1);
        }

        std::string input = TRY(as_string(elem["input"], "input"));
        std::string expected = TRY(as_string(elem["output"], "output"));

        return TestVector{.input = std::move(input), .expected_output = std::move(expected)};
    }

    return fmt::format("Test {}: expected an array or object, got {}", idx + 1, elem.type_name());
}

} // namespace

Expected<FileMap, std::string> load_submission(const fs::path& root) {
    std::error_code err;
    fs::recursive_directory_iterator iter{root, err};

    if (err) {
        return fmt::format("Unable to list {}: {}", root, err.message());
    }

    FileMap files;

    for (; iter != fs::recursive_directory_iterator{}; iter.increment(err)) {
        if (err) {
            return fmt::format("Unable to list {}: {}", root, err.message());
        }

        const fs::directory_entry& entry = *iter;

        if (is_hidden(entry.path())) {
            if (entry.is_directory()) {
                iter.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file()) {
            continue;
        }

        std::string rel_path = entry.path().lexically_relative(root).generic_string();
        std::string contents = TRY(read_file(entry.path()));

        files.emplace(std::move(rel_path), std::move(contents));
    }

    if (err) {
        return fmt::format("Unable to list {}: {}", root, err.message());
    }

    LOG_DEBUG("Loaded {} submission files from {}", files.size(), root);

    return files;
}

Expected<std::vector<TestVector>, std::string> parse_test_vectors(std::string_view json_text) {
    nlohmann::json document;

    try {
        document = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        return fmt::format("Invalid test vectors JSON: {}", ex.what());
    }

    if (!document.is_array()) {
        return fmt::format("Test vectors must be a JSON array, got {}", document.type_name());
    }

    std::vector<TestVector> vectors;
    vectors.reserve(document.size());

    for (std::size_t idx = 0; idx < document.size(); ++idx) {
        vectors.push_back(TRY(parse_vector(document[idx], idx)));
    }

    return vectors;
}

Expected<std::vector<TestVector>, std::string> load_test_vectors(const fs::path& path) {
    std::string contents = TRY(read_file(path));

    auto vectors = parse_test_vectors(contents);

    if (vectors) {
        LOG_DEBUG("Loaded {} test vectors from {}", vectors->size(), path);
    }

    return vectors;
}

} // namespace dockgrader
