#pragma once

#include <dockgrader/common/expected.hpp>
#include <dockgrader/file_map.hpp>
#include <dockgrader/grading_result.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dockgrader {

/// Every regular file below ``root``, keyed by its path relative to ``root`` (always with '/' separators).
/// Hidden files and directories (name starting with '.') are skipped.
Expected<FileMap, std::string> load_submission(const std::filesystem::path& root);

/// Test vectors from a JSON document: an array whose elements are either
///   ["stdin", "expected output"]
/// or
///   {"input": "stdin", "output": "expected output"}
Expected<std::vector<TestVector>, std::string> parse_test_vectors(std::string_view json_text);

/// parse_test_vectors on the contents of ``path``
Expected<std::vector<TestVector>, std::string> load_test_vectors(const std::filesystem::path& path);

} // namespace dockgrader
