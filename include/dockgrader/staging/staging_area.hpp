#pragma once

#include <dockgrader/common/class_traits.hpp>

#include <filesystem>
#include <string_view>

namespace dockgrader {

/// Host-side scratch directory owned by one grading session
///
/// Layout:
///   <root>/<unique session name>/
///       input/          bind-mounted read-only into the environment
///           input.txt   stdin of the test vector currently being run
///
/// Every failure is thrown as a StagingError.
class StagingArea : NonMovable
{
public:
    /// Creates ``root`` if needed, then a fresh, uniquely named session directory below it
    explicit StagingArea(const std::filesystem::path& root);

    /// Calls destroy(), logging instead of throwing on failure
    ~StagingArea();

    /// Overwrites the input file with ``text``, terminated by a newline if it is not already.
    /// Input that already ends in '\n' is written verbatim, so "3\n" is staged as "3\n" and not "3\n\n".
    void write_input(std::string_view text);

    /// Removes the session directory and everything in it. Further calls are no-ops.
    void destroy();

    const std::filesystem::path& get_path() const { return path_; }

    std::filesystem::path get_input_dir() const { return path_ / INPUT_DIR_NAME; }

    std::filesystem::path get_input_file() const { return get_input_dir() / INPUT_FILE_NAME; }

    static constexpr std::string_view INPUT_DIR_NAME = "input";
    static constexpr std::string_view INPUT_FILE_NAME = "input.txt";

private:
    std::filesystem::path path_;
    bool destroyed_ = false;
};

} // namespace dockgrader
