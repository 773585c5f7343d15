#include <dockgrader/staging/staging_area.hpp>

#include <dockgrader/common/error_types.hpp>
#include <dockgrader/exceptions.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace dockgrader {

namespace fs = std::filesystem;

namespace {

constexpr int MAX_NAME_ATTEMPTS = 16;

std::string make_session_name() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};

    return fmt::format("session-{}-{:016x}", ::getpid(), std::uniform_int_distribution<std::uint64_t>{}(gen));
}

} // namespace

StagingArea::StagingArea(const fs::path& root) {
    std::error_code err;

    fs::create_directories(root, err);
    if (err) {
        throw StagingError(fmt::format("Unable to create staging root {}: {}", root, err.message()),
                           ErrorKind::SyscallFailure);
    }

    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt) {
        fs::path candidate = fs::absolute(root, err) / make_session_name();
        if (err) {
            break;
        }

        // create_directory returns false if the directory already existed
        if (fs::create_directory(candidate, err)) {
            path_ = std::move(candidate);
            break;
        }
        if (err) {
            break;
        }
    }

    if (path_.empty()) {
        throw StagingError(fmt::format("Unable to create a session directory under {}: {}", root,
                                       err ? err.message() : "no unique name found"),
                           ErrorKind::SyscallFailure);
    }

    if (fs::create_directory(get_input_dir(), err); err) {
        fs::remove_all(path_, err);
        throw StagingError(fmt::format("Unable to create input directory in {}", path_), ErrorKind::SyscallFailure);
    }

    LOG_DEBUG("Created staging directory {}", path_);
}

StagingArea::~StagingArea() {
    try {
        destroy();
    } catch (const StagingError& ex) {
        LOG_ERROR("{}", ex.what());
    }
}

void StagingArea::write_input(std::string_view text) {
    std::ofstream file{get_input_file(), std::ios::binary | std::ios::trunc};

    file << text;
    if (text.empty() || text.back() != '\n') {
        file << '\n';
    }
    file.close();

    if (!file) {
        throw StagingError(fmt::format("Unable to write {}", get_input_file()), ErrorKind::SyscallFailure);
    }
}

void StagingArea::destroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;

    std::error_code err;
    auto num_removed = fs::remove_all(path_, err);

    if (err) {
        throw StagingError(fmt::format("Unable to remove staging directory {}: {}", path_, err.message()),
                           ErrorKind::SyscallFailure);
    }

    LOG_DEBUG("Removed staging directory {} ({} entries)", path_, num_removed);
}

} // namespace dockgrader
