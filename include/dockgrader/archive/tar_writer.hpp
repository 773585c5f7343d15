#pragma once

#include <dockgrader/file_map.hpp>

#include <cstddef>
#include <ctime>
#include <string>
#include <string_view>

namespace dockgrader {

/// Size of a ustar header, and the granularity of everything in the archive
constexpr std::size_t TAR_BLOCK_SIZE = 512;

/// Packs ``files`` into an uncompressed POSIX ustar archive, each placed under ``root_prefix``
/// (e.g. "source" turns "src/main.c" into "source/src/main.c").
/// Entries for all parent directories are emitted before any file.
///
/// Throws ArchiveError for absolute paths, paths containing "..", or paths too long for ustar.
std::string pack_tar(const FileMap& files, std::string_view root_prefix, std::time_t mtime = std::time(nullptr));

} // namespace dockgrader
