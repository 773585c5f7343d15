#include <dockgrader/archive/tar_writer.hpp>

#include <dockgrader/exceptions.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/copy.hpp>
#include <range/v3/numeric/accumulate.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <set>
#include <string>
#include <string_view>

#include <tar.h>

namespace dockgrader {

namespace {

// ustar header layout; see tar(5)
struct Field
{
    std::size_t offset;
    std::size_t size;
};

constexpr Field NAME{0, 100};
constexpr Field MODE{100, 8};
constexpr Field UID{108, 8};
constexpr Field GID{116, 8};
constexpr Field SIZE{124, 12};
constexpr Field MTIME{136, 12};
constexpr Field CHKSUM{148, 8};
constexpr Field TYPEFLAG{156, 1};
constexpr Field MAGIC{257, 6};
constexpr Field VERSION{263, 2};
constexpr Field UNAME{265, 32};
constexpr Field GNAME{297, 32};
constexpr Field PREFIX{345, 155};

constexpr std::uint32_t FILE_MODE = 0644;
constexpr std::uint32_t DIR_MODE = 0755;

using Header = std::array<char, TAR_BLOCK_SIZE>;

void write_str(Header& header, Field field, std::string_view str) {
    ASSERT(str.size() <= field.size, str, field.size);
    ranges::copy(str, header.begin() + gsl::narrow_cast<std::ptrdiff_t>(field.offset));
}

/// Zero-padded octal number followed by a NUL, filling the field
void write_octal(Header& header, Field field, std::uint64_t value) {
    const std::size_t num_digits = field.size - 1;
    std::string digits = fmt::format("{:0{}o}", value, num_digits);

    if (digits.size() > num_digits) {
        throw ArchiveError(fmt::format("Value {} does not fit in a {} byte tar header field", value, field.size),
                           ErrorKind::BadArgument);
    }

    write_str(header, field, digits);
}

/// Splits ``path`` over the name and prefix fields of a ustar header
void write_path(Header& header, std::string_view path) {
    if (path.size() <= NAME.size) {
        write_str(header, NAME, path);
        return;
    }

    // Split at a '/' such that both parts fit; the '/' itself is implied
    for (auto pos = path.rfind('/'); pos != std::string_view::npos && pos > 0; pos = path.rfind('/', pos - 1)) {
        std::string_view prefix = path.substr(0, pos);
        std::string_view name = path.substr(pos + 1);

        if (name.size() > NAME.size) {
            break;
        }
        if (prefix.size() <= PREFIX.size && !name.empty()) {
            write_str(header, PREFIX, prefix);
            write_str(header, NAME, name);
            return;
        }
    }

    throw ArchiveError(fmt::format("Path {:?} is too long to be archived", path), ErrorKind::BadArgument);
}

Header make_header(std::string_view path, char typeflag, std::uint32_t mode, std::uint64_t size, std::time_t mtime) {
    Header header{};

    write_path(header, path);
    write_octal(header, MODE, mode);
    write_octal(header, UID, 0);
    write_octal(header, GID, 0);
    write_octal(header, SIZE, size);
    write_octal(header, MTIME, gsl::narrow_cast<std::uint64_t>(mtime));
    header[TYPEFLAG.offset] = typeflag;
    // TMAGIC is "ustar" followed by its NUL, which completes the 6 byte field
    write_str(header, MAGIC, std::string_view{TMAGIC, TMAGLEN});
    write_str(header, VERSION, std::string_view{TVERSION, TVERSLEN});
    write_str(header, UNAME, "root");
    write_str(header, GNAME, "root");

    // The checksum is computed as if its own field were filled with spaces
    write_str(header, CHKSUM, std::string(CHKSUM.size, ' '));
    auto as_unsigned = [](char chr) { return static_cast<std::uint32_t>(static_cast<unsigned char>(chr)); };
    auto checksum = ranges::accumulate(header, std::uint32_t{0}, std::plus<>{}, as_unsigned);

    // 6 octal digits, NUL, space
    write_str(header, CHKSUM, fmt::format("{:06o}", checksum));
    header[CHKSUM.offset + 6] = '\0';
    header[CHKSUM.offset + 7] = ' ';

    return header;
}

void validate_path(std::string_view path) {
    if (path.empty() || path.front() == '/') {
        throw ArchiveError(fmt::format("Refusing to archive path {:?}: must be relative", path),
                           ErrorKind::BadArgument);
    }

    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }

        if (path.substr(start, end - start) == "..") {
            throw ArchiveError(fmt::format("Refusing to archive path {:?}: escapes the archive root", path),
                               ErrorKind::BadArgument);
        }

        start = end + 1;
    }
}

void append_padded(std::string& archive, std::string_view data) {
    archive += data;

    if (auto remainder = data.size() % TAR_BLOCK_SIZE; remainder != 0) {
        archive.append(TAR_BLOCK_SIZE - remainder, '\0');
    }
}

} // namespace

std::string pack_tar(const FileMap& files, std::string_view root_prefix, std::time_t mtime) {
    std::string prefix{root_prefix};
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }

    auto full_path = [&prefix](const std::string& path) { return prefix.empty() ? path : prefix + '/' + path; };

    // std::set orders every parent before its children
    std::set<std::string> directories;
    if (!prefix.empty()) {
        directories.insert(prefix);
    }

    for (const auto& [path, contents] : files) {
        validate_path(path);

        std::string path_with_prefix = full_path(path);
        for (auto pos = path_with_prefix.find('/'); pos != std::string::npos;
             pos = path_with_prefix.find('/', pos + 1)) {
            directories.insert(path_with_prefix.substr(0, pos));
        }
    }

    std::string archive;

    for (const std::string& dir : directories) {
        const Header header = make_header(dir + '/', DIRTYPE, DIR_MODE, 0, mtime);
        archive.append(header.begin(), header.end());
    }

    for (const auto& [path, contents] : files) {
        const Header header = make_header(full_path(path), REGTYPE, FILE_MODE, contents.size(), mtime);

        archive.append(header.begin(), header.end());
        append_padded(archive, contents);
    }

    // End of archive: two zero blocks
    archive.append(2 * TAR_BLOCK_SIZE, '\0');

    LOG_DEBUG("Packed {} files ({} directories) into a {} byte archive", files.size(), directories.size(),
              archive.size());

    return archive;
}

} // namespace dockgrader
