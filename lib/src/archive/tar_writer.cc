//
// POSIX ustar writer, gzip-wrapped
//

#include <apigen/archive.hh>

#include <algorithm>
#include <array>
#include <cstring>

namespace apigen::archive {

namespace {
    constexpr std::size_t BLOCK = 512;
    constexpr std::size_t NAME_SIZE = 100;
    constexpr std::size_t PREFIX_SIZE = 155;

    // Field offsets within a ustar header
    constexpr std::size_t NAME_OFFSET = 0;
    constexpr std::size_t MODE_OFFSET = 100;
    constexpr std::size_t UID_OFFSET = 108;
    constexpr std::size_t GID_OFFSET = 116;
    constexpr std::size_t SIZE_OFFSET = 124;
    constexpr std::size_t MTIME_OFFSET = 136;
    constexpr std::size_t CHECKSUM_OFFSET = 148;
    constexpr std::size_t TYPEFLAG_OFFSET = 156;
    constexpr std::size_t MAGIC_OFFSET = 257;
    constexpr std::size_t VERSION_OFFSET = 263;
    constexpr std::size_t UNAME_OFFSET = 265;
    constexpr std::size_t GNAME_OFFSET = 297;
    constexpr std::size_t PREFIX_OFFSET = 345;

    using header = std::array<std::uint8_t, BLOCK>;

    void put_text(header& h, std::size_t offset, const std::string& text) {
        std::memcpy(h.data() + offset, text.data(), text.size());
    }

    /// Zero-padded octal number filling width-1 digits plus a NUL
    void put_octal(header& h, std::size_t offset, std::size_t width, std::uint64_t value) {
        std::string digits(width - 1, '0');
        for (std::size_t i = width - 1; i-- > 0 && value > 0; value >>= 3) {
            digits[i] = static_cast<char>('0' + (value & 7));
        }
        if (value > 0) {
            throw archive_error("Value does not fit a ustar numeric field");
        }
        put_text(h, offset, digits);
        h[offset + width - 1] = 0;
    }

    /// Split a path into ustar (prefix, name) at a '/' boundary
    std::pair<std::string, std::string> split_path(const std::string& path) {
        if (path.size() <= NAME_SIZE) {
            return {"", path};
        }
        std::size_t slash = path.rfind('/', PREFIX_SIZE);
        while (slash != std::string::npos) {
            if (path.size() - slash - 1 <= NAME_SIZE && slash > 0) {
                return {path.substr(0, slash), path.substr(slash + 1)};
            }
            if (slash == 0) {
                break;
            }
            slash = path.rfind('/', slash - 1);
        }
        throw archive_error("Path too long for a ustar archive: '" + path + "'");
    }

    header make_header(const entry& e, std::int64_t mtime) {
        header h{};
        const auto [prefix, name] = split_path(e.path);
        put_text(h, NAME_OFFSET, name);
        put_octal(h, MODE_OFFSET, 8, 0644);
        put_octal(h, UID_OFFSET, 8, 0);
        put_octal(h, GID_OFFSET, 8, 0);
        put_octal(h, SIZE_OFFSET, 12, e.content.size());
        put_octal(h, MTIME_OFFSET, 12, static_cast<std::uint64_t>(std::max<std::int64_t>(0, mtime)));
        h[TYPEFLAG_OFFSET] = '0';
        put_text(h, MAGIC_OFFSET, std::string("ustar", 6));
        put_text(h, VERSION_OFFSET, "00");
        put_text(h, UNAME_OFFSET, "apigen");
        put_text(h, GNAME_OFFSET, "apigen");
        put_text(h, PREFIX_OFFSET, prefix);

        // Checksum is computed with its own field read as spaces
        std::fill(h.begin() + CHECKSUM_OFFSET, h.begin() + CHECKSUM_OFFSET + 8, ' ');
        unsigned int sum = 0;
        for (std::uint8_t b : h) {
            sum += b;
        }
        put_octal(h, CHECKSUM_OFFSET, 7, sum);
        h[CHECKSUM_OFFSET + 7] = ' ';
        return h;
    }
}

bytes write_tar_gz(const std::vector<entry>& entries, std::chrono::system_clock::time_point modified) {
    const std::int64_t mtime =
        std::chrono::duration_cast<std::chrono::seconds>(modified.time_since_epoch()).count();

    bytes tar;
    for (const auto& e : entries) {
        if (e.path.empty()) {
            throw archive_error("Empty tar entry path");
        }
        const header h = make_header(e, mtime);
        tar.insert(tar.end(), h.begin(), h.end());
        tar.insert(tar.end(), e.content.begin(), e.content.end());
        const std::size_t padding = (BLOCK - e.content.size() % BLOCK) % BLOCK;
        tar.insert(tar.end(), padding, 0);
    }
    // End of archive: two zero blocks
    tar.insert(tar.end(), 2 * BLOCK, 0);
    return gzip_compress(tar);
}

} // namespace apigen::archive
