//
// Zip archive writer
//

#include <apigen/archive.hh>
#include "byte_order.hh"

#include <ctime>
#include <limits>

namespace apigen::archive {

namespace {
    constexpr std::uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
    constexpr std::uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
    constexpr std::uint32_t END_OF_CENTRAL_DIRECTORY = 0x06054b50;

    constexpr std::uint16_t VERSION_NEEDED = 20;    // 2.0: deflate
    constexpr std::uint16_t VERSION_MADE_BY = 0x0314;  // Unix, 2.0
    constexpr std::uint16_t FLAG_UTF8_NAMES = 0x0800;
    constexpr std::uint16_t METHOD_STORED = 0;
    constexpr std::uint16_t METHOD_DEFLATED = 8;
    constexpr std::uint32_t REGULAR_FILE_MODE = 0100644u << 16;

    struct dos_timestamp {
        std::uint16_t time = 0;
        std::uint16_t date = (1 << 5) | 1;  // 1980-01-01
    };

    dos_timestamp to_dos(std::chrono::system_clock::time_point tp) {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        if (!gmtime_r(&t, &tm) || tm.tm_year < 80) {
            return {};
        }
        dos_timestamp ts;
        ts.time = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
        ts.date = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
        return ts;
    }

    /// What one entry contributes to the central directory
    struct central_record {
        std::string path;
        std::uint16_t method;
        std::uint32_t crc;
        std::uint32_t compressed_size;
        std::uint32_t size;
        std::uint32_t local_offset;
    };

    void check_zip32(std::size_t value, const std::string& what) {
        if (value > std::numeric_limits<std::uint32_t>::max()) {
            throw archive_error(what + " exceeds the zip32 limit");
        }
    }
}

bytes write_zip(const std::vector<entry>& entries, std::chrono::system_clock::time_point modified) {
    using namespace detail;

    if (entries.size() > std::numeric_limits<std::uint16_t>::max()) {
        throw archive_error("Too many entries for a zip32 archive");
    }

    const dos_timestamp stamp = to_dos(modified);
    bytes out;
    std::vector<central_record> directory;
    directory.reserve(entries.size());

    for (const auto& e : entries) {
        if (e.path.empty() || e.path.size() > std::numeric_limits<std::uint16_t>::max()) {
            throw archive_error("Invalid zip entry path '" + e.path + "'");
        }
        check_zip32(e.content.size(), "Entry '" + e.path + "'");
        check_zip32(out.size(), "Archive size");

        // Stored when deflate does not shrink the entry
        bytes compressed = deflate_raw(e.content);
        const bool deflated = compressed.size() < e.content.size();
        if (!deflated) {
            compressed.assign(e.content.begin(), e.content.end());
        }

        central_record record{
            e.path,
            deflated ? METHOD_DEFLATED : METHOD_STORED,
            crc32_of(e.content),
            static_cast<std::uint32_t>(compressed.size()),
            static_cast<std::uint32_t>(e.content.size()),
            static_cast<std::uint32_t>(out.size())
        };

        put_u32(out, LOCAL_HEADER_SIGNATURE);
        put_u16(out, VERSION_NEEDED);
        put_u16(out, FLAG_UTF8_NAMES);
        put_u16(out, record.method);
        put_u16(out, stamp.time);
        put_u16(out, stamp.date);
        put_u32(out, record.crc);
        put_u32(out, record.compressed_size);
        put_u32(out, record.size);
        put_u16(out, static_cast<std::uint16_t>(e.path.size()));
        put_u16(out, 0);  // extra field length
        put_string(out, e.path);
        out.insert(out.end(), compressed.begin(), compressed.end());

        directory.push_back(std::move(record));
    }

    check_zip32(out.size(), "Archive size");
    const auto directory_offset = static_cast<std::uint32_t>(out.size());
    for (const auto& record : directory) {
        put_u32(out, CENTRAL_HEADER_SIGNATURE);
        put_u16(out, VERSION_MADE_BY);
        put_u16(out, VERSION_NEEDED);
        put_u16(out, FLAG_UTF8_NAMES);
        put_u16(out, record.method);
        put_u16(out, stamp.time);
        put_u16(out, stamp.date);
        put_u32(out, record.crc);
        put_u32(out, record.compressed_size);
        put_u32(out, record.size);
        put_u16(out, static_cast<std::uint16_t>(record.path.size()));
        put_u16(out, 0);  // extra field length
        put_u16(out, 0);  // comment length
        put_u16(out, 0);  // disk number
        put_u16(out, 0);  // internal attributes
        put_u32(out, REGULAR_FILE_MODE);
        put_u32(out, record.local_offset);
        put_string(out, record.path);
    }
    check_zip32(out.size(), "Archive size");
    const auto directory_size = static_cast<std::uint32_t>(out.size() - directory_offset);

    put_u32(out, END_OF_CENTRAL_DIRECTORY);
    put_u16(out, 0);  // this disk
    put_u16(out, 0);  // disk with the directory
    put_u16(out, static_cast<std::uint16_t>(directory.size()));
    put_u16(out, static_cast<std::uint16_t>(directory.size()));
    put_u32(out, directory_size);
    put_u32(out, directory_offset);
    put_u16(out, 0);  // comment length
    return out;
}

} // namespace apigen::archive
