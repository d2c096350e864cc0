//
// Zip and tar.gz readers used to verify written archives
//

#include <apigen/archive.hh>
#include "byte_order.hh"

#include <algorithm>

namespace apigen::archive {

namespace {
    constexpr std::uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
    constexpr std::uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
    constexpr std::uint32_t END_OF_CENTRAL_DIRECTORY = 0x06054b50;
    constexpr std::size_t END_RECORD_SIZE = 22;
    constexpr std::size_t MAX_COMMENT = 0xFFFF;

    constexpr std::size_t BLOCK = 512;

    std::size_t find_end_record(const bytes& data) {
        if (data.size() < END_RECORD_SIZE) {
            throw archive_error("Not a zip archive: too short");
        }
        const std::size_t last = data.size() - END_RECORD_SIZE;
        const std::size_t first = last > MAX_COMMENT ? last - MAX_COMMENT : 0;
        for (std::size_t pos = last + 1; pos-- > first;) {
            if (detail::get_u32(data, pos) == END_OF_CENTRAL_DIRECTORY) {
                return pos;
            }
        }
        throw archive_error("Not a zip archive: end of central directory not found");
    }

    std::string field_text(const bytes& block, std::size_t offset, std::size_t width) {
        const auto begin = block.begin() + static_cast<std::ptrdiff_t>(offset);
        const auto end = std::find(begin, begin + static_cast<std::ptrdiff_t>(width), 0);
        return std::string(begin, end);
    }

    std::uint64_t field_octal(const bytes& block, std::size_t offset, std::size_t width) {
        std::uint64_t value = 0;
        for (char c : field_text(block, offset, width)) {
            if (c == ' ') {
                continue;
            }
            if (c < '0' || c > '7') {
                throw archive_error("Malformed numeric field in tar header");
            }
            value = (value << 3) | static_cast<std::uint64_t>(c - '0');
        }
        return value;
    }

    bool is_zero_block(const bytes& data, std::size_t offset) {
        return std::all_of(data.begin() + static_cast<std::ptrdiff_t>(offset),
                           data.begin() + static_cast<std::ptrdiff_t>(offset + BLOCK),
                           [](std::uint8_t b) { return b == 0; });
    }
}

// ============================================================================
// Zip
// ============================================================================

std::vector<entry> read_zip(const bytes& data) {
    using namespace detail;

    const std::size_t end_record = find_end_record(data);
    const std::uint16_t count = get_u16(data, end_record + 10);
    std::size_t pos = get_u32(data, end_record + 16);

    std::vector<entry> entries;
    entries.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        if (get_u32(data, pos) != CENTRAL_HEADER_SIGNATURE) {
            throw archive_error("Corrupt zip central directory");
        }
        const std::uint16_t method = get_u16(data, pos + 10);
        const std::uint32_t crc = get_u32(data, pos + 16);
        const std::uint32_t compressed_size = get_u32(data, pos + 20);
        const std::uint32_t size = get_u32(data, pos + 24);
        const std::uint16_t name_length = get_u16(data, pos + 28);
        const std::uint16_t extra_length = get_u16(data, pos + 30);
        const std::uint16_t comment_length = get_u16(data, pos + 32);
        const std::uint32_t local_offset = get_u32(data, pos + 42);

        if (pos + 46 + name_length > data.size()) {
            throw archive_error("Corrupt zip central directory");
        }
        entry e;
        e.path.assign(data.begin() + static_cast<std::ptrdiff_t>(pos + 46),
                      data.begin() + static_cast<std::ptrdiff_t>(pos + 46 + name_length));

        if (get_u32(data, local_offset) != LOCAL_HEADER_SIGNATURE) {
            throw archive_error("Corrupt zip local header for '" + e.path + "'");
        }
        const std::size_t payload = local_offset + 30 + get_u16(data, local_offset + 26) +
                                    get_u16(data, local_offset + 28);
        if (payload + compressed_size > data.size()) {
            throw archive_error("Truncated zip entry '" + e.path + "'");
        }

        if (method == 0) {
            e.content.assign(data.begin() + static_cast<std::ptrdiff_t>(payload),
                             data.begin() + static_cast<std::ptrdiff_t>(payload + compressed_size));
        } else if (method == 8) {
            e.content = inflate_raw(data.data() + payload, compressed_size, size);
        } else {
            throw archive_error("Unsupported zip compression method " + std::to_string(method));
        }

        if (e.content.size() != size || crc32_of(e.content) != crc) {
            throw archive_error("Checksum mismatch for '" + e.path + "'");
        }
        entries.push_back(std::move(e));
        pos += 46 + name_length + extra_length + comment_length;
    }
    return entries;
}

// ============================================================================
// Tar
// ============================================================================

std::vector<entry> read_tar_gz(const bytes& data) {
    const bytes tar = gzip_decompress(data);

    std::vector<entry> entries;
    std::size_t pos = 0;
    while (pos + BLOCK <= tar.size()) {
        if (is_zero_block(tar, pos)) {
            break;
        }
        const bytes block(tar.begin() + static_cast<std::ptrdiff_t>(pos),
                          tar.begin() + static_cast<std::ptrdiff_t>(pos + BLOCK));

        unsigned int sum = 0;
        for (std::size_t i = 0; i < BLOCK; ++i) {
            sum += (i >= 148 && i < 156) ? ' ' : block[i];
        }
        if (sum != field_octal(block, 148, 8)) {
            throw archive_error("Tar header checksum mismatch");
        }

        const std::string name = field_text(block, 0, 100);
        const std::string prefix = field_text(block, 345, 155);
        const std::uint64_t size = field_octal(block, 124, 12);
        const char type = static_cast<char>(block[156]);

        pos += BLOCK;
        if (pos + size > tar.size()) {
            throw archive_error("Truncated tar entry '" + name + "'");
        }
        if (type == '0' || type == '\0') {
            entry e;
            e.path = prefix.empty() ? name : prefix + "/" + name;
            e.content.assign(tar.begin() + static_cast<std::ptrdiff_t>(pos),
                             tar.begin() + static_cast<std::ptrdiff_t>(pos + size));
            entries.push_back(std::move(e));
        }
        pos += (size + BLOCK - 1) / BLOCK * BLOCK;
    }
    return entries;
}

} // namespace apigen::archive
