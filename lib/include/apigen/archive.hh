//
// Archive codec for apigen
//
// Writers and readers for the two package formats:
//   - zip: local headers, deflate (stored when deflate does not shrink
//     the entry), CRC-32, central directory, end record
//   - tar.gz: POSIX ustar, 512-byte headers, two zero blocks, gzip
//
// Compression and checksums come from zlib. The readers exist so that
// an archive can be verified by re-extracting it.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace apigen::archive {

using bytes = std::vector<std::uint8_t>;

class archive_error : public std::runtime_error {
public:
    explicit archive_error(const std::string& message)
        : std::runtime_error(message) {}
};

/// One regular file; `path` is relative with '/' separators
struct entry {
    std::string path;
    std::string content;
};

// ============================================================================
// Writers
// ============================================================================

[[nodiscard]] bytes write_zip(const std::vector<entry>& entries,
                              std::chrono::system_clock::time_point modified);

/// Paths longer than 100 characters are split into the ustar prefix and
/// name fields; a path that cannot be split throws archive_error.
[[nodiscard]] bytes write_tar_gz(const std::vector<entry>& entries,
                                 std::chrono::system_clock::time_point modified);

// ============================================================================
// Readers
// ============================================================================

/// Entries in central-directory order; throws archive_error on damage
[[nodiscard]] std::vector<entry> read_zip(const bytes& data);

/// Regular-file entries in archive order; throws archive_error on damage
[[nodiscard]] std::vector<entry> read_tar_gz(const bytes& data);

// ============================================================================
// zlib helpers
// ============================================================================

[[nodiscard]] std::uint32_t crc32_of(const std::string& data);

/// Raw deflate stream (no zlib or gzip wrapper)
[[nodiscard]] bytes deflate_raw(const std::string& data);
[[nodiscard]] std::string inflate_raw(const std::uint8_t* data, std::size_t size, std::size_t expected_size);

[[nodiscard]] bytes gzip_compress(const bytes& data);
[[nodiscard]] bytes gzip_decompress(const bytes& data);

} // namespace apigen::archive
