//
// zlib stream helpers: raw deflate, gzip and CRC-32
//

#include <apigen/archive.hh>

#include <zlib.h>

#include <limits>

namespace apigen::archive {

namespace {
    constexpr int RAW_WINDOW_BITS = -MAX_WBITS;
    constexpr int GZIP_WINDOW_BITS = MAX_WBITS + 16;
    constexpr std::size_t CHUNK = 64 * 1024;

    std::string zlib_message(const char* operation, int code, const z_stream& stream) {
        std::string message = std::string(operation) + " failed (zlib code " + std::to_string(code) + ")";
        if (stream.msg) {
            message += ": ";
            message += stream.msg;
        }
        return message;
    }

    void check_size(std::size_t size) {
        if (size > std::numeric_limits<uInt>::max()) {
            throw archive_error("Entry too large for a single zlib stream");
        }
    }

    /// Deflate the whole input with the given window bits
    bytes compress(const std::uint8_t* data, std::size_t size, int window_bits) {
        check_size(size);
        z_stream stream{};
        int rc = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY);
        if (rc != Z_OK) {
            throw archive_error(zlib_message("deflateInit2", rc, stream));
        }

        bytes out(deflateBound(&stream, static_cast<uLong>(size)) + 32);
        stream.next_in = const_cast<Bytef*>(data);
        stream.avail_in = static_cast<uInt>(size);
        stream.next_out = out.data();
        stream.avail_out = static_cast<uInt>(out.size());

        rc = deflate(&stream, Z_FINISH);
        if (rc != Z_STREAM_END) {
            const std::string message = zlib_message("deflate", rc, stream);
            deflateEnd(&stream);
            throw archive_error(message);
        }
        out.resize(stream.total_out);
        deflateEnd(&stream);
        return out;
    }

    /// Inflate until the end of the stream with the given window bits
    bytes decompress(const std::uint8_t* data, std::size_t size, int window_bits, std::size_t hint) {
        check_size(size);
        z_stream stream{};
        int rc = inflateInit2(&stream, window_bits);
        if (rc != Z_OK) {
            throw archive_error(zlib_message("inflateInit2", rc, stream));
        }
        stream.next_in = const_cast<Bytef*>(data);
        stream.avail_in = static_cast<uInt>(size);

        bytes out;
        out.reserve(hint);
        std::uint8_t buffer[CHUNK];
        do {
            stream.next_out = buffer;
            stream.avail_out = static_cast<uInt>(CHUNK);
            rc = inflate(&stream, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END) {
                const std::string message = zlib_message("inflate", rc, stream);
                inflateEnd(&stream);
                throw archive_error(message);
            }
            out.insert(out.end(), buffer, buffer + (CHUNK - stream.avail_out));
            if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
                inflateEnd(&stream);
                throw archive_error("inflate failed: truncated stream");
            }
        } while (rc != Z_STREAM_END);
        inflateEnd(&stream);
        return out;
    }

    const std::uint8_t* as_bytes(const std::string& s) {
        return reinterpret_cast<const std::uint8_t*>(s.data());
    }
}

std::uint32_t crc32_of(const std::string& data) {
    check_size(data.size());
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, as_bytes(data), static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

bytes deflate_raw(const std::string& data) {
    return compress(as_bytes(data), data.size(), RAW_WINDOW_BITS);
}

std::string inflate_raw(const std::uint8_t* data, std::size_t size, std::size_t expected_size) {
    const bytes out = decompress(data, size, RAW_WINDOW_BITS, expected_size);
    return std::string(out.begin(), out.end());
}

bytes gzip_compress(const bytes& data) {
    return compress(data.data(), data.size(), GZIP_WINDOW_BITS);
}

bytes gzip_decompress(const bytes& data) {
    return decompress(data.data(), data.size(), GZIP_WINDOW_BITS, data.size() * 4);
}

} // namespace apigen::archive
