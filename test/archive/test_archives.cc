//
// Zip and tar.gz writers checked by re-extracting their output
//

#include <doctest/doctest.h>
#include <apigen/archive.hh>

#include <chrono>

using namespace apigen::archive;

namespace {
    const auto MODIFIED = std::chrono::system_clock::from_time_t(1700000000);

    std::vector<entry> sample_entries() {
        return {
            {"package.json", "{\n  \"name\": \"generated-api\"\n}\n"},
            {"src/app.ts", std::string(4000, 'a') + "\nexport default app;\n"},
            {"src/empty.ts", ""},
            {"docs/API.md", "# API\n"}
        };
    }

    void check_same(const std::vector<entry>& actual, const std::vector<entry>& expected) {
        REQUIRE(actual.size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            CHECK(actual[i].path == expected[i].path);
            CHECK(actual[i].content == expected[i].content);
        }
    }
}

TEST_SUITE("Archives") {

TEST_CASE("CRC-32 of known inputs") {
    CHECK(crc32_of("") == 0u);
    CHECK(crc32_of("123456789") == 0xCBF43926u);
}

TEST_CASE("Zip round trip") {
    const auto entries = sample_entries();
    const bytes data = write_zip(entries, MODIFIED);

    REQUIRE(data.size() > 4);
    CHECK(data[0] == 0x50);
    CHECK(data[1] == 0x4B);
    CHECK(data[2] == 0x03);
    CHECK(data[3] == 0x04);

    check_same(read_zip(data), entries);

    SUBCASE("Compressible entries are deflated") {
        CHECK(data.size() < 4000);
    }

    SUBCASE("Output is deterministic for a fixed timestamp") {
        CHECK(write_zip(entries, MODIFIED) == data);
    }
}

TEST_CASE("Zip with no entries") {
    const bytes data = write_zip({}, MODIFIED);
    CHECK(read_zip(data).empty());
}

TEST_CASE("Zip rejects empty paths") {
    CHECK_THROWS_AS((void)write_zip({{"", "x"}}, MODIFIED), archive_error);
}

TEST_CASE("Damaged zip data is reported") {
    bytes data = write_zip({{"a.txt", "abc"}}, MODIFIED);

    SUBCASE("Payload byte flipped") {
        const std::size_t payload = 30 + (data[26] | (data[27] << 8)) + (data[28] | (data[29] << 8));
        REQUIRE(payload < data.size());
        data[payload] ^= 0xFF;
        CHECK_THROWS_AS((void)read_zip(data), archive_error);
    }

    SUBCASE("Truncated") {
        data.resize(data.size() - 10);
        CHECK_THROWS_AS((void)read_zip(data), archive_error);
    }

    SUBCASE("Not an archive") {
        CHECK_THROWS_AS((void)read_zip(bytes{1, 2, 3}), archive_error);
        CHECK_THROWS_AS((void)read_zip(bytes(64, 0)), archive_error);
    }
}

TEST_CASE("tar.gz round trip") {
    const auto entries = sample_entries();
    const bytes data = write_tar_gz(entries, MODIFIED);

    REQUIRE(data.size() > 2);
    CHECK(data[0] == 0x1f);
    CHECK(data[1] == 0x8b);

    check_same(read_tar_gz(data), entries);
}

TEST_CASE("tar.gz long paths") {
    const std::string dir(90, 'd');
    const std::string long_path = dir + "/" + dir + "/file.ts";
    REQUIRE(long_path.size() > 100);

    const std::vector<entry> entries = {{long_path, "content"}};
    check_same(read_tar_gz(write_tar_gz(entries, MODIFIED)), entries);

    SUBCASE("A long name without a usable separator cannot be stored") {
        CHECK_THROWS_AS((void)write_tar_gz({{std::string(120, 'n'), "x"}}, MODIFIED), archive_error);
    }
}

TEST_CASE("Damaged tar.gz data is reported") {
    CHECK_THROWS_AS((void)read_tar_gz(bytes{1, 2, 3}), archive_error);

    bytes data = write_tar_gz({{"a.txt", "abc"}}, MODIFIED);
    data.resize(data.size() / 2);
    CHECK_THROWS_AS((void)read_tar_gz(data), archive_error);
}

TEST_CASE("gzip and raw deflate streams") {
    const std::string text = "generated api generated api generated api";
    const bytes raw(text.begin(), text.end());

    const bytes packed = gzip_compress(raw);
    CHECK(gzip_decompress(packed) == raw);

    const bytes deflated = deflate_raw(text);
    CHECK(inflate_raw(deflated.data(), deflated.size(), text.size()) == text);
}

} // TEST_SUITE Archives
