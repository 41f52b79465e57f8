#include <doctest/doctest.h>
#include <binwheel/zip.hpp>

#include "support/fixtures.hpp"

using namespace binwheel;
using namespace binwheel::testing;

namespace {

std::string read_entry(const std::string& archive, const ZipEntry& entry) {
    std::string out;
    auto result = read_zip_entry(archive, entry, [&out](const unsigned char* data, std::size_t len) {
        out.append(reinterpret_cast<const char*>(data), len);
        return true;
    });
    REQUIRE(result.ok);
    return out;
}

} // namespace

TEST_CASE("ZipWriter output reads back in insertion order") {
    TempDir tmp;
    std::string archive = tmp.file("out.zip");
    std::string large(200000, 'q');

    ZipWriter zip(archive);
    REQUIRE(zip.ok());
    CHECK(zip.add_bytes("pkg/__init__.py", "__version__ = \"1.0\"\n", 0644));
    CHECK(zip.add_bytes("pkg/tool", large, 0755));
    CHECK(zip.add_bytes("pkg-1.0.dist-info/RECORD", "", 0644));
    CHECK(zip.entry_count() == 3);
    REQUIRE(zip.close());

    auto listing = list_zip_entries(archive);
    REQUIRE(listing.ok);
    REQUIRE(listing.entries.size() == 3);

    CHECK(listing.entries[0].name == "pkg/__init__.py");
    CHECK(listing.entries[1].name == "pkg/tool");
    CHECK(listing.entries[2].name == "pkg-1.0.dist-info/RECORD");

    CHECK(listing.entries[1].method == static_cast<std::uint16_t>(ZipMethod::Deflate));
    CHECK(listing.entries[1].uncompressed_size == large.size());
    CHECK(listing.entries[1].compressed_size < large.size());
    CHECK((listing.entries[1].unix_mode() & 07777) == 0755);
    CHECK((listing.entries[0].unix_mode() & 07777) == 0644);

    CHECK(read_entry(archive, listing.entries[0]) == "__version__ = \"1.0\"\n");
    CHECK(read_entry(archive, listing.entries[1]) == large);
    CHECK(read_entry(archive, listing.entries[2]).empty());
}

TEST_CASE("ZipWriter add_file streams a file from disk") {
    TempDir tmp;
    std::string source = tmp.file("payload.bin");
    std::string content(70000, '\x01');
    write_text(source, content);

    std::string archive = tmp.file("out.zip");
    ZipWriter zip(archive);
    REQUIRE(zip.add_file("payload.bin", source, 0755));
    REQUIRE(zip.close());

    auto listing = list_zip_entries(archive);
    REQUIRE(listing.ok);
    REQUIRE(listing.entries.size() == 1);
    CHECK(read_entry(archive, listing.entries[0]) == content);
}

TEST_CASE("ZipWriter store method keeps data uncompressed") {
    TempDir tmp;
    std::string archive = tmp.file("stored.zip");
    REQUIRE(write_zip(archive, {{"a.txt", "aaaaaaaaaaaaaaaa"}}, ZipMethod::Store));

    auto listing = list_zip_entries(archive);
    REQUIRE(listing.ok);
    REQUIRE(listing.entries.size() == 1);
    CHECK(listing.entries[0].method == static_cast<std::uint16_t>(ZipMethod::Store));
    CHECK(listing.entries[0].compressed_size == 16);
    CHECK(read_entry(archive, listing.entries[0]) == "aaaaaaaaaaaaaaaa");
}

TEST_CASE("ZipWriter rejects non-portable member names") {
    TempDir tmp;
    ZipWriter zip(tmp.file("bad.zip"));

    SUBCASE("backslash separator") {
        CHECK_FALSE(zip.add_bytes("pkg\\tool", "x", 0755));
        CHECK(zip.error().find("'/'") != std::string::npos);
    }
    SUBCASE("absolute path") {
        CHECK_FALSE(zip.add_bytes("/etc/passwd", "x", 0644));
    }
    SUBCASE("empty name") {
        CHECK_FALSE(zip.add_bytes("", "x", 0644));
    }

    CHECK_FALSE(zip.ok());
    CHECK(zip.entry_count() == 0);
    CHECK_FALSE(zip.close());
}

TEST_CASE("ZipWriter output is byte-identical for identical input") {
    TempDir tmp;
    ZipWriteOptions options;
    options.timestamp = dos_timestamp_from_unix(1700000000);

    for (const char* name : {"one.zip", "two.zip"}) {
        ZipWriter zip(tmp.file(name), options);
        REQUIRE(zip.add_bytes("a/b.txt", "hello", 0644));
        REQUIRE(zip.add_bytes("a/c", std::string(5000, 'c'), 0755));
        REQUIRE(zip.close());
    }

    CHECK(read_text(tmp.file("one.zip")) == read_text(tmp.file("two.zip")));
}

TEST_CASE("dos_timestamp_from_unix") {
    SUBCASE("dates before 1980 clamp to the zip epoch") {
        auto stamp = dos_timestamp_from_unix(0);
        CHECK(stamp.date == ((1 << 5) | 1));
        CHECK(stamp.time == 0);
    }
    SUBCASE("a known instant") {
        // 2023-11-14T22:13:20Z
        auto stamp = dos_timestamp_from_unix(1700000000);
        CHECK(stamp.date == 22382);
        CHECK(stamp.time == 45482);
    }
}

TEST_CASE("read_zip_entry detects corrupted content") {
    TempDir tmp;
    std::string archive = tmp.file("stored.zip");
    REQUIRE(write_zip(archive, {{"tool", "0123456789"}}, ZipMethod::Store));

    // Flip one stored data byte: local header (30) + name (4)
    std::string bytes = read_text(archive);
    bytes[30 + 4] = 'X';
    write_text(archive, bytes);

    auto listing = list_zip_entries(archive);
    REQUIRE(listing.ok);
    auto result = read_zip_entry(archive, listing.entries[0],
                                 [](const unsigned char*, std::size_t) { return true; });
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("CRC-32") != std::string::npos);
}

TEST_CASE("extract_zip_entry removes the destination on failure") {
    TempDir tmp;
    std::string archive = tmp.file("stored.zip");
    REQUIRE(write_zip(archive, {{"tool", "0123456789"}}, ZipMethod::Store));

    std::string bytes = read_text(archive);
    bytes[30 + 4] = 'X';
    write_text(archive, bytes);

    auto listing = list_zip_entries(archive);
    REQUIRE(listing.ok);

    std::string dest = tmp.file("tool");
    auto result = extract_zip_entry(archive, listing.entries[0], dest);
    CHECK_FALSE(result.ok);
    CHECK_FALSE(path_exists(dest));
}

TEST_CASE("list_zip_entries rejects files that are not zip archives") {
    TempDir tmp;
    write_text(tmp.file("plain.txt"), "this is not a zip archive");

    auto result = list_zip_entries(tmp.file("plain.txt"));
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}
