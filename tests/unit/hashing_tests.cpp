#include <doctest/doctest.h>
#include <binwheel/hashing.hpp>

#include "support/fixtures.hpp"

using namespace binwheel;
using binwheel::testing::TempDir;
using binwheel::testing::write_text;

TEST_CASE("compute_sha256 of an in-memory buffer") {
    std::vector<std::uint8_t> abc = {'a', 'b', 'c'};
    auto result = compute_sha256(abc);

    REQUIRE(result.ok);
    CHECK(result.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(result.record_digest == "sha256=ungWv48Bz-pBQUDeXa4iI7ADYaOWF3qctBD_YfIAFa0");
    CHECK(result.size == 3);
}

TEST_CASE("compute_sha256 of an empty file") {
    TempDir tmp;
    write_text(tmp.file("empty"), "");

    auto result = compute_sha256(tmp.file("empty"));
    REQUIRE(result.ok);
    CHECK(result.hex_digest == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(result.record_digest == "sha256=47DEQpj8HBSa-_TImW-5JCeuQeRkm5NMpJWZG3hSuFU");
    CHECK(result.size == 0);
}

TEST_CASE("compute_sha256 streams files larger than one chunk") {
    TempDir tmp;
    std::string big(100000, 'x');
    write_text(tmp.file("big"), big);

    auto from_file = compute_sha256(tmp.file("big"));
    auto from_memory = compute_sha256(std::vector<std::uint8_t>(big.begin(), big.end()));

    REQUIRE(from_file.ok);
    REQUIRE(from_memory.ok);
    CHECK(from_file.hex_digest == from_memory.hex_digest);
    CHECK(from_file.size == 100000);
}

TEST_CASE("compute_sha256 fails on a missing file") {
    auto result = compute_sha256(std::string("/nonexistent/binwheel/file"));
    CHECK_FALSE(result.ok);
    CHECK(result.hex_digest.empty());
    CHECK(result.record_digest.empty());
    CHECK(result.error.find("/nonexistent/binwheel/file") != std::string::npos);
}

TEST_CASE("Sha256 incremental updates match one-shot hashing") {
    Sha256 hasher;
    CHECK(hasher.update("hello ", 6));
    CHECK(hasher.update("world\n", 6));
    auto result = hasher.finish();

    REQUIRE(result.ok);
    CHECK(result.hex_digest == "a948904f2f0f479b8f8197694b30184b0d2ed1c1cd2a1ec0fb85d299a192a447");
    CHECK(result.record_digest == "sha256=qUiQTy8PR5uPgZdpSzAYSw0u0cHNKh7A-4XSmaGSpEc");
    CHECK(result.size == 12);

    SUBCASE("cannot be reused after finish") {
        CHECK_FALSE(hasher.update("x", 1));
        CHECK_FALSE(hasher.finish().ok);
    }
}

TEST_CASE("base64url_nopad uses the URL-safe alphabet without padding") {
    const unsigned char two[] = {0xfb, 0xff};
    const unsigned char three[] = {0xfb, 0xff, 0xfe};

    CHECK(base64url_nopad(two, sizeof(two)) == "-_8");
    CHECK(base64url_nopad(three, sizeof(three)) == "-__-");
    CHECK(base64url_nopad(two, 0).empty());
}

TEST_CASE("to_hex renders lowercase pairs") {
    const unsigned char bytes[] = {0x00, 0x0f, 0xab, 0xff};
    CHECK(to_hex(bytes, sizeof(bytes)) == "000fabff");
}
