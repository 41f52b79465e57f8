#include <doctest/doctest.h>
#include <binwheel/tar.hpp>

#include "support/fixtures.hpp"

using namespace binwheel;
using namespace binwheel::testing;

TEST_CASE("list_tar_members reports members in stream order") {
    TempDir tmp;
    std::string archive = tmp.file("release.tar.gz");
    REQUIRE(write_tar_gz(archive, {
        tar_dir("kothaset_1.0.0_linux_amd64/"),
        tar_file("kothaset_1.0.0_linux_amd64/kothaset", "ELF"),
        tar_file("kothaset_1.0.0_linux_amd64/README.md", "readme", 0644),
    }));

    auto result = list_tar_members(archive);
    REQUIRE(result.ok);
    REQUIRE(result.members.size() == 3);

    CHECK(result.members[0].path == "kothaset_1.0.0_linux_amd64");
    CHECK(result.members[0].type == TarMemberType::Directory);
    CHECK(result.members[1].path == "kothaset_1.0.0_linux_amd64/kothaset");
    CHECK(result.members[1].type == TarMemberType::RegularFile);
    CHECK(result.members[1].size == 3);
    CHECK(result.members[1].mode == 0755);
    CHECK(result.members[2].mode == 0644);
}

TEST_CASE("list_tar_members honors GNU long names and PAX paths") {
    TempDir tmp;
    std::string long_name = "release/" + std::string(120, 'd') + "/kothaset";
    std::string archive = tmp.file("long.tar.gz");
    REQUIRE(write_tar_gz(archive, {
        tar_gnu_long_name(long_name),
        tar_file("truncated-name", "one"),
        tar_pax_path("pax/renamed/kothaset"),
        tar_file("header-name", "two"),
        tar_file("plain", "three"),
    }));

    auto result = list_tar_members(archive);
    REQUIRE(result.ok);
    REQUIRE(result.members.size() == 3);
    CHECK(result.members[0].path == long_name);
    CHECK(result.members[1].path == "pax/renamed/kothaset");
    CHECK(result.members[2].path == "plain");
}

TEST_CASE("list_tar_members rejects a header with a bad checksum") {
    TempDir tmp;
    std::string bytes = tar_bytes({tar_file("bin/tool", "data")});
    bytes[0] = 'X';  // Name changes, stored checksum does not
    std::string archive = tmp.file("corrupt.tar.gz");
    REQUIRE(write_gzip(archive, bytes));

    auto result = list_tar_members(archive);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("checksum") != std::string::npos);
}

TEST_CASE("list_tar_members fails on a missing archive") {
    auto result = list_tar_members("/nonexistent/binwheel/release.tar.gz");
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("extract_first_tar_member streams the matching member") {
    TempDir tmp;
    std::string archive = tmp.file("release.tar.gz");
    std::string payload(70000, 'b');
    REQUIRE(write_tar_gz(archive, {
        tar_file("docs/kothaset.txt", "not me"),
        tar_file("bin/kothaset", payload),
    }));

    std::string dest = tmp.file("out");
    auto result = extract_first_tar_member(archive, "kothaset", dest);

    REQUIRE(result.ok);
    CHECK(result.found);
    CHECK(result.member.path == "bin/kothaset");
    CHECK(read_text(dest) == payload);
}

TEST_CASE("extract_first_tar_member reports no match without failing") {
    TempDir tmp;
    std::string archive = tmp.file("release.tar.gz");
    REQUIRE(write_tar_gz(archive, {tar_file("bin/other", "x")}));

    auto result = extract_first_tar_member(archive, "kothaset", tmp.file("out"));
    CHECK(result.ok);
    CHECK_FALSE(result.found);
    CHECK_FALSE(path_exists(tmp.file("out")));
}

TEST_CASE("extract_first_tar_member removes partial output on truncation") {
    TempDir tmp;
    std::string bytes = tar_bytes({tar_file("bin/kothaset", std::string(4096, 'z'))});
    bytes.resize(512 + 1000);  // Header plus part of the data
    std::string archive = tmp.file("truncated.tar.gz");
    REQUIRE(write_gzip(archive, bytes));

    std::string dest = tmp.file("out");
    auto result = extract_first_tar_member(archive, "kothaset", dest);
    CHECK_FALSE(result.ok);
    CHECK_FALSE(path_exists(dest));
}
