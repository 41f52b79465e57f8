#include <doctest/doctest.h>
#include <binwheel/assembler.hpp>
#include <binwheel/hashing.hpp>
#include <binwheel/record.hpp>
#include <binwheel/zip.hpp>

#include "support/fixtures.hpp"

#include <algorithm>
#include <map>

using namespace binwheel;
using namespace binwheel::testing;

namespace {

struct AssemblyFixture {
    TempDir tmp;
    PackageInfo package = test_package();
    AssembleRequest request;

    AssemblyFixture() {
        write_package_sources(tmp.file("src"));
        write_text(tmp.file("work/bin/tool"), "native tool bytes");
        fs::create_directories(tmp.file("work"));

        request.version = "1.2.3";
        request.platform_tag = "manylinux_2_17_x86_64";
        request.binary_path = tmp.file("work/bin/tool");
        request.binary_name = "tool";
        request.output_dir = tmp.file("dist");
        request.work_dir = tmp.file("work");
        request.source_dir = tmp.file("src");
    }
};

std::map<std::string, std::string> read_all(const std::string& archive) {
    std::map<std::string, std::string> members;
    auto listing = list_zip_entries(archive);
    REQUIRE(listing.ok);
    for (const auto& entry : listing.entries) {
        std::string data;
        auto read = read_zip_entry(archive, entry, [&data](const unsigned char* p, std::size_t n) {
            data.append(reinterpret_cast<const char*>(p), n);
            return true;
        });
        REQUIRE(read.ok);
        members[entry.name] = data;
    }
    return members;
}

} // namespace

TEST_CASE("assembly stages end with RECORD then the archive") {
    const auto& stages = assembly_stage_names();
    REQUIRE(stages.size() >= 2);
    CHECK(stages[stages.size() - 2] == "write-record");
    CHECK(stages.back() == "write-archive");
    CHECK(stages.front() == "stage");
}

TEST_CASE("assemble_wheel produces a complete wheel") {
    AssemblyFixture fx;

    auto result = assemble_wheel(fx.package, fx.request);
    REQUIRE(result.ok);
    CHECK(result.wheel_name == "pkgname-1.2.3-py3-none-manylinux_2_17_x86_64.whl");
    CHECK(result.wheel_path == join_path(fx.tmp.file("dist"), result.wheel_name));
    CHECK(result.binary_size == 17);
    CHECK(result.wheel_size > 0);
    CHECK(result.record_entries == 8);

    auto members = read_all(result.wheel_path);
    CHECK(members.size() == 8);
    CHECK(members.count("pkgname/__init__.py") == 1);
    CHECK(members.count("pkgname/_main.py") == 1);
    CHECK(members.count("pkgname/README.md") == 0);
    CHECK(members["pkgname/tool"] == "native tool bytes");
    CHECK(members["pkgname-1.2.3.dist-info/top_level.txt"] == "pkgname\n");
    CHECK(members["pkgname-1.2.3.dist-info/entry_points.txt"] ==
          "[console_scripts]\npkgname = pkgname._main:main\n");
    CHECK(members["pkgname-1.2.3.dist-info/WHEEL"].find("Tag: py3-none-manylinux_2_17_x86_64\n") !=
          std::string::npos);
    CHECK(members["pkgname-1.2.3.dist-info/METADATA"].find("Version: 1.2.3\n") != std::string::npos);

    SUBCASE("version is stamped into the package") {
        const auto& init = members["pkgname/__init__.py"];
        CHECK(init.find("__version__ = \"1.2.3\"\n") != std::string::npos);
        CHECK(init.find("0.0.0") == std::string::npos);
        CHECK(init.find("def find_binary():") != std::string::npos);
    }

    SUBCASE("RECORD describes every other member") {
        auto parsed = parse_record(members["pkgname-1.2.3.dist-info/RECORD"]);
        REQUIRE(parsed.ok);
        REQUIRE(parsed.entries.size() == 8);
        CHECK(parsed.entries.back().path == "pkgname-1.2.3.dist-info/RECORD");
        CHECK(parsed.entries.back().is_self_entry());
        CHECK(parsed.entries.front().path == "pkgname/__init__.py");

        for (size_t i = 0; i + 1 < parsed.entries.size(); ++i) {
            const auto& entry = parsed.entries[i];
            CAPTURE(entry.path);
            REQUIRE(members.count(entry.path) == 1);
            const auto& data = members[entry.path];
            auto hash = compute_sha256(std::vector<std::uint8_t>(data.begin(), data.end()));
            CHECK(entry.digest == hash.record_digest);
            CHECK(entry.size == data.size());
        }
    }

    SUBCASE("archive members are sorted, slash separated and executable where needed") {
        auto listing = list_zip_entries(result.wheel_path);
        REQUIRE(listing.ok);

        std::vector<std::string> names;
        for (const auto& entry : listing.entries) {
            CHECK(entry.name.find('\\') == std::string::npos);
            CHECK(entry.method == static_cast<std::uint16_t>(ZipMethod::Deflate));
            names.push_back(entry.name);
            if (entry.name == "pkgname/tool") {
                CHECK((entry.unix_mode() & 0111) == 0111);
            }
        }
        CHECK(std::is_sorted(names.begin(), names.end(), portable_path_less));

        // Package files first, dist-info last
        REQUIRE(names.size() == 8);
        CHECK(names[0] == "pkgname/__init__.py");
        CHECK(names[1] == "pkgname/_main.py");
        CHECK(names[2] == "pkgname/tool");
        CHECK(names[3] == "pkgname-1.2.3.dist-info/METADATA");
        CHECK(names.back() == "pkgname-1.2.3.dist-info/top_level.txt");
    }
}

TEST_CASE("assemble_wheel output is reproducible") {
    AssemblyFixture fx;

    auto first = assemble_wheel(fx.package, fx.request);
    REQUIRE(first.ok);
    std::string first_bytes = read_text(first.wheel_path);

    auto second = assemble_wheel(fx.package, fx.request);
    REQUIRE(second.ok);
    CHECK(read_text(second.wheel_path) == first_bytes);
}

TEST_CASE("assemble_wheel dry run writes nothing") {
    AssemblyFixture fx;
    fx.request.dry_run = true;

    auto result = assemble_wheel(fx.package, fx.request);
    REQUIRE(result.ok);
    CHECK(result.wheel_name == "pkgname-1.2.3-py3-none-manylinux_2_17_x86_64.whl");
    CHECK(result.binary_size == 17);
    CHECK(result.wheel_size == 0);
    CHECK_FALSE(path_exists(fx.tmp.file("dist")));
    CHECK_FALSE(path_exists(fx.tmp.file("work/wheel")));
}

TEST_CASE("assemble_wheel fails when the version file is missing") {
    AssemblyFixture fx;
    fs::remove(fx.tmp.file("src/__init__.py"));

    auto result = assemble_wheel(fx.package, fx.request);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Assembly);
    CHECK(result.stage == "stamp-version");
    CHECK_FALSE(path_exists(fx.tmp.file("dist")));
}

TEST_CASE("assemble_wheel fails when the version file has no assignment") {
    AssemblyFixture fx;
    write_text(fx.tmp.file("src/__init__.py"), "VERSION = '1'\n");

    auto result = assemble_wheel(fx.package, fx.request);
    CHECK_FALSE(result.ok);
    CHECK(result.stage == "stamp-version");
    CHECK(result.error.find("__version__") != std::string::npos);
}

TEST_CASE("assemble_wheel fails when the binary is missing") {
    AssemblyFixture fx;
    fx.request.binary_path = fx.tmp.file("work/bin/absent");

    auto result = assemble_wheel(fx.package, fx.request);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Assembly);
}
