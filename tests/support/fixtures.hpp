#pragma once

// Shared helpers for binwheel tests: temporary directories, archive builders
// and a small package definition.

#include <binwheel/package.hpp>
#include <binwheel/platform.hpp>
#include <binwheel/targets.hpp>
#include <binwheel/zip.hpp>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <zlib.h>

namespace binwheel::testing {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("binwheel_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    auto content = read_file(path);
    return content ? *content : std::string();
}

// ============================================================================
// Tar.gz builder
// ============================================================================

struct TarFixtureEntry {
    std::string name;
    std::string data;
    char typeflag = '0';
    std::uint32_t mode = 0644;
};

inline TarFixtureEntry tar_file(const std::string& name, const std::string& data, std::uint32_t mode = 0755) {
    return {name, data, '0', mode};
}

inline TarFixtureEntry tar_dir(const std::string& name) {
    return {name, "", '5', 0755};
}

// GNU long-name record that renames the entry after it
inline TarFixtureEntry tar_gnu_long_name(const std::string& name) {
    return {"././@LongLink", name + std::string(1, '\0'), 'L', 0644};
}

// PAX extended header carrying a "path" record for the entry after it
inline TarFixtureEntry tar_pax_path(const std::string& path) {
    std::string body = " path=" + path + "\n";
    // The length prefix counts itself
    std::size_t len = body.size() + 1;
    while (std::to_string(len).size() + body.size() != len) ++len;
    return {"PaxHeaders/entry", std::to_string(len) + body, 'x', 0644};
}

inline void tar_octal(char* dest, std::size_t size, std::uint64_t value) {
    std::size_t digits = size - 1;
    dest[digits] = '\0';
    for (std::size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

inline std::string tar_header(const TarFixtureEntry& entry) {
    char header[512];
    std::memset(header, 0, sizeof(header));

    std::strncpy(header, entry.name.c_str(), 99);
    tar_octal(header + 100, 8, entry.mode);
    tar_octal(header + 108, 8, 0);
    tar_octal(header + 116, 8, 0);
    tar_octal(header + 124, 12, entry.data.size());
    tar_octal(header + 136, 12, 0);
    header[156] = entry.typeflag;
    std::memcpy(header + 257, "ustar", 6);
    header[263] = '0';
    header[264] = '0';

    std::uint32_t sum = 0;
    for (std::size_t i = 0; i < sizeof(header); ++i) {
        sum += (i >= 148 && i < 156) ? ' ' : static_cast<unsigned char>(header[i]);
    }
    std::snprintf(header + 148, 8, "%06o", sum);
    header[155] = ' ';

    return std::string(header, sizeof(header));
}

inline std::string tar_bytes(const std::vector<TarFixtureEntry>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        out += tar_header(entry);
        out += entry.data;
        out.append((512 - entry.data.size() % 512) % 512, '\0');
    }
    out.append(1024, '\0');
    return out;
}

inline bool write_gzip(const std::string& path, const std::string& data) {
    gzFile gz = gzopen(path.c_str(), "wb");
    if (!gz) return false;
    int written = data.empty() ? 0 : gzwrite(gz, data.data(), static_cast<unsigned>(data.size()));
    bool ok = written == static_cast<int>(data.size());
    return gzclose(gz) == Z_OK && ok;
}

inline bool write_tar_gz(const std::string& path, const std::vector<TarFixtureEntry>& entries) {
    fs::create_directories(fs::path(path).parent_path());
    return write_gzip(path, tar_bytes(entries));
}

// ============================================================================
// Zip builder
// ============================================================================

inline bool write_zip(const std::string& path,
                      const std::vector<std::pair<std::string, std::string>>& entries,
                      ZipMethod method = ZipMethod::Deflate) {
    fs::create_directories(fs::path(path).parent_path());
    ZipWriteOptions options;
    options.method = method;
    ZipWriter zip(path, options);
    for (const auto& [name, data] : entries) {
        if (!zip.add_bytes(name, data, 0755)) return false;
    }
    return zip.close();
}

// ============================================================================
// Package fixtures
// ============================================================================

// A package named "pkgname" with the kothaset metadata otherwise
inline PackageInfo test_package() {
    PackageInfo package = default_package();
    package.name = "pkgname";
    package.console_command = "pkgname";
    package.repository = "example/pkgname";
    return package;
}

// linux/amd64 with binary "tool" and a short platform tag
inline Target test_target() {
    return Target{"linux", "amd64", ArchiveFormat::TarGz, "tool", "manylinux_2_17_x86_64"};
}

// Write a minimal embedded package: __init__.py with a version line and _main.py
inline void write_package_sources(const std::string& dir) {
    write_text(dir + "/__init__.py",
               "\"\"\"Test package.\"\"\"\n"
               "\n"
               "__version__ = \"0.0.0\"  # replaced at build time\n"
               "\n"
               "def find_binary():\n"
               "    return None\n");
    write_text(dir + "/_main.py",
               "def main():\n"
               "    pass\n");
    write_text(dir + "/README.md", "not packaged\n");
}

} // namespace binwheel::testing
