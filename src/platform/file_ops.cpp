#include "binwheel/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace binwheel {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// fsync a regular file by path
bool fsync_file(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;

    bool result = fsync_fd(fd);
    close(fd);
    return result;
}
#endif

// Generate a temporary filename next to `base`
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

} // namespace

AtomicWriteResult atomic_install_file(const std::string& src, const std::string& dst) {
    AtomicWriteResult result;

    std::string temp_path = make_temp_filename(dst);

    std::error_code ec;
    fs::copy_file(src, temp_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        result.error = "failed to copy " + src + " to " + temp_path + ": " + ec.message();
        return result;
    }

#ifdef _WIN32
    if (!MoveFileExA(temp_path.c_str(), dst.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file to " + dst;
        return result;
    }
#else
    if (!fsync_file(temp_path)) {
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file: " + temp_path;
        return result;
    }

    if (rename(temp_path.c_str(), dst.c_str()) != 0) {
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    std::string dir_path = get_parent_directory(dst);
    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }
#endif

    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string relative_portable_path(const std::string& path, const std::string& base) {
    return to_portable_path(fs::path(path).lexically_relative(base).generic_string());
}

bool portable_path_less(const std::string& a, const std::string& b) {
    std::size_t pos_a = 0;
    std::size_t pos_b = 0;
    while (pos_a <= a.size() && pos_b <= b.size()) {
        std::size_t end_a = std::min(a.find('/', pos_a), a.size());
        std::size_t end_b = std::min(b.find('/', pos_b), b.size());
        int cmp = a.compare(pos_a, end_a - pos_a, b, pos_b, end_b - pos_b);
        if (cmp != 0) {
            return cmp < 0;
        }
        pos_a = end_a + 1;
        pos_b = end_b + 1;
    }
    // Equal so far: the path with fewer components comes first
    return pos_a > a.size() && pos_b <= b.size();
}

std::string base_name(const std::string& archive_path) {
    auto slash = archive_path.rfind('/');
    if (slash == std::string::npos) {
        return archive_path;
    }
    return archive_path.substr(slash + 1);
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::uint64_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

bool copy_file_preserving(const std::string& src, const std::string& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) return false;

    // copy_file carries the permission bits; the timestamp needs a second step
    auto mtime = fs::last_write_time(src, ec);
    if (ec) return false;
    fs::last_write_time(dst, mtime, ec);
    return !ec;
}

bool make_executable(const std::string& path, bool all) {
    fs::perms bits = fs::perms::owner_exec;
    if (all) {
        bits |= fs::perms::group_exec | fs::perms::others_exec;
    }

    std::error_code ec;
    fs::permissions(path, bits, fs::perm_options::add, ec);
    return !ec;
}

bool is_executable(const std::string& path) {
    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (ec) return false;
    return (perms & fs::perms::owner_exec) != fs::perms::none;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    return !file.fail();
}

// ============================================================================
// ScratchDirectory
// ============================================================================

ScratchDirectory::ScratchDirectory(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        error_ = "no usable temp directory: " + ec.message();
        return;
    }

    fs::path candidate = base / (prefix + generate_uuid());
    if (!fs::create_directory(candidate, ec) || ec) {
        error_ = "failed to create scratch directory " + candidate.string() +
                 (ec ? ": " + ec.message() : std::string());
        return;
    }

    path_ = candidate.string();
}

ScratchDirectory::~ScratchDirectory() {
    if (!path_.empty()) {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
}

std::optional<std::string> ScratchDirectory::make_subdirectory(const std::string& name) const {
    if (path_.empty()) {
        return std::nullopt;
    }

    std::string sub = join_path(path_, name);
    if (!remove_directory(sub) || !create_directories(sub)) {
        return std::nullopt;
    }
    return sub;
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace binwheel
