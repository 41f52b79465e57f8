#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Copy src next to dst under a temporary name, fsync it, then rename it over
// dst. Readers of dst's directory never observe a partially written file.
AtomicWriteResult atomic_install_file(const std::string& src, const std::string& dst);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format).
// Archive member names and RECORD paths always use this form.
std::string to_portable_path(const std::string& path);

// Portable path of `path` relative to `base`
std::string relative_portable_path(const std::string& path, const std::string& base);

// Order portable paths component by component, so "pkg/x" sorts before
// "pkg-1.0.dist-info/x" even though '-' precedes '/'.
bool portable_path_less(const std::string& a, const std::string& b);

// Component after the last '/'
std::string base_name(const std::string& archive_path);

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Size of a regular file, nullopt if it cannot be stat'ed
std::optional<std::uint64_t> file_size(const std::string& path);

bool create_directories(const std::string& path);
bool remove_directory(const std::string& path);
bool remove_file(const std::string& path);

// Copy a file, preserving permission bits and modification time
bool copy_file_preserving(const std::string& src, const std::string& dst);

// Add execute bits. `all` adds owner, group and other; otherwise owner only.
bool make_executable(const std::string& path, bool all = true);

// True if the owner execute bit is set
bool is_executable(const std::string& path);

// Read a whole file in binary mode
std::optional<std::string> read_file(const std::string& path);

// Write a whole file in binary mode (truncating)
bool write_file(const std::string& path, const std::string& content);

// ============================================================================
// Scratch Directories
// ============================================================================

// A uniquely named directory under the system temp directory that is removed
// recursively when the object goes out of scope, on every exit path.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& prefix = "binwheel-");
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

    // Create (or recreate empty) a named subdirectory and return its path
    std::optional<std::string> make_subdirectory(const std::string& name) const;

private:
    std::string path_;
    std::string error_;
};

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Generate a UUID string
std::string generate_uuid();

} // namespace binwheel
