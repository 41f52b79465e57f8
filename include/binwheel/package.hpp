#pragma once

#include "binwheel/types.hpp"

#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// Package Identity
// ============================================================================

// Python tag and ABI tag shared by every wheel: the payload is a native
// executable plus a pure-Python launcher, so any Python 3 ABI will do.
inline constexpr const char* kPythonAbiTag = "py3-none";
inline constexpr const char* kWheelExtension = ".whl";
inline constexpr const char* kMetadataVersion = "2.1";
inline constexpr const char* kWheelFormatVersion = "1.0";

// Everything about the wrapped package that ends up in names and metadata
struct PackageInfo {
    std::string name;                   // Distribution and import name
    std::string repository;             // "org/repo" hosting the releases
    std::string summary;
    std::string author;
    std::string author_email;
    std::string license;
    std::string requires_python;
    std::vector<std::string> classifiers;

    std::string console_command;        // Command installed on PATH
    std::string entry_module;           // Module inside the package, e.g. "_main"
    std::string entry_function;         // Callable in entry_module, e.g. "main"

    std::string version_file;           // File holding the version assignment
    std::string version_variable;       // Name assigned in version_file
    std::vector<std::string> source_extensions;  // Files copied from the source dir

    std::string generator;              // WHEEL "Generator:" value

    std::string home_page() const { return "https://github.com/" + repository; }
};

// The package this tool ships
const PackageInfo& default_package();

// <name>-<version>-py3-none-<platform_tag>.whl
std::string wheel_filename(const PackageInfo& package,
                           const std::string& version,
                           const std::string& platform_tag);

// <name>-<version>.dist-info
std::string dist_info_dirname(const PackageInfo& package, const std::string& version);

// <name>-<version>.dist-info/RECORD
std::string record_member_path(const PackageInfo& package, const std::string& version);

// ============================================================================
// Version Validation
// ============================================================================

struct VersionCheck {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string warning;    // Set when the version is usable but not SemVer
};

// Reject versions that cannot appear in file names and URLs; warn (but
// accept) versions that are not SemVer 2.0.0.
VersionCheck check_version(const std::string& version);

} // namespace binwheel
