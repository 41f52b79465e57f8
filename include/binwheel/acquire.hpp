#pragma once

#include "binwheel/package.hpp"
#include "binwheel/targets.hpp"
#include "binwheel/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// HTTP Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    long http_status = 0;       // 0 for non-HTTP schemes such as file://
    std::uint64_t bytes = 0;
};

// Stream `url` to `dest_path`. Redirects are followed and TLS peers are
// verified. On any failure the partial file is removed.
FetchResult fetch_to_file(const std::string& url, const std::string& dest_path);

// ============================================================================
// Binary Acquisition
// ============================================================================

inline constexpr const char* kDefaultReleaseHost = "https://github.com";

// <host>/<org>/<repo>/releases/download/v<version>/<pkg>_<version>_<os>_<arch>.<ext>
std::string release_url(const std::string& release_host,
                        const PackageInfo& package,
                        const std::string& version,
                        const Target& target);

// Local search order: <dir>/<pkg>_<os>_<arch>/<binary>,
// <dir>/<pkg>_<os>_<arch>_v1/<binary>, <dir>/<binary>
std::vector<std::string> local_binary_candidates(const std::string& binaries_dir,
                                                 const PackageInfo& package,
                                                 const Target& target);

struct AcquireRequest {
    std::string version;
    std::optional<std::string> binaries_dir;    // Set: local mode
    std::string release_host = kDefaultReleaseHost;
    std::string work_dir;                       // Per-target scratch directory
};

struct AcquireResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string binary_path;                // Executable copy under work_dir/bin
    std::string origin;                     // URL or local path it came from
    std::vector<std::string> searched;      // Local candidates tried
};

// Obtain the target's binary, either by downloading and extracting its
// release archive or by copying it out of the local binaries directory.
AcquireResult acquire_binary(const PackageInfo& package,
                             const Target& target,
                             const AcquireRequest& request);

} // namespace binwheel
