#pragma once

#include "binwheel/acquire.hpp"
#include "binwheel/package.hpp"
#include "binwheel/targets.hpp"
#include "binwheel/types.hpp"
#include "binwheel/zip.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// Build Orchestration
// ============================================================================

struct BuildOptions {
    std::string version;
    bool dry_run = false;
    std::optional<std::string> binaries_dir;    // Local mode when set
    std::string output_dir = "dist";
    std::vector<std::string> platforms;         // "<os>-<arch>" labels; empty = all
    std::string source_dir;
    std::string release_host = kDefaultReleaseHost;
    DosTimestamp timestamp;
    bool verify = false;
};

// One produced (or, in dry run, planned) wheel
struct BuiltWheel {
    std::string target;         // "<os>/<arch>"
    std::string platform_tag;
    std::string path;
    std::uint64_t size = 0;     // Wheel size; binary size in dry run
    std::string sha256;         // Hex digest, empty in dry run
};

struct BuildReport {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string target;         // Failing target, empty for run-level failures
    std::string stage;          // "configure", "acquire", "assemble" or "verify"
    bool dry_run = false;
    std::vector<BuiltWheel> built;
};

// Acquire and assemble every selected target in registry order, stopping at
// the first failure. All scratch state is removed before returning.
BuildReport run_build(const BuildOptions& options,
                      const PackageInfo& package,
                      const std::vector<Target>& targets = supported_targets());

} // namespace binwheel
