#pragma once

#include "binwheel/package.hpp"
#include "binwheel/types.hpp"
#include "binwheel/zip.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// Wheel Assembly
// ============================================================================

struct AssembleRequest {
    std::string version;
    std::string platform_tag;
    std::string binary_path;    // Acquired (or placeholder) executable
    std::string binary_name;    // Name inside <package>/
    std::string output_dir;     // Final home of the wheel
    std::string work_dir;       // Per-target scratch directory
    std::string source_dir;     // Embedded Python package sources
    DosTimestamp timestamp;     // Applied to every archive entry
    bool dry_run = false;
};

struct AssembleResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string stage;              // Stage that failed, empty on success
    std::string wheel_name;
    std::string wheel_path;         // output_dir/wheel_name
    std::uint64_t binary_size = 0;
    std::uint64_t wheel_size = 0;   // Zero in dry run
    std::size_t record_entries = 0; // RECORD lines, self entry included
};

// Names of the real-build stages, in execution order. RECORD is always
// written after every other file in the tree and immediately before the
// archive is sealed.
const std::vector<std::string>& assembly_stage_names();

// Stage, describe and archive one wheel. In dry run only the wheel name and
// binary size are computed; nothing is written.
AssembleResult assemble_wheel(const PackageInfo& package, const AssembleRequest& request);

} // namespace binwheel
