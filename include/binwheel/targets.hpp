#pragma once

#include "binwheel/archive.hpp"

#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// Build Targets
// ============================================================================

// One supported operating system / architecture pair. Pure data: everything
// that differs between platforms lives here, nowhere else.
struct Target {
    std::string os;             // Release naming, e.g. "linux", "darwin", "windows"
    std::string arch;           // Release naming, e.g. "amd64", "arm64"
    ArchiveFormat format;       // Container of the release archive
    std::string binary_name;    // Executable inside the archive
    std::string platform_tag;   // Wheel platform tag

    // "linux-amd64": the form accepted by --platforms
    std::string label() const { return os + "-" + arch; }

    // "linux/amd64": the form used in progress and error messages
    std::string display_name() const { return os + "/" + arch; }
};

// The fixed, ordered target matrix
const std::vector<Target>& supported_targets();

// Keep, in registry order, the targets whose label() equals one of `labels`.
// An empty `labels` keeps everything. The result may be empty; callers treat
// that as a configuration error.
std::vector<Target> filter_targets(const std::vector<Target>& targets,
                                   const std::vector<std::string>& labels);

} // namespace binwheel
