#pragma once

#include "binwheel/package.hpp"

#include <cstddef>
#include <string>

namespace binwheel {

// ============================================================================
// dist-info Metadata Files
// ============================================================================
//
// Contents are fixed given (package, version, platform tag); field order
// matters because RECORD certifies the exact bytes.

// METADATA: core metadata fields and one Classifier line per classifier
std::string render_metadata(const PackageInfo& package, const std::string& version);

// WHEEL: format version, generator, Root-Is-Purelib: false, Tag
std::string render_wheel_file(const PackageInfo& package, const std::string& platform_tag);

// entry_points.txt: [console_scripts] mapping to <package>.<module>:<function>
std::string render_entry_points(const PackageInfo& package);

// top_level.txt: the import package name
std::string render_top_level(const PackageInfo& package);

// ============================================================================
// Version Stamping
// ============================================================================

struct VersionRewrite {
    std::string content;
    std::size_t replaced = 0;   // Number of assignments rewritten
};

// Replace every `<variable> = "<anything>"<rest of line>` with
// `<variable> = "<version>"`. Whitespace around '=' is optional. All other
// bytes, line terminators included, are passed through unchanged.
VersionRewrite rewrite_version_assignment(const std::string& content,
                                          const std::string& variable,
                                          const std::string& version);

} // namespace binwheel
