#pragma once

#include "binwheel/types.hpp"

#include <string>

namespace binwheel {

// ============================================================================
// Release Archive Extraction
// ============================================================================

// Container formats release archives come in. Adding a format means adding
// an enumerator here and a case in extract_member().
enum class ArchiveFormat {
    TarGz,
    Zip
};

// File extension used in release asset names ("tar.gz", "zip")
const char* archive_extension(ArchiveFormat format);

struct ExtractResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string path;       // dest_dir/member_base_name
    std::string member;     // Full in-archive path of the extracted member
};

// Extract the first regular-file member whose base name equals
// `member_base_name` (case-sensitive, native enumeration order) to
// `dest_dir/member_base_name` and mark it executable for everyone.
ExtractResult extract_member(const std::string& archive_path,
                             ArchiveFormat format,
                             const std::string& member_base_name,
                             const std::string& dest_dir);

} // namespace binwheel
