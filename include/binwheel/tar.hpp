#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// Gzip-compressed Tar Reading
// ============================================================================
//
// Reads ustar, GNU and PAX flavoured archives as produced by common release
// tooling. GNU long names ('L') and PAX "path" records ('x') replace the
// header name of the member that follows them. Members are reported in
// stream order.

enum class TarMemberType {
    RegularFile,
    Directory,
    Symlink,
    Hardlink,
    Other
};

struct TarMember {
    std::string path;
    TarMemberType type = TarMemberType::Other;
    std::uint64_t size = 0;
    std::uint32_t mode = 0;
};

struct TarListResult {
    bool ok = false;
    std::string error;
    std::vector<TarMember> members;
};

// List every member in stream order
TarListResult list_tar_members(const std::string& archive_path);

struct TarExtractResult {
    bool ok = false;
    bool found = false;     // false with ok == true: no member matched
    std::string error;
    TarMember member;       // The member that was extracted
};

// Stream the first regular-file member whose base name equals `base_name`
// into `dest_path`. Scanning stops at the first match.
TarExtractResult extract_first_tar_member(const std::string& archive_path,
                                          const std::string& base_name,
                                          const std::string& dest_path);

} // namespace binwheel
