#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// Wheel Verification
// ============================================================================

struct VerifyResult {
    bool ok = false;
    std::string error;                  // Set when the wheel could not be read at all
    std::string record_path;            // The *.dist-info/RECORD member found
    std::size_t members_checked = 0;
    std::vector<std::string> issues;    // One line per violated claim
};

// Re-read a wheel and check every RECORD claim against the archive:
//   - exactly one top-level *.dist-info/RECORD member
//   - RECORD's own entry is last, with empty digest and size
//   - each other entry names a member with matching digest and length
//   - each member other than RECORD is listed exactly once
//   - no member name contains a backslash
VerifyResult verify_wheel(const std::string& wheel_path);

} // namespace binwheel
