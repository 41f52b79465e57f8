#pragma once

#include "binwheel/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// RECORD Manifest
// ============================================================================
//
// One CSV line per file: path,sha256=<b64url>,size. The RECORD file lists
// itself last with empty digest and size since it cannot hash itself.

struct RecordEntry {
    std::string path;                       // Archive-relative, '/' separated
    std::string digest;                     // Empty only for the self entry
    std::optional<std::uint64_t> size;      // Empty only for the self entry

    bool is_self_entry() const { return digest.empty() && !size.has_value(); }
};

struct RecordBuildResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::vector<RecordEntry> entries;
};

// Hash every regular file under `staged_root` except `record_path` (given
// relative to the root), in lexicographic path order, then append the self
// entry for `record_path`.
RecordBuildResult build_record(const std::string& staged_root, const std::string& record_path);

// Serialize entries, each line terminated by '\n'
std::string render_record(const std::vector<RecordEntry>& entries);

struct RecordParseResult {
    bool ok = false;
    std::string error;
    std::vector<RecordEntry> entries;
};

// Parse RECORD text (CSV with optional quoting)
RecordParseResult parse_record(const std::string& text);

} // namespace binwheel
