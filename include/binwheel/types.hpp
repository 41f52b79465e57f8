#pragma once

#include <string>

namespace binwheel {

// ============================================================================
// Error Taxonomy
// ============================================================================

// Every fallible operation reports one of these alongside its message.
// All of them are fatal to a build run.
enum class ErrorKind {
    None,
    Configuration,   // bad flags, empty platform filter, unusable source dir
    Acquisition,     // remote fetch failed or local binary not found
    Extraction,      // member missing from (or corrupt in) a release archive
    Assembly,        // I/O failure while staging, hashing or zipping
    Verification,    // a produced wheel does not match its RECORD
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Acquisition: return "acquisition";
        case ErrorKind::Extraction: return "extraction";
        case ErrorKind::Assembly: return "assembly";
        case ErrorKind::Verification: return "verification";
    }
    return "unknown";
}

} // namespace binwheel
