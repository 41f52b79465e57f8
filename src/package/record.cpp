#include "binwheel/record.hpp"
#include "binwheel/hashing.hpp"
#include "binwheel/platform.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace binwheel {

namespace {

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// Split one CSV line into fields; false on an unterminated quote
bool split_csv_line(const std::string& line, std::vector<std::string>& fields) {
    fields.clear();
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }

    if (quoted) return false;
    fields.push_back(current);
    return true;
}

bool parse_size(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.size() > 20) return false;
    out = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        out = out * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return true;
}

} // namespace

RecordBuildResult build_record(const std::string& staged_root, const std::string& record_path) {
    RecordBuildResult result;
    result.kind = ErrorKind::Assembly;

    std::vector<std::string> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(staged_root, ec);
    if (ec) {
        result.error = "failed to walk " + staged_root + ": " + ec.message();
        return result;
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        std::string rel = relative_portable_path(entry.path().string(), staged_root);

        if (entry.is_symlink(ec)) {
            result.error = "symlinks are not permitted in a wheel: " + rel;
            return result;
        }
        if (entry.is_directory(ec)) continue;
        if (!entry.is_regular_file(ec)) {
            result.error = "unsupported file type: " + rel;
            return result;
        }
        if (rel != record_path) {
            files.push_back(rel);
        }
    }
    if (ec) {
        result.error = "failed to walk " + staged_root + ": " + ec.message();
        return result;
    }

    std::sort(files.begin(), files.end(), portable_path_less);

    for (const auto& rel : files) {
        auto hash = compute_sha256(join_path(staged_root, rel));
        if (!hash.ok) {
            result.error = hash.error;
            return result;
        }

        RecordEntry entry;
        entry.path = rel;
        entry.digest = hash.record_digest;
        entry.size = hash.size;
        result.entries.push_back(std::move(entry));
    }

    RecordEntry self;
    self.path = record_path;
    result.entries.push_back(std::move(self));

    spdlog::debug("RECORD lists {} files plus itself", files.size());

    result.kind = ErrorKind::None;
    result.ok = true;
    return result;
}

std::string render_record(const std::vector<RecordEntry>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        out += csv_field(entry.path);
        out += ',';
        out += entry.digest;
        out += ',';
        if (entry.size) {
            out += std::to_string(*entry.size);
        }
        out += '\n';
    }
    return out;
}

RecordParseResult parse_record(const std::string& text) {
    RecordParseResult result;

    size_t line_no = 0;
    size_t start = 0;
    std::vector<std::string> fields;

    while (start < text.size()) {
        size_t newline = text.find('\n', start);
        size_t end = newline == std::string::npos ? text.size() : newline;
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ++line_no;
        start = newline == std::string::npos ? text.size() : newline + 1;

        if (line.empty()) continue;

        if (!split_csv_line(line, fields) || fields.size() != 3) {
            result.error = "malformed RECORD line " + std::to_string(line_no) + ": " + line;
            return result;
        }

        RecordEntry entry;
        entry.path = fields[0];
        entry.digest = fields[1];
        if (!fields[2].empty()) {
            std::uint64_t size = 0;
            if (!parse_size(fields[2], size)) {
                result.error = "invalid size on RECORD line " + std::to_string(line_no) + ": " + fields[2];
                return result;
            }
            entry.size = size;
        }
        result.entries.push_back(std::move(entry));
    }

    result.ok = true;
    return result;
}

} // namespace binwheel
