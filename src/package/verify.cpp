#include "binwheel/verify.hpp"
#include "binwheel/hashing.hpp"
#include "binwheel/record.hpp"
#include "binwheel/zip.hpp"

#include <map>

#include <spdlog/spdlog.h>

namespace binwheel {

namespace {

constexpr const char* kDistInfoSuffix = ".dist-info";

bool is_record_member(const std::string& name) {
    auto slash = name.find('/');
    if (slash == std::string::npos || name.substr(slash + 1) != "RECORD") {
        return false;
    }
    std::string dir = name.substr(0, slash);
    const std::string suffix = kDistInfoSuffix;
    return dir.size() > suffix.size() &&
           dir.compare(dir.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

VerifyResult verify_wheel(const std::string& wheel_path) {
    VerifyResult result;

    auto listing = list_zip_entries(wheel_path);
    if (!listing.ok) {
        result.error = listing.error;
        return result;
    }

    std::map<std::string, const ZipEntry*> members;
    std::vector<const ZipEntry*> records;

    for (const auto& entry : listing.entries) {
        if (entry.name.find('\\') != std::string::npos) {
            result.issues.push_back("member name contains a backslash: " + entry.name);
        }
        if (entry.is_directory()) {
            continue;
        }
        if (!members.emplace(entry.name, &entry).second) {
            result.issues.push_back("duplicate member: " + entry.name);
        }
        if (is_record_member(entry.name)) {
            records.push_back(&entry);
        }
    }

    if (records.size() != 1) {
        result.issues.push_back("expected exactly one *.dist-info/RECORD, found " +
                                std::to_string(records.size()));
        return result;
    }

    const ZipEntry& record_entry = *records.front();
    result.record_path = record_entry.name;

    std::string record_text;
    auto read = read_zip_entry(wheel_path, record_entry, [&](const unsigned char* data, std::size_t len) {
        record_text.append(reinterpret_cast<const char*>(data), len);
        return true;
    });
    if (!read.ok) {
        result.error = read.error;
        return result;
    }

    auto parsed = parse_record(record_text);
    if (!parsed.ok) {
        result.error = parsed.error;
        return result;
    }

    const auto& entries = parsed.entries;
    if (entries.empty() || entries.back().path != record_entry.name || !entries.back().is_self_entry()) {
        result.issues.push_back("last RECORD line must be " + record_entry.name + ",,");
    }

    std::map<std::string, int> listed;
    for (const auto& entry : entries) {
        if (++listed[entry.path] > 1) {
            result.issues.push_back("listed more than once: " + entry.path);
            continue;
        }
        if (entry.path == record_entry.name) {
            continue;
        }

        auto member = members.find(entry.path);
        if (member == members.end()) {
            result.issues.push_back("listed but not in archive: " + entry.path);
            continue;
        }

        Sha256 hasher;
        auto hashed = read_zip_entry(wheel_path, *member->second, [&](const unsigned char* data, std::size_t len) {
            return hasher.update(data, len);
        });
        if (!hashed.ok) {
            result.issues.push_back("unreadable member " + entry.path + ": " + hashed.error);
            continue;
        }

        auto digest = hasher.finish();
        if (!digest.ok) {
            result.error = digest.error;
            return result;
        }
        if (digest.record_digest != entry.digest) {
            result.issues.push_back("digest mismatch for " + entry.path + ": RECORD has " + entry.digest +
                                    ", archive has " + digest.record_digest);
        }
        if (!entry.size || *entry.size != digest.size) {
            result.issues.push_back("size mismatch for " + entry.path + ": archive has " +
                                    std::to_string(digest.size) + " bytes");
        }
        ++result.members_checked;
    }

    for (const auto& member : members) {
        if (listed.find(member.first) == listed.end()) {
            result.issues.push_back("in archive but not listed: " + member.first);
        }
    }

    for (const auto& issue : result.issues) {
        spdlog::debug("verify {}: {}", wheel_path, issue);
    }

    result.ok = result.issues.empty();
    return result;
}

} // namespace binwheel
