#include "binwheel/archive.hpp"
#include "binwheel/platform.hpp"
#include "binwheel/tar.hpp"
#include "binwheel/zip.hpp"

#include <spdlog/spdlog.h>

namespace binwheel {

const char* archive_extension(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::TarGz: return "tar.gz";
        case ArchiveFormat::Zip: return "zip";
    }
    return "";
}

namespace {

ExtractResult extraction_failure(const std::string& message) {
    ExtractResult result;
    result.kind = ErrorKind::Extraction;
    result.error = message;
    return result;
}

ExtractResult extract_from_tar(const std::string& archive_path,
                               const std::string& member_base_name,
                               const std::string& dest_path) {
    auto tar = extract_first_tar_member(archive_path, member_base_name, dest_path);
    if (!tar.ok) {
        return extraction_failure(tar.error);
    }
    if (!tar.found) {
        return extraction_failure(member_base_name + " not found in " + archive_path);
    }

    ExtractResult result;
    result.member = tar.member.path;
    result.ok = true;
    return result;
}

ExtractResult extract_from_zip(const std::string& archive_path,
                               const std::string& member_base_name,
                               const std::string& dest_path) {
    auto listing = list_zip_entries(archive_path);
    if (!listing.ok) {
        return extraction_failure(listing.error);
    }

    for (const auto& entry : listing.entries) {
        if (entry.is_directory() || base_name(entry.name) != member_base_name) {
            continue;
        }

        spdlog::debug("extracting {} ({} bytes) from {}", entry.name, entry.uncompressed_size, archive_path);

        auto read = extract_zip_entry(archive_path, entry, dest_path);
        if (!read.ok) {
            return extraction_failure(read.error);
        }

        ExtractResult result;
        result.member = entry.name;
        result.ok = true;
        return result;
    }

    return extraction_failure(member_base_name + " not found in " + archive_path);
}

} // namespace

ExtractResult extract_member(const std::string& archive_path,
                             ArchiveFormat format,
                             const std::string& member_base_name,
                             const std::string& dest_dir) {
    if (!create_directories(dest_dir)) {
        return extraction_failure("failed to create directory: " + dest_dir);
    }

    std::string dest_path = join_path(dest_dir, member_base_name);

    ExtractResult result;
    switch (format) {
        case ArchiveFormat::TarGz:
            result = extract_from_tar(archive_path, member_base_name, dest_path);
            break;
        case ArchiveFormat::Zip:
            result = extract_from_zip(archive_path, member_base_name, dest_path);
            break;
    }
    if (!result.ok) {
        return result;
    }

    if (!make_executable(dest_path)) {
        return extraction_failure("failed to set execute permission on " + dest_path);
    }

    result.path = dest_path;
    spdlog::info("  Extracted: {} -> {}", result.member, dest_path);
    return result;
}

} // namespace binwheel
