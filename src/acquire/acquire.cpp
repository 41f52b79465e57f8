#include "binwheel/acquire.hpp"
#include "binwheel/archive.hpp"
#include "binwheel/platform.hpp"

#include <spdlog/spdlog.h>

namespace binwheel {

std::string release_url(const std::string& release_host,
                        const PackageInfo& package,
                        const std::string& version,
                        const Target& target) {
    std::string host = release_host;
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }

    return host + "/" + package.repository + "/releases/download/v" + version + "/" +
           package.name + "_" + version + "_" + target.os + "_" + target.arch + "." +
           archive_extension(target.format);
}

std::vector<std::string> local_binary_candidates(const std::string& binaries_dir,
                                                 const PackageInfo& package,
                                                 const Target& target) {
    std::string stem = package.name + "_" + target.os + "_" + target.arch;
    return {
        join_path(join_path(binaries_dir, stem), target.binary_name),
        join_path(join_path(binaries_dir, stem + "_v1"), target.binary_name),
        join_path(binaries_dir, target.binary_name),
    };
}

namespace {

AcquireResult acquisition_failure(AcquireResult result, ErrorKind kind, const std::string& message) {
    result.ok = false;
    result.kind = kind;
    result.error = message;
    return result;
}

AcquireResult acquire_remote(const PackageInfo& package,
                             const Target& target,
                             const AcquireRequest& request) {
    AcquireResult result;
    result.origin = release_url(request.release_host, package, request.version, target);

    std::string download_dir = join_path(request.work_dir, "download");
    if (!create_directories(download_dir)) {
        return acquisition_failure(result, ErrorKind::Acquisition,
                                   "failed to create directory: " + download_dir);
    }

    std::string archive_path = join_path(download_dir, base_name(result.origin));

    spdlog::info("  Downloading: {}", result.origin);
    auto fetch = fetch_to_file(result.origin, archive_path);
    if (!fetch.ok) {
        return acquisition_failure(result, ErrorKind::Acquisition, fetch.error);
    }
    spdlog::debug("downloaded {} bytes to {}", fetch.bytes, archive_path);

    auto extracted = extract_member(archive_path, target.format, target.binary_name,
                                    join_path(request.work_dir, "bin"));
    if (!extracted.ok) {
        return acquisition_failure(result, extracted.kind, extracted.error);
    }

    result.binary_path = extracted.path;
    result.ok = true;
    return result;
}

AcquireResult acquire_local(const PackageInfo& package,
                            const Target& target,
                            const AcquireRequest& request) {
    AcquireResult result;
    result.searched = local_binary_candidates(*request.binaries_dir, package, target);

    for (const auto& candidate : result.searched) {
        if (!is_regular_file(candidate)) {
            continue;
        }

        std::string bin_dir = join_path(request.work_dir, "bin");
        if (!create_directories(bin_dir)) {
            return acquisition_failure(result, ErrorKind::Acquisition,
                                       "failed to create directory: " + bin_dir);
        }

        std::string dest = join_path(bin_dir, target.binary_name);
        if (!copy_file_preserving(candidate, dest)) {
            return acquisition_failure(result, ErrorKind::Acquisition,
                                       "failed to copy " + candidate + " to " + dest);
        }
        if (!make_executable(dest, false)) {
            return acquisition_failure(result, ErrorKind::Acquisition,
                                       "failed to set execute permission on " + dest);
        }

        spdlog::info("  Using local binary: {}", candidate);
        result.origin = candidate;
        result.binary_path = dest;
        result.ok = true;
        return result;
    }

    std::string message = "binary not found for " + target.display_name() + ", searched:";
    for (const auto& candidate : result.searched) {
        message += "\n  " + candidate;
    }
    return acquisition_failure(result, ErrorKind::Acquisition, message);
}

} // namespace

AcquireResult acquire_binary(const PackageInfo& package,
                             const Target& target,
                             const AcquireRequest& request) {
    if (request.binaries_dir) {
        return acquire_local(package, target, request);
    }
    return acquire_remote(package, target, request);
}

} // namespace binwheel
