#include "binwheel/build.hpp"
#include "binwheel/assembler.hpp"
#include "binwheel/hashing.hpp"
#include "binwheel/platform.hpp"
#include "binwheel/verify.hpp"

#include <spdlog/spdlog.h>

namespace binwheel {

namespace {

// Size of the zero-filled stand-in binary used in dry run
constexpr std::size_t kPlaceholderBinarySize = 100;

BuildReport build_failure(BuildReport report,
                          ErrorKind kind,
                          const std::string& stage,
                          const std::string& target,
                          const std::string& message) {
    report.ok = false;
    report.kind = kind;
    report.stage = stage;
    report.target = target;
    report.error = message;
    return report;
}

} // namespace

BuildReport run_build(const BuildOptions& options,
                      const PackageInfo& package,
                      const std::vector<Target>& targets) {
    BuildReport report;
    report.dry_run = options.dry_run;

    // ------------------------------------------------------------------------
    // Configuration checks (nothing is touched until these pass)
    // ------------------------------------------------------------------------

    auto version = check_version(options.version);
    if (!version.ok) {
        return build_failure(report, version.kind, "configure", "", version.error);
    }
    if (!version.warning.empty()) {
        spdlog::warn("{}", version.warning);
    }

    std::vector<Target> selected = filter_targets(targets, options.platforms);
    if (selected.empty()) {
        std::string requested;
        for (const auto& label : options.platforms) {
            requested += (requested.empty() ? "" : ", ") + label;
        }
        return build_failure(report, ErrorKind::Configuration, "configure", "",
                             "no supported platform matches: " + requested);
    }

    if (!options.dry_run && !is_directory(options.source_dir)) {
        return build_failure(report, ErrorKind::Configuration, "configure", "",
                             "source directory not found: " + options.source_dir);
    }

    if (options.binaries_dir && !is_directory(*options.binaries_dir)) {
        return build_failure(report, ErrorKind::Configuration, "configure", "",
                             "binaries directory not found: " + *options.binaries_dir);
    }

    ScratchDirectory scratch;
    if (!scratch.ok()) {
        return build_failure(report, ErrorKind::Configuration, "configure", "", scratch.error());
    }
    spdlog::debug("scratch directory: {}", scratch.path());

    spdlog::info("Building {} wheels for version {}", selected.size(), options.version);
    spdlog::info("Output directory: {}", options.output_dir);

    // ------------------------------------------------------------------------
    // Per-target pipeline
    // ------------------------------------------------------------------------

    for (const auto& target : selected) {
        const std::string name = target.display_name();
        spdlog::info("Building for {}...", name);

        auto work_dir = scratch.make_subdirectory(target.os + "_" + target.arch);
        if (!work_dir) {
            return build_failure(report, ErrorKind::Assembly, "acquire", name,
                                 "failed to create work directory under " + scratch.path());
        }

        std::string binary_path;
        if (options.dry_run) {
            binary_path = join_path(*work_dir, target.binary_name);
            if (!write_file(binary_path, std::string(kPlaceholderBinarySize, '\0'))) {
                return build_failure(report, ErrorKind::Assembly, "acquire", name,
                                     "failed to write placeholder binary " + binary_path);
            }
        } else {
            AcquireRequest acquire;
            acquire.version = options.version;
            acquire.binaries_dir = options.binaries_dir;
            acquire.release_host = options.release_host;
            acquire.work_dir = *work_dir;

            auto acquired = acquire_binary(package, target, acquire);
            if (!acquired.ok) {
                return build_failure(report, acquired.kind, "acquire", name, acquired.error);
            }
            binary_path = acquired.binary_path;
        }

        AssembleRequest assemble;
        assemble.version = options.version;
        assemble.platform_tag = target.platform_tag;
        assemble.binary_path = binary_path;
        assemble.binary_name = target.binary_name;
        assemble.output_dir = options.output_dir;
        assemble.work_dir = *work_dir;
        assemble.source_dir = options.source_dir;
        assemble.timestamp = options.timestamp;
        assemble.dry_run = options.dry_run;

        auto assembled = assemble_wheel(package, assemble);
        if (!assembled.ok) {
            return build_failure(report, assembled.kind, "assemble", name,
                                 assembled.stage + ": " + assembled.error);
        }

        BuiltWheel wheel;
        wheel.target = name;
        wheel.platform_tag = target.platform_tag;
        wheel.path = assembled.wheel_path;

        if (options.dry_run) {
            wheel.size = assembled.binary_size;
        } else {
            if (options.verify) {
                auto verified = verify_wheel(assembled.wheel_path);
                if (!verified.ok) {
                    std::string message = verified.error;
                    for (const auto& issue : verified.issues) {
                        message += (message.empty() ? "" : "; ") + issue;
                    }
                    return build_failure(report, ErrorKind::Verification, "verify", name, message);
                }
                spdlog::info("  Verified: {} RECORD entries", assembled.record_entries);
            }

            auto hash = compute_sha256(assembled.wheel_path);
            if (!hash.ok) {
                return build_failure(report, ErrorKind::Assembly, "assemble", name, hash.error);
            }
            wheel.size = assembled.wheel_size;
            wheel.sha256 = hash.hex_digest;
        }

        report.built.push_back(std::move(wheel));
        if (!remove_directory(*work_dir)) {
            spdlog::warn("failed to remove work directory {}", *work_dir);
        }
    }

    report.ok = true;
    return report;
}

} // namespace binwheel
