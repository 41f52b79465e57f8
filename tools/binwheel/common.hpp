/**
 * binwheel CLI - Common utilities and types
 */

#pragma once

#include <binwheel/build.hpp>
#include <binwheel/platform.hpp>
#include <binwheel/zip.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace binwheel::cli {

/**
 * Output options shared by every code path.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr and pick the level.
 * JSON mode keeps stdout clean and only lets errors through.
 */
inline void setup_logging(const GlobalOptions& opts) {
    // Progress lines carry no prefix; the level shows through color only
    auto logger = spdlog::stderr_color_mt("binwheel");
    logger->set_pattern("%^%v%$");
    spdlog::set_default_logger(logger);

    if (opts.json) {
        spdlog::set_level(spdlog::level::err);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Resolve a setting.
 * Priority: flag > environment variable > built-in default
 */
inline std::string resolve_setting(const std::string& flag_value,
                                   const char* env_name,
                                   const std::string& fallback) {
    if (!flag_value.empty()) {
        return flag_value;
    }
    auto env = get_env(env_name);
    if (env && !env->empty()) {
        return *env;
    }
    return fallback;
}

/**
 * Archive timestamp from SOURCE_DATE_EPOCH, or the zip epoch when the
 * variable is unset or not a non-negative integer.
 */
inline DosTimestamp resolve_timestamp() {
    auto env = get_env("SOURCE_DATE_EPOCH");
    if (!env || env->empty() || env->size() > 18) {
        return DosTimestamp{};
    }

    std::int64_t seconds = 0;
    for (char c : *env) {
        if (c < '0' || c > '9') {
            spdlog::warn("ignoring invalid SOURCE_DATE_EPOCH: {}", *env);
            return DosTimestamp{};
        }
        seconds = seconds * 10 + (c - '0');
    }
    return dos_timestamp_from_unix(seconds);
}

/**
 * Accept "linux-amd64 darwin-arm64" as well as "linux-amd64,darwin-arm64".
 */
inline std::vector<std::string> split_platforms(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    for (const auto& item : raw) {
        std::string current;
        for (char c : item) {
            if (c == ',' || c == ' ') {
                if (!current.empty()) out.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        if (!current.empty()) out.push_back(current);
    }
    return out;
}

/**
 * Raw flag values of the build command, before environment and defaults.
 */
struct BuildCommandOptions {
    std::string version;
    bool dry_run = false;
    std::string binaries_dir;
    std::string output_dir = "dist";
    std::vector<std::string> platforms;
    std::string source_dir;
    std::string release_host;
    bool verify = false;
};

inline BuildOptions make_build_options(const BuildCommandOptions& cmd,
                                       const std::string& default_source_dir) {
    BuildOptions options;
    options.version = cmd.version;
    options.dry_run = cmd.dry_run;
    if (!cmd.binaries_dir.empty()) {
        options.binaries_dir = cmd.binaries_dir;
    }
    options.output_dir = cmd.output_dir;
    options.platforms = split_platforms(cmd.platforms);
    options.source_dir = resolve_setting(cmd.source_dir, "BINWHEEL_SOURCE_DIR", default_source_dir);
    options.release_host = resolve_setting(cmd.release_host, "BINWHEEL_RELEASE_HOST", kDefaultReleaseHost);
    options.timestamp = resolve_timestamp();
    options.verify = cmd.verify;
    return options;
}

// 0 for a completed build or dry run, 1 for any failure
inline int exit_code(const BuildReport& report) {
    return report.ok ? 0 : 1;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline nlohmann::json report_to_json(const BuildReport& report,
                                     const BuildOptions& options) {
    nlohmann::json j;
    j["ok"] = report.ok;
    j["dry_run"] = report.dry_run;
    j["version"] = options.version;
    j["output_dir"] = options.output_dir;

    j["wheels"] = nlohmann::json::array();
    for (const auto& wheel : report.built) {
        j["wheels"].push_back({
            {"target", wheel.target},
            {"platform_tag", wheel.platform_tag},
            {"path", wheel.path},
            {"size", wheel.size},
            {"sha256", wheel.sha256},
        });
    }

    if (!report.ok) {
        j["error"] = report.error;
        j["kind"] = error_kind_to_string(report.kind);
        j["target"] = report.target;
        j["stage"] = report.stage;
    }
    return j;
}

/**
 * "<target>: <stage> failed (<kind>): <message>", target omitted for
 * failures that happen before any target is touched.
 */
inline std::string format_failure(const BuildReport& report) {
    std::string msg;
    if (!report.target.empty()) {
        msg += report.target + ": ";
    }
    msg += report.stage + " failed (" + error_kind_to_string(report.kind) + "): " + report.error;
    return msg;
}

} // namespace binwheel::cli
