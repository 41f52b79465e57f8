#include "binwheel/assembler.hpp"
#include "binwheel/metadata.hpp"
#include "binwheel/platform.hpp"
#include "binwheel/record.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace binwheel {

namespace {

// ============================================================================
// Staging Context
// ============================================================================

struct StagingContext {
    const PackageInfo& package;
    const AssembleRequest& request;

    std::string root;               // <work_dir>/wheel
    std::string package_dir;        // <root>/<name>
    std::string dist_info;          // "<name>-<version>.dist-info"
    std::string record_path;        // "<dist_info>/RECORD"
    std::string scratch_wheel;      // <work_dir>/<wheel name>
    std::vector<std::string> sources;
    std::size_t record_entries = 0;
    std::string error;

    bool fail(const std::string& message) {
        error = message;
        return false;
    }
};

using StageFn = bool (*)(StagingContext&);

struct Stage {
    const char* name;
    StageFn run;
};

bool has_extension(const std::string& filename, const std::vector<std::string>& extensions) {
    for (const auto& ext : extensions) {
        if (filename.size() > ext.size() &&
            filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0) {
            return true;
        }
    }
    return false;
}

// Portable relative paths of every regular file under root, sorted
bool list_staged_files(const std::string& root, std::vector<std::string>& files, std::string& error) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    for (auto end = fs::recursive_directory_iterator(); !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(relative_portable_path(it->path().string(), root));
        }
    }
    if (ec) {
        error = "failed to walk " + root + ": " + ec.message();
        return false;
    }
    std::sort(files.begin(), files.end(), portable_path_less);
    return true;
}

// ============================================================================
// Stages
// ============================================================================

bool stage_root(StagingContext& ctx) {
    if (!remove_directory(ctx.root) || !create_directories(ctx.root)) {
        return ctx.fail("failed to create staging directory: " + ctx.root);
    }
    if (!create_directories(ctx.package_dir)) {
        return ctx.fail("failed to create directory: " + ctx.package_dir);
    }
    return true;
}

bool copy_sources(StagingContext& ctx) {
    const std::string& source_dir = ctx.request.source_dir;

    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(source_dir, ec);
    for (auto end = fs::directory_iterator(); !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (it->is_regular_file(ec) && has_extension(name, ctx.package.source_extensions)) {
            names.push_back(name);
        }
    }
    if (ec) {
        return ctx.fail("failed to read source directory " + source_dir + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        std::string src = join_path(source_dir, name);
        std::string dst = join_path(ctx.package_dir, name);
        if (!copy_file_preserving(src, dst)) {
            return ctx.fail("failed to copy " + src + " to " + dst);
        }
        ctx.sources.push_back(name);
    }

    spdlog::debug("copied {} source files from {}", names.size(), source_dir);
    return true;
}

bool stamp_version(StagingContext& ctx) {
    const std::string& version_file = ctx.package.version_file;
    if (std::find(ctx.sources.begin(), ctx.sources.end(), version_file) == ctx.sources.end()) {
        return ctx.fail(version_file + " not found in " + ctx.request.source_dir);
    }

    std::string path = join_path(ctx.package_dir, version_file);
    auto content = read_file(path);
    if (!content) {
        return ctx.fail("failed to read " + path);
    }

    auto rewrite = rewrite_version_assignment(*content, ctx.package.version_variable, ctx.request.version);
    if (rewrite.replaced == 0) {
        return ctx.fail("no " + ctx.package.version_variable + " assignment in " + version_file);
    }

    if (!write_file(path, rewrite.content)) {
        return ctx.fail("failed to write " + path);
    }
    return true;
}

bool copy_binary(StagingContext& ctx) {
    std::string dst = join_path(ctx.package_dir, ctx.request.binary_name);
    if (!copy_file_preserving(ctx.request.binary_path, dst)) {
        return ctx.fail("failed to copy " + ctx.request.binary_path + " to " + dst);
    }
    if (!make_executable(dst)) {
        return ctx.fail("failed to set execute permission on " + dst);
    }
    return true;
}

bool write_metadata(StagingContext& ctx) {
    std::string dir = join_path(ctx.root, ctx.dist_info);
    if (!create_directories(dir)) {
        return ctx.fail("failed to create directory: " + dir);
    }

    const std::pair<const char*, std::string> files[] = {
        {"METADATA", render_metadata(ctx.package, ctx.request.version)},
        {"WHEEL", render_wheel_file(ctx.package, ctx.request.platform_tag)},
        {"entry_points.txt", render_entry_points(ctx.package)},
        {"top_level.txt", render_top_level(ctx.package)},
    };

    for (const auto& [name, content] : files) {
        std::string path = join_path(dir, name);
        if (!write_file(path, content)) {
            return ctx.fail("failed to write " + path);
        }
    }
    return true;
}

bool write_record(StagingContext& ctx) {
    auto record = build_record(ctx.root, ctx.record_path);
    if (!record.ok) {
        return ctx.fail(record.error);
    }

    std::string path = join_path(ctx.root, ctx.record_path);
    if (!write_file(path, render_record(record.entries))) {
        return ctx.fail("failed to write " + path);
    }

    ctx.record_entries = record.entries.size();
    return true;
}

bool write_archive(StagingContext& ctx) {
    std::vector<std::string> files;
    std::string walk_error;
    if (!list_staged_files(ctx.root, files, walk_error)) {
        return ctx.fail(walk_error);
    }

    ZipWriteOptions options;
    options.method = ZipMethod::Deflate;
    options.timestamp = ctx.request.timestamp;

    ZipWriter zip(ctx.scratch_wheel, options);
    if (!zip.ok()) {
        return ctx.fail(zip.error());
    }

    for (const auto& rel : files) {
        std::string path = join_path(ctx.root, rel);
        // Only the execute bit survives from the staged tree
        std::uint32_t mode = is_executable(path) ? 0755 : 0644;
        if (!zip.add_file(rel, path, mode)) {
            return ctx.fail(zip.error());
        }
    }
    if (!zip.close()) {
        return ctx.fail(zip.error());
    }
    if (zip.entry_count() != ctx.record_entries) {
        return ctx.fail("archive holds " + std::to_string(zip.entry_count()) + " entries but RECORD lists " +
                        std::to_string(ctx.record_entries));
    }

    if (!create_directories(ctx.request.output_dir)) {
        return ctx.fail("failed to create output directory: " + ctx.request.output_dir);
    }

    std::string wheel_path = join_path(ctx.request.output_dir, get_filename(ctx.scratch_wheel));
    auto installed = atomic_install_file(ctx.scratch_wheel, wheel_path);
    if (!installed.ok) {
        return ctx.fail(installed.error);
    }
    return true;
}

const Stage kStages[] = {
    {"stage", stage_root},
    {"copy-sources", copy_sources},
    {"stamp-version", stamp_version},
    {"copy-binary", copy_binary},
    {"write-metadata", write_metadata},
    {"write-record", write_record},
    {"write-archive", write_archive},
};

} // namespace

const std::vector<std::string>& assembly_stage_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& stage : kStages) {
            out.emplace_back(stage.name);
        }
        return out;
    }();
    return names;
}

AssembleResult assemble_wheel(const PackageInfo& package, const AssembleRequest& request) {
    AssembleResult result;
    result.wheel_name = wheel_filename(package, request.version, request.platform_tag);
    result.wheel_path = join_path(request.output_dir, result.wheel_name);

    auto binary_size = file_size(request.binary_path);
    if (!binary_size) {
        result.kind = ErrorKind::Assembly;
        result.stage = "copy-binary";
        result.error = "cannot stat binary: " + request.binary_path;
        return result;
    }
    result.binary_size = *binary_size;

    if (request.dry_run) {
        spdlog::info("  Would create: {} (binary {} bytes)", result.wheel_name, result.binary_size);
        result.ok = true;
        return result;
    }

    StagingContext ctx{package, request};
    ctx.root = join_path(request.work_dir, "wheel");
    ctx.package_dir = join_path(ctx.root, package.name);
    ctx.dist_info = dist_info_dirname(package, request.version);
    ctx.record_path = record_member_path(package, request.version);
    ctx.scratch_wheel = join_path(request.work_dir, result.wheel_name);

    for (const auto& stage : kStages) {
        spdlog::debug("assembly stage: {}", stage.name);
        if (!stage.run(ctx)) {
            result.kind = ErrorKind::Assembly;
            result.stage = stage.name;
            result.error = ctx.error;
            return result;
        }
    }

    auto wheel_size = file_size(result.wheel_path);
    if (!wheel_size || *wheel_size == 0) {
        result.kind = ErrorKind::Assembly;
        result.stage = "write-archive";
        result.error = "wheel missing or empty after write: " + result.wheel_path;
        return result;
    }

    result.wheel_size = *wheel_size;
    result.record_entries = ctx.record_entries;
    spdlog::info("  Created: {} ({} bytes)", result.wheel_name, result.wheel_size);

    result.ok = true;
    return result;
}

} // namespace binwheel
