/**
 * binwheel CLI - Entry Point
 *
 * Builds platform-specific Python wheels around a prebuilt executable.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#include <binwheel/targets.hpp>

#include <exception>

namespace binwheel::cli {

namespace {

void print_summary(const BuildReport& report, const BuildOptions& options) {
    std::cout << std::string(50, '=') << std::endl;
    if (report.dry_run) {
        std::cout << "Dry run: " << report.built.size() << " wheels would be built" << std::endl;
        for (const auto& wheel : report.built) {
            std::cout << "  " << wheel.path << std::endl;
        }
        return;
    }

    std::cout << "Built " << report.built.size() << " wheels:" << std::endl;
    for (const auto& wheel : report.built) {
        std::cout << "  " << wheel.path << "  " << wheel.size << " bytes  sha256:" << wheel.sha256 << std::endl;
    }
    std::cout << std::endl;
    std::cout << "To upload to PyPI:" << std::endl;
    std::cout << "  twine upload " << options.output_dir << "/*.whl" << std::endl;
}

int cmd_build(const GlobalOptions& opts, const BuildCommandOptions& cmd) {
    setup_logging(opts);

    BuildOptions options = make_build_options(cmd, BINWHEEL_DEFAULT_SOURCE_DIR);

    spdlog::debug("source directory: {}", options.source_dir);
    spdlog::debug("release host: {}", options.release_host);

    auto report = run_build(options, default_package());

    if (opts.json) {
        output_json(report_to_json(report, options));
    } else if (!report.ok) {
        print_error(format_failure(report), false);
    } else if (!opts.quiet) {
        print_summary(report, options);
    }
    return exit_code(report);
}

} // namespace

} // namespace binwheel::cli

int main(int argc, char** argv) {
    using namespace binwheel::cli;

    CLI::App app{"binwheel - Build platform wheels around a prebuilt binary"};
    app.set_version_flag("-V,--tool-version", BINWHEEL_VERSION);

    GlobalOptions opts;
    BuildCommandOptions cmd;

    app.add_option("--version", cmd.version, "Release version to package (e.g. 1.2.3)")->required();
    app.add_flag("--dry-run", cmd.dry_run, "Show what would be built without writing anything");
    app.add_option("--binaries-dir", cmd.binaries_dir, "Use binaries from this directory instead of downloading")
        ->check(CLI::ExistingDirectory);
    app.add_option("--output-dir", cmd.output_dir, "Directory that receives the wheels")
        ->capture_default_str();
    app.add_option("--platforms", cmd.platforms, "Only build these targets (os-arch, space or comma separated)")
        ->delimiter(',');
    app.add_option("--source-dir", cmd.source_dir, "Python package sources (env: BINWHEEL_SOURCE_DIR)");
    app.add_option("--release-host", cmd.release_host, "Release download host (env: BINWHEEL_RELEASE_HOST)");
    app.add_flag("--verify", cmd.verify, "Re-read every produced wheel and check its RECORD");

    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only");

    std::string targets_help = "Supported platforms:";
    for (const auto& target : binwheel::supported_targets()) {
        targets_help += "\n  " + target.label() + "  (" + target.platform_tag + ")";
    }
    app.footer(targets_help);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --tool-version exit 0; every usage error exits 1
        return app.exit(e) == 0 ? 0 : 1;
    }

    try {
        return cmd_build(opts, cmd);
    } catch (const std::exception& e) {
        print_error(std::string("unexpected failure: ") + e.what(), opts.json);
        return 1;
    }
}
