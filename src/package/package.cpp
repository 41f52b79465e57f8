#include "binwheel/package.hpp"

#include <algorithm>
#include <cctype>

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>

namespace binwheel {

const PackageInfo& default_package() {
    static const PackageInfo package = [] {
        PackageInfo p;
        p.name = "kothaset";
        p.repository = "shantoislamdev/kothaset";
        p.summary = "High-quality dataset generation CLI for LLM training";
        p.author = "Shanto Islam";
        p.author_email = "shantoislamdev@gmail.com";
        p.license = "Apache-2.0";
        p.requires_python = ">=3.8";
        p.classifiers = {
            "Development Status :: 5 - Production/Stable",
            "Environment :: Console",
            "Intended Audience :: Developers",
            "Intended Audience :: Science/Research",
            "License :: OSI Approved :: Apache Software License",
            "Topic :: Scientific/Engineering :: Artificial Intelligence",
        };
        p.console_command = "kothaset";
        p.entry_module = "_main";
        p.entry_function = "main";
        p.version_file = "__init__.py";
        p.version_variable = "__version__";
        p.source_extensions = {".py"};
        p.generator = "binwheel";
        return p;
    }();
    return package;
}

std::string wheel_filename(const PackageInfo& package,
                           const std::string& version,
                           const std::string& platform_tag) {
    return package.name + "-" + version + "-" + kPythonAbiTag + "-" + platform_tag + kWheelExtension;
}

std::string dist_info_dirname(const PackageInfo& package, const std::string& version) {
    return package.name + "-" + version + ".dist-info";
}

std::string record_member_path(const PackageInfo& package, const std::string& version) {
    return dist_info_dirname(package, version) + "/RECORD";
}

VersionCheck check_version(const std::string& version) {
    VersionCheck result;

    if (version.empty()) {
        result.kind = ErrorKind::Configuration;
        result.error = "version must not be empty";
        return result;
    }

    auto bad = std::find_if(version.begin(), version.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '\\' || c == ',';
    });
    if (bad != version.end()) {
        result.kind = ErrorKind::Configuration;
        result.error = "version contains a character not allowed in file names: '" + version + "'";
        return result;
    }

    try {
        (void)semver::version::parse(version);
    } catch (const semver::semver_exception&) {
        result.warning = "version '" + version + "' is not a valid SemVer 2.0.0 string";
    }

    result.ok = true;
    return result;
}

} // namespace binwheel
