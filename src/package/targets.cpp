#include "binwheel/targets.hpp"

#include <algorithm>

namespace binwheel {

const std::vector<Target>& supported_targets() {
    static const std::vector<Target> targets = {
        {"linux", "amd64", ArchiveFormat::TarGz, "kothaset",
         "manylinux_2_17_x86_64.manylinux2014_x86_64"},
        {"linux", "arm64", ArchiveFormat::TarGz, "kothaset",
         "manylinux_2_17_aarch64.manylinux2014_aarch64"},
        {"darwin", "amd64", ArchiveFormat::TarGz, "kothaset", "macosx_10_12_x86_64"},
        {"darwin", "arm64", ArchiveFormat::TarGz, "kothaset", "macosx_11_0_arm64"},
        {"windows", "amd64", ArchiveFormat::Zip, "kothaset.exe", "win_amd64"},
    };
    return targets;
}

std::vector<Target> filter_targets(const std::vector<Target>& targets,
                                   const std::vector<std::string>& labels) {
    if (labels.empty()) {
        return targets;
    }

    std::vector<Target> selected;
    for (const auto& target : targets) {
        if (std::find(labels.begin(), labels.end(), target.label()) != labels.end()) {
            selected.push_back(target);
        }
    }
    return selected;
}

} // namespace binwheel
