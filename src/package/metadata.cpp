#include "binwheel/metadata.hpp"

#include <sstream>

namespace binwheel {

std::string render_metadata(const PackageInfo& package, const std::string& version) {
    std::ostringstream out;
    out << "Metadata-Version: " << kMetadataVersion << "\n"
        << "Name: " << package.name << "\n"
        << "Version: " << version << "\n"
        << "Summary: " << package.summary << "\n"
        << "Home-page: " << package.home_page() << "\n"
        << "Author: " << package.author << "\n"
        << "Author-email: " << package.author_email << "\n"
        << "License: " << package.license << "\n"
        << "Requires-Python: " << package.requires_python << "\n";
    for (const auto& classifier : package.classifiers) {
        out << "Classifier: " << classifier << "\n";
    }
    return out.str();
}

std::string render_wheel_file(const PackageInfo& package, const std::string& platform_tag) {
    std::ostringstream out;
    out << "Wheel-Version: " << kWheelFormatVersion << "\n"
        << "Generator: " << package.generator << "\n"
        << "Root-Is-Purelib: false\n"
        << "Tag: " << kPythonAbiTag << "-" << platform_tag << "\n";
    return out.str();
}

std::string render_entry_points(const PackageInfo& package) {
    return "[console_scripts]\n" +
           package.console_command + " = " + package.name + "." +
           package.entry_module + ":" + package.entry_function + "\n";
}

std::string render_top_level(const PackageInfo& package) {
    return package.name + "\n";
}

namespace {

bool is_inline_space(char c) {
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

// Where the assignment starting at `start` ends its match, or npos.
// Matches: variable, spaces, '=', spaces, '"', non-quote chars, '"'.
size_t match_assignment(const std::string& line, size_t start, const std::string& variable) {
    size_t pos = start + variable.size();
    while (pos < line.size() && is_inline_space(line[pos])) ++pos;
    if (pos >= line.size() || line[pos] != '=') return std::string::npos;
    ++pos;
    while (pos < line.size() && is_inline_space(line[pos])) ++pos;
    if (pos >= line.size() || line[pos] != '"') return std::string::npos;
    size_t close = line.find('"', pos + 1);
    return close == std::string::npos ? std::string::npos : close + 1;
}

} // namespace

VersionRewrite rewrite_version_assignment(const std::string& content,
                                          const std::string& variable,
                                          const std::string& version) {
    VersionRewrite result;
    if (variable.empty()) {
        result.content = content;
        return result;
    }

    const std::string replacement = variable + " = \"" + version + "\"";

    size_t line_start = 0;
    while (line_start < content.size()) {
        size_t newline = content.find('\n', line_start);
        size_t line_end = newline == std::string::npos ? content.size() : newline;

        // The rest-of-line part of the match stops short of "\r\n"
        size_t body_end = line_end;
        if (body_end > line_start && content[body_end - 1] == '\r') {
            --body_end;
        }

        std::string line = content.substr(line_start, body_end - line_start);
        std::string rewritten;
        bool changed = false;

        size_t search = 0;
        while (true) {
            size_t hit = line.find(variable, search);
            if (hit == std::string::npos) break;
            if (match_assignment(line, hit, variable) != std::string::npos) {
                rewritten = line.substr(0, hit) + replacement;
                changed = true;
                break;
            }
            search = hit + 1;
        }

        if (changed) {
            result.content += rewritten;
            ++result.replaced;
        } else {
            result.content += line;
        }
        result.content.append(content, body_end,
                              (newline == std::string::npos ? content.size() : newline + 1) - body_end);

        if (newline == std::string::npos) break;
        line_start = newline + 1;
    }

    return result;
}

} // namespace binwheel
