#include "dependency_detector.h"
#include "environment_registry.h"
#include <regex>
#include <set>

namespace cloudrun {

namespace {

struct LanguagePatterns {
    std::string package_manager;
    std::vector<std::regex> patterns;  // Group 1 captures the module
};

const std::map<std::string, LanguagePatterns>& language_patterns() {
    static const std::map<std::string, LanguagePatterns> patterns = {
        {"python", {"pip", {
            std::regex(R"(ModuleNotFoundError: No module named '([^'\s]+)')"),
            std::regex(R"(ImportError: No module named '?([A-Za-z0-9_.]+)'?)"),
        }}},
        {"nodejs", {"npm", {
            std::regex(R"(Cannot find module '([^'\s]+)')"),
            std::regex(R"(Cannot find package '([^'\s]+)')"),
        }}},
    };
    return patterns;
}

const std::regex& package_name_pattern() {
    static const std::regex pattern(R"(^[A-Za-z0-9@][A-Za-z0-9@._/+=<>~!,\[\]-]{0,213}$)");
    return pattern;
}

} // namespace

// Import names that differ from the distribution name on PyPI
const std::map<std::string, std::string> DependencyDetector::python_aliases_ = {
    {"cv2", "opencv-python"},
    {"PIL", "Pillow"},
    {"sklearn", "scikit-learn"},
    {"yaml", "PyYAML"},
    {"bs4", "beautifulsoup4"},
    {"dateutil", "python-dateutil"},
    {"dotenv", "python-dotenv"},
    {"Crypto", "pycryptodome"},
};

std::optional<std::string> DependencyDetector::normalize_python(const std::string& module) {
    // "foo.bar.baz" is provided by the package that owns "foo"
    std::string top = module.substr(0, module.find('.'));
    if (top.empty()) {
        return std::nullopt;
    }
    auto alias = python_aliases_.find(top);
    if (alias != python_aliases_.end()) {
        return alias->second;
    }
    return top;
}

std::optional<std::string> DependencyDetector::normalize_node(const std::string& module) {
    // Relative or absolute paths are the user's own files, node: is built in
    if (module.empty() || module[0] == '.' || module[0] == '/' ||
        module.compare(0, 5, "node:") == 0) {
        return std::nullopt;
    }

    std::string name;
    if (module[0] == '@') {
        // @scope/name[/sub/path]
        size_t first_slash = module.find('/');
        if (first_slash == std::string::npos) {
            return std::nullopt;
        }
        size_t second_slash = module.find('/', first_slash + 1);
        name = module.substr(0, second_slash);
    } else {
        name = module.substr(0, module.find('/'));
    }

    // Drop a version qualifier, keeping a leading scope '@'
    size_t at = name.find('@', 1);
    if (at != std::string::npos) {
        name = name.substr(0, at);
    }
    if (name.empty() || name == "@") {
        return std::nullopt;
    }
    return name;
}

std::vector<DependencyMatch> DependencyDetector::suggest(
    const std::string& combined_output,
    const std::string& language_id
) {
    std::vector<DependencyMatch> matches;

    const auto& all = language_patterns();
    auto lang = all.find(language_id);
    if (lang == all.end()) {
        return matches;
    }

    // Collect by position so the result follows the order of the output
    std::map<size_t, std::string> found;
    for (const auto& pattern : lang->second.patterns) {
        auto begin = std::sregex_iterator(combined_output.begin(), combined_output.end(), pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            size_t pos = static_cast<size_t>(it->position(1));
            found.emplace(pos, (*it)[1].str());
        }
    }

    std::set<std::string> seen;
    for (const auto& [_, module] : found) {
        auto package = language_id == "python" ? normalize_python(module)
                                               : normalize_node(module);
        if (!package || !is_valid_package_name(*package)) {
            continue;
        }
        if (!seen.insert(*package).second) {
            continue;
        }
        matches.push_back({module, *package, lang->second.package_manager});
    }
    return matches;
}

std::optional<DependencyMatch> DependencyDetector::detect(
    const std::string& combined_output,
    const std::string& language_id
) {
    auto matches = suggest(combined_output, language_id);
    if (matches.size() != 1) {
        return std::nullopt;
    }
    return matches.front();
}

std::string DependencyDetector::install_command(
    const EnvironmentDescriptor& descriptor,
    const std::vector<std::string>& packages
) {
    if (!descriptor.supports_dependency_install || packages.empty()) {
        return "";
    }

    std::string joined;
    for (const auto& pkg : packages) {
        if (!joined.empty()) joined += ' ';
        joined += shell_quote(pkg);
    }

    std::string command = descriptor.install_command;
    const std::string placeholder = "{packages}";
    size_t pos = command.find(placeholder);
    if (pos == std::string::npos) {
        return command + " " + joined;
    }
    return command.replace(pos, placeholder.size(), joined);
}

bool DependencyDetector::is_valid_package_name(const std::string& name) {
    return std::regex_match(name, package_name_pattern());
}

std::string DependencyDetector::package_manager_for(const std::string& language_id) {
    const auto& all = language_patterns();
    auto it = all.find(language_id);
    return it == all.end() ? "" : it->second.package_manager;
}

std::string shell_quote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace cloudrun
