#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace cloudrun {

struct EnvironmentDescriptor;

// A missing package recognised in program output
struct DependencyMatch {
    std::string module_name;       // As the error printed it, e.g. "cv2" or "lodash/fp"
    std::string package_name;      // Installable name, e.g. "opencv-python" or "lodash"
    std::string package_manager;   // "pip" or "npm"
};

// Stateless recogniser for "missing module" errors
class DependencyDetector {
public:
    // The single package the output complains about. Returns nullopt when
    // nothing matches, the language has no package manager, or more than one
    // distinct package is named.
    static std::optional<DependencyMatch> detect(const std::string& combined_output,
                                                 const std::string& language_id);

    // Every distinct candidate, in order of first appearance
    static std::vector<DependencyMatch> suggest(const std::string& combined_output,
                                                const std::string& language_id);

    // Descriptor's install template with the packages substituted, shell-quoted.
    // Empty when the environment does not support installs.
    static std::string install_command(const EnvironmentDescriptor& descriptor,
                                       const std::vector<std::string>& packages);

    // Names we are willing to hand to a package manager
    static bool is_valid_package_name(const std::string& name);

    // Package manager used for a language, empty if none
    static std::string package_manager_for(const std::string& language_id);

private:
    // Module name -> installable name, nullopt for names that are not packages
    static std::optional<std::string> normalize_python(const std::string& module);
    static std::optional<std::string> normalize_node(const std::string& module);

    static const std::map<std::string, std::string> python_aliases_;
};

// Single-quote a word for sh
std::string shell_quote(const std::string& word);

} // namespace cloudrun
