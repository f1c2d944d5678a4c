#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>

namespace cloudrun {

// How one supported language is run. Immutable once registered.
//
// Command templates understand these placeholders:
//   {file}       absolute path of the entry file inside the sandbox
//   {dir}        the sandbox working directory
//   {classname}  public class name found in the source (Java)
//   {code}       the raw source text, as a single argument
//   {stdin_file} path of a file holding the request's stdin; when a template
//                does not use it, stdin is piped to the process instead
// Install templates are run through `sh -c` and take {packages}, already quoted.
struct EnvironmentDescriptor {
    std::string id;                                  // e.g., "python"
    std::string display_name;                        // e.g., "Python 3.11"
    std::string runtime_image;                       // Empty for preview-only environments
    std::string entry_filename;                      // May contain {classname}
    std::vector<std::string> run_command;
    bool network_enabled = false;                    // Network while user code runs
    bool supports_dependency_install = false;
    std::string package_manager;                     // "pip", "npm" or empty
    std::string install_command;
    std::map<std::string, std::string> environment;  // Variables for run and install
    bool preview_only = false;                       // Rendered, never executed
};

// Static language id -> descriptor mapping, built once at startup and then
// only read. Lookups are safe from any number of threads once it is shared.
class EnvironmentRegistry {
public:
    EnvironmentRegistry() = default;

    // Registry holding the built-in environments
    static EnvironmentRegistry with_builtins();

    // Registry read from a JSON document / file (see DESIGN.md for the format)
    static EnvironmentRegistry from_json(const std::string& json_text);
    static EnvironmentRegistry from_json_file(const std::string& path);

    // Add an environment; throws ValidationError when the descriptor is
    // incomplete or the id is already taken
    void register_environment(EnvironmentDescriptor descriptor);

    // nullptr when the language is unknown
    std::shared_ptr<const EnvironmentDescriptor> find(const std::string& language_id) const;

    // Like find() but throws ValidationError for an unknown language
    std::shared_ptr<const EnvironmentDescriptor> resolve(const std::string& language_id) const;

    bool has_environment(const std::string& language_id) const;
    std::vector<std::string> list_environments() const;
    size_t size() const { return environments_.size(); }

    // Distinct runtime images, for pre-pulling
    std::vector<std::string> runtime_images() const;

private:
    std::map<std::string, std::shared_ptr<const EnvironmentDescriptor>> environments_;
};

// Built-in environments
namespace BuiltInEnvironments {
    // Python 3.11, pip installs into /workspace/.packages
    EnvironmentDescriptor python();

    // Node.js 20, npm installs into /workspace/node_modules
    EnvironmentDescriptor nodejs();

    // Java 21, compiled then run from the workspace
    EnvironmentDescriptor java();

    // C++ with g++ 12
    EnvironmentDescriptor cpp();

    // HTML preview, no process is started
    EnvironmentDescriptor html();

    // Ubuntu shell, network reachable
    EnvironmentDescriptor ubuntu();
}

} // namespace cloudrun
