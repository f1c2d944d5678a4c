#pragma once

#include <string>
#include <filesystem>
#include <vector>

namespace cloudrun {

class FileUtils {
public:
    // Reduce a client-supplied name to a single safe path component.
    // Keeps [A-Za-z0-9._-], maps anything else to '_', strips directories and
    // leading dots. Returns empty when nothing usable is left.
    static std::string sanitize_filename(const std::string& filename);

    // Write content to a file, creating parent directories. Throws on failure.
    static void write_file(const std::filesystem::path& path, const std::string& content);

    // Whole file as a string; throws if it cannot be opened
    static std::string read_file(const std::filesystem::path& path);

    // Hash utilities
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);
};

// Host directory bind-mounted into an execution's sandboxes as the working
// directory. Created on construction, removed recursively on destruction, so
// packages installed by one sandbox stay visible to the next one of the same
// execution and disappear with it.
class Workspace {
public:
    Workspace(const std::filesystem::path& root, const std::string& name);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Write a file relative to the workspace, returns its host path
    std::filesystem::path write(const std::string& relative, const std::string& content);

private:
    std::filesystem::path path_;
};

} // namespace cloudrun
