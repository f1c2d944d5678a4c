#include "file_utils.h"
#include "errors.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <openssl/sha.h>
#include <sys/stat.h>

namespace cloudrun {

std::string FileUtils::sanitize_filename(const std::string& filename) {
    // Only the last path component counts
    std::string base = filename;
    size_t slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string out;
    for (char c : base) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        out += ok ? c : '_';
    }

    // No hidden files, no "." or ".."
    size_t first = out.find_first_not_of('.');
    if (first == std::string::npos) {
        return "";
    }
    out = out.substr(first);
    if (out.size() > 255) {
        out.resize(255);
    }
    return out;
}

void FileUtils::write_file(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw CloudrunError("cannot create directory " + path.parent_path().string() +
                            ": " + ec.message());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw CloudrunError("cannot write " + path.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw CloudrunError("short write to " + path.string());
    }
}

std::string FileUtils::read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CloudrunError("cannot open " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

Workspace::Workspace(const std::filesystem::path& root, const std::string& name)
    : path_(root / name) {
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        throw ProvisioningError("cannot create workspace " + path_.string() + ": " + ec.message());
    }
    // The sandbox may run as another user
    if (chmod(path_.c_str(), 0777) != 0) {
        std::cerr << "[Workspace] chmod failed for " << path_ << std::endl;
    }
}

Workspace::~Workspace() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[Workspace] Failed to remove " << path_ << ": " << ec.message() << std::endl;
    }
}

std::filesystem::path Workspace::write(const std::string& relative, const std::string& content) {
    std::filesystem::path target = path_ / relative;
    FileUtils::write_file(target, content);
    if (chmod(target.c_str(), 0666) != 0) {
        std::cerr << "[Workspace] chmod failed for " << target << std::endl;
    }
    return target;
}

} // namespace cloudrun
