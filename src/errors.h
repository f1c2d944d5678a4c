#pragma once

#include <stdexcept>
#include <string>

namespace cloudrun {

// Base class for every error the execution core raises on purpose
class CloudrunError : public std::runtime_error {
public:
    explicit CloudrunError(const std::string& message)
        : std::runtime_error(message) {}
};

// Unknown language or malformed request; raised before any sandbox exists
class ValidationError : public CloudrunError {
public:
    explicit ValidationError(const std::string& message)
        : CloudrunError("Validation error: " + message) {}
};

// Runtime image unavailable, engine unreachable, or no sandbox capacity left
class ProvisioningError : public CloudrunError {
public:
    explicit ProvisioningError(const std::string& message)
        : CloudrunError("Provisioning error: " + message) {}
};

// Bad configuration value from the environment or the command line
class ConfigError : public CloudrunError {
public:
    explicit ConfigError(const std::string& message)
        : CloudrunError("Configuration error: " + message) {}
};

// A container engine command failed
class EngineError : public CloudrunError {
public:
    EngineError(const std::string& message, int exit_code = -1)
        : CloudrunError("Container engine error: " + message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

} // namespace cloudrun
