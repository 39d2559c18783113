#pragma once

#include <stdexcept>
#include <string>

namespace arbx {

class ArbxException : public std::runtime_error {
public:
    explicit ArbxException(const std::string& message) : std::runtime_error(message) {}
    explicit ArbxException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public ArbxException {
public:
    explicit ConfigurationError(const std::string& message)
        : ArbxException("Configuration Error: " + message) {}
};

// Raised while building the path catalog; the engine refuses to start.
class InvalidPathError : public ArbxException {
public:
    explicit InvalidPathError(const std::string& message)
        : ArbxException("Invalid Path: " + message) {}
};

class ValidationError : public ArbxException {
public:
    explicit ValidationError(const std::string& message)
        : ArbxException("Validation Error: " + message) {}
};

} // namespace arbx
