#pragma once
#include <stdexcept>
#include <string>

namespace Strider {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {
    }
};

// Bad settings or seed source. Fatal, raised before any fetch.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error("Config error: " + message) {
    }
};

// Malformed candidate link. The link is dropped, the crawl continues.
class InvalidUrl : public Error {
public:
    InvalidUrl(const std::string& url, const std::string& reason)
        : Error("Invalid URL '" + url + "': " + reason), url_(url) {
    }

    const std::string& url() const {
        return url_;
    }

private:
    std::string url_;
};

// Resume requested against a snapshot that does not belong to this invocation.
class IncompatibleSnapshot : public Error {
public:
    explicit IncompatibleSnapshot(const std::string& message)
        : Error("Incompatible snapshot: " + message) {
    }
};

// Checkpoint or report write failure. Logged, never fatal.
class StorageError : public Error {
public:
    explicit StorageError(const std::string& message) : Error("Storage error: " + message) {
    }
};

}  // namespace Strider
