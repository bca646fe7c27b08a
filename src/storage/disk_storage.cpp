#include "disk_storage.hpp"
#include <fstream>
#include <iterator>
#include "strider/errors.hpp"
#include "../core/logger/logger.hpp"

namespace Strider {
namespace Storage {

namespace fs = std::filesystem;
using Strider::Core::Logger;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        fs::create_directories(base_path_, ec);
        if (ec) {
            Logger::error("Failed to create storage directory: " + base_path_ + " ("
                          + ec.message() + ")");
        }
    }
}

fs::path DiskStorage::path_for(const std::string& key) const {
    fs::path path(base_path_);
    path /= key;
    return path;
}

bool DiskStorage::save(const std::string& key, const std::string& content, bool is_binary) {
    try {
        fs::path path = path_for(key);

        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        std::ofstream file(path, is_binary ? std::ios::binary : std::ios::out);
        if (file.is_open()) {
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            Logger::debug("Saved: " + path.string());
            return true;
        }
        Logger::error("Write Error: " + path.string());
    } catch (const fs::filesystem_error& e) {
        Logger::error("FS Error: " + std::string(e.what()));
    }
    return false;
}

void DiskStorage::save_atomic(const std::string& key, const std::string& content) {
    fs::path path = path_for(key);
    fs::path tmp  = path;
    tmp += ".tmp";

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            throw StorageError("cannot create " + path.parent_path().string() + ": "
                               + ec.message());
    }

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            throw StorageError("cannot open " + tmp.string());
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file)
            throw StorageError("write failed for " + tmp.string());
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw StorageError("cannot replace " + path.string() + ": " + reason);
    }
}

std::optional<std::string> DiskStorage::load(const std::string& key) const {
    std::ifstream file(path_for(key), std::ios::binary);
    if (!file.is_open())
        return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool DiskStorage::exists(const std::string& key) const {
    std::error_code ec;
    return fs::exists(path_for(key), ec);
}

void DiskStorage::remove(const std::string& key) {
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        Logger::warn("Could not remove " + path_for(key).string() + ": " + ec.message());
    }
}

}  // namespace Storage
}  // namespace Strider
