#pragma once
#include <optional>
#include <string>

namespace Strider {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    // Best effort write; failures are logged and reported through the return value.
    virtual bool save(const std::string& key, const std::string& content, bool is_binary = false) = 0;

    // Replaces key so that readers see either the old or the new content, never a
    // partial write. Throws StorageError.
    virtual void save_atomic(const std::string& key, const std::string& content) = 0;

    virtual std::optional<std::string> load(const std::string& key) const = 0;
    virtual bool                       exists(const std::string& key) const = 0;
    virtual void                       remove(const std::string& key)       = 0;
};

}  // namespace Storage
}  // namespace Strider
