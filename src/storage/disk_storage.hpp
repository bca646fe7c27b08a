#pragma once
#include <filesystem>
#include <string>
#include "storage.hpp"

namespace Strider {
namespace Storage {

class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    bool save(const std::string& key, const std::string& content, bool is_binary = false) override;
    void save_atomic(const std::string& key, const std::string& content) override;

    std::optional<std::string> load(const std::string& key) const override;
    bool                       exists(const std::string& key) const override;
    void                       remove(const std::string& key) override;

    std::filesystem::path path_for(const std::string& key) const;

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Strider
