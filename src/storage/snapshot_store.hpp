#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../engine/types/crawl_types.hpp"
#include "storage.hpp"

namespace Strider {
namespace Storage {

// Persists crawl snapshots for resume. The record is binary: magic "STRD",
// format version, fingerprint, visited, frontier, path states, failures and
// fetched pages, with big-endian integers and length-prefixed strings.
class SnapshotStore {
public:
    static constexpr uint16_t FORMAT_VERSION = 2;

    explicit SnapshotStore(std::shared_ptr<Storage> storage, std::string key = "crawl.snapshot");

    // Atomic replace of the stored snapshot. Throws StorageError.
    void checkpoint(const Engine::Snapshot& snapshot);

    // Nothing stored: nullopt. Stored for another invocation, truncated or not a
    // snapshot at all: IncompatibleSnapshot.
    std::optional<Engine::Snapshot> load_if_resuming(const Engine::Fingerprint& fingerprint) const;

    void discard();
    bool exists() const;

    static std::vector<uint8_t> encode(const Engine::Snapshot& snapshot);
    static Engine::Snapshot     decode(const std::vector<uint8_t>& data);

private:
    std::shared_ptr<Storage> storage_;
    std::string              key_;
};

}  // namespace Storage
}  // namespace Strider
