#include "snapshot_store.hpp"
#include <stdexcept>
#include "strider/errors.hpp"
#include "../binary/reader.hpp"
#include "../binary/writer.hpp"
#include "../core/logger/logger.hpp"

namespace Strider {
namespace Storage {

using Core::Logger;
using namespace Strider::Engine;

namespace {

constexpr const char* MAGIC = "STRD";

void write_optional(Binary::Writer& writer, const std::optional<std::string>& value) {
    writer.write_uint8(value ? 1 : 0);
    if (value)
        writer.write_prefixed_string(*value);
}

std::optional<std::string> read_optional(Binary::Reader& reader) {
    uint8_t flag = reader.read_uint8();
    if (flag > 1)
        throw std::invalid_argument("bad optional flag");
    if (flag == 0)
        return std::nullopt;
    return reader.read_prefixed_string();
}

int read_depth(Binary::Reader& reader) {
    uint32_t depth = reader.read_uint32_be();
    if (depth > static_cast<uint32_t>(INT32_MAX))
        throw std::invalid_argument("depth out of range");
    return static_cast<int>(depth);
}

FetchOutcome read_outcome(Binary::Reader& reader) {
    uint8_t outcome = reader.read_uint8();
    if (outcome > static_cast<uint8_t>(FetchOutcome::TransportError))
        throw std::invalid_argument("unknown fetch outcome");
    return static_cast<FetchOutcome>(outcome);
}

// Guards reserve() against absurd counts in corrupt files.
uint64_t read_count(Binary::Reader& reader, size_t remaining) {
    uint64_t count = reader.read_uint64_be();
    if (count > remaining)
        throw std::invalid_argument("record count exceeds file size");
    return count;
}

}  // namespace

SnapshotStore::SnapshotStore(std::shared_ptr<Storage> storage, std::string key)
    : storage_(std::move(storage)), key_(std::move(key)) {
}

std::vector<uint8_t> SnapshotStore::encode(const Snapshot& snapshot) {
    std::vector<uint8_t> data;
    Binary::Writer       writer(data);

    writer.write_string(MAGIC);
    writer.write_uint16_be(FORMAT_VERSION);

    const auto& fp = snapshot.fingerprint;
    writer.write_uint32_be(static_cast<uint32_t>(fp.seeds.size()));
    for (const auto& seed : fp.seeds)
        writer.write_prefixed_string(seed);
    writer.write_uint32_be(static_cast<uint32_t>(fp.max_depth));
    writer.write_double_be(fp.percentage);

    writer.write_uint64_be(snapshot.visited.size());
    for (const auto& record : snapshot.visited) {
        writer.write_prefixed_string(record.key);
        writer.write_uint64_be(static_cast<uint64_t>(record.first_seen_ms));
        writer.write_uint32_be(static_cast<uint32_t>(record.depth));
    }

    writer.write_uint64_be(snapshot.frontier.size());
    for (const auto& entry : snapshot.frontier) {
        writer.write_prefixed_string(entry.url);
        writer.write_uint32_be(static_cast<uint32_t>(entry.depth));
        write_optional(writer, entry.parent);
    }

    writer.write_uint64_be(snapshot.paths.size());
    for (const auto& record : snapshot.paths) {
        writer.write_prefixed_string(record.key);
        writer.write_uint32_be(static_cast<uint32_t>(record.state.chain_length));
        write_optional(writer, record.state.predecessor);
    }

    writer.write_uint64_be(snapshot.failures.size());
    for (const auto& failure : snapshot.failures) {
        writer.write_prefixed_string(failure.url);
        writer.write_uint32_be(static_cast<uint32_t>(failure.depth));
        writer.write_prefixed_string(failure.reason);
    }

    writer.write_uint64_be(snapshot.pages.size());
    for (const auto& page : snapshot.pages) {
        writer.write_prefixed_string(page.url);
        writer.write_uint32_be(static_cast<uint32_t>(page.depth));
        write_optional(writer, page.parent);
        writer.write_uint8(static_cast<uint8_t>(page.outcome));
        writer.write_uint32_be(static_cast<uint32_t>(page.status));
        writer.write_double_be(page.elapsed_ms);
        writer.write_uint8(page.keyword_hit ? 1 : 0);
        writer.write_uint64_be(page.links_found);
        writer.write_uint64_be(page.links_admitted);
    }

    return data;
}

Snapshot SnapshotStore::decode(const std::vector<uint8_t>& data) {
    Binary::Reader reader(data);
    Snapshot       snapshot;

    try {
        if (reader.read_string(4) != MAGIC)
            throw IncompatibleSnapshot("not a crawl snapshot");
        uint16_t version = reader.read_uint16_be();
        if (version != FORMAT_VERSION)
            throw IncompatibleSnapshot("unsupported format version " + std::to_string(version));

        auto&    fp         = snapshot.fingerprint;
        uint32_t seed_count = reader.read_uint32_be();
        if (seed_count > data.size())
            throw std::invalid_argument("seed count exceeds file size");
        for (uint32_t i = 0; i < seed_count; ++i)
            fp.seeds.push_back(reader.read_prefixed_string());
        fp.max_depth  = read_depth(reader);
        fp.percentage = reader.read_double_be();

        uint64_t visited = read_count(reader, data.size());
        snapshot.visited.reserve(visited);
        for (uint64_t i = 0; i < visited; ++i) {
            VisitedRecord record;
            record.key           = reader.read_prefixed_string();
            record.first_seen_ms = static_cast<int64_t>(reader.read_uint64_be());
            record.depth         = read_depth(reader);
            snapshot.visited.push_back(std::move(record));
        }

        uint64_t frontier = read_count(reader, data.size());
        snapshot.frontier.reserve(frontier);
        for (uint64_t i = 0; i < frontier; ++i) {
            FrontierEntry entry;
            entry.url    = reader.read_prefixed_string();
            entry.depth  = read_depth(reader);
            entry.parent = read_optional(reader);
            snapshot.frontier.push_back(std::move(entry));
        }

        uint64_t paths = read_count(reader, data.size());
        snapshot.paths.reserve(paths);
        for (uint64_t i = 0; i < paths; ++i) {
            PathRecord record;
            record.key                = reader.read_prefixed_string();
            record.state.chain_length = read_depth(reader);
            record.state.predecessor  = read_optional(reader);
            snapshot.paths.push_back(std::move(record));
        }

        uint64_t failures = read_count(reader, data.size());
        snapshot.failures.reserve(failures);
        for (uint64_t i = 0; i < failures; ++i) {
            FailureRecord failure;
            failure.url    = reader.read_prefixed_string();
            failure.depth  = read_depth(reader);
            failure.reason = reader.read_prefixed_string();
            snapshot.failures.push_back(std::move(failure));
        }

        uint64_t pages = read_count(reader, data.size());
        snapshot.pages.reserve(pages);
        for (uint64_t i = 0; i < pages; ++i) {
            PageRecord page;
            page.url         = reader.read_prefixed_string();
            page.depth       = read_depth(reader);
            page.parent      = read_optional(reader);
            page.outcome     = read_outcome(reader);
            page.status      = static_cast<long>(reader.read_uint32_be());
            page.elapsed_ms  = reader.read_double_be();
            page.keyword_hit = reader.read_uint8() != 0;
            page.links_found    = static_cast<size_t>(reader.read_uint64_be());
            page.links_admitted = static_cast<size_t>(reader.read_uint64_be());
            snapshot.pages.push_back(std::move(page));
        }
    } catch (const std::out_of_range&) {
        throw IncompatibleSnapshot("snapshot is truncated");
    } catch (const std::invalid_argument& e) {
        throw IncompatibleSnapshot(std::string("snapshot is corrupt: ") + e.what());
    }

    if (!reader.eof())
        throw IncompatibleSnapshot("trailing bytes after snapshot");
    return snapshot;
}

void SnapshotStore::checkpoint(const Snapshot& snapshot) {
    std::vector<uint8_t> data = encode(snapshot);
    storage_->save_atomic(key_, std::string(data.begin(), data.end()));
    Logger::debug("Checkpoint written: " + std::to_string(snapshot.visited.size()) + " visited, "
                  + std::to_string(snapshot.frontier.size()) + " queued");
}

std::optional<Snapshot> SnapshotStore::load_if_resuming(const Fingerprint& fingerprint) const {
    auto raw = storage_->load(key_);
    if (!raw) {
        Logger::warn("No snapshot found, starting a fresh crawl.");
        return std::nullopt;
    }

    Snapshot snapshot = decode(std::vector<uint8_t>(raw->begin(), raw->end()));
    if (auto diff = snapshot.fingerprint.mismatch(fingerprint)) {
        throw IncompatibleSnapshot("stored " + *diff + " (current invocation)");
    }
    return snapshot;
}

void SnapshotStore::discard() {
    if (storage_->exists(key_))
        storage_->remove(key_);
}

bool SnapshotStore::exists() const {
    return storage_->exists(key_);
}

}  // namespace Storage
}  // namespace Strider
