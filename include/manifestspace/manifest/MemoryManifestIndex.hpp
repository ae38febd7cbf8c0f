#pragma once

#include "manifest/ManifestIndex.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

#include <parallel_hashmap/phmap.h>

namespace MS::Manifest {

/**
 * In-process manifest index.
 *
 * Entries live in a phmap::parallel_flat_hash_map with internal per-shard mutexes, so
 * the index can be shared by any number of threads acting as independent writers.
 */
class MemoryManifestIndex final : public ManifestIndex {
public:
    using IdGenerator = std::function<EntryID()>;

    MemoryManifestIndex();
    explicit MemoryManifestIndex(IdGenerator generator);

    MemoryManifestIndex(MemoryManifestIndex const&)            = delete;
    MemoryManifestIndex& operator=(MemoryManifestIndex const&) = delete;

    [[nodiscard]] auto findEntries(Labels const& labels) -> Expected<std::vector<EntryMetadata>> override;
    [[nodiscard]] auto getEntry(EntryID const& id) -> Expected<Entry> override;
    [[nodiscard]] auto putEntry(Labels const& labels, nlohmann::json const& payload) -> Expected<EntryID> override;
    [[nodiscard]] auto deleteEntry(EntryID const& id) -> Expected<void> override;

    [[nodiscard]] auto entryCount() const -> std::size_t;

private:
    static constexpr int DefaultSubmaps = 4;

    using EntryMap = phmap::parallel_flat_hash_map<
        EntryID,
        Entry,
        phmap::priv::hash_default_hash<EntryID>,
        phmap::priv::hash_default_eq<EntryID>,
        std::allocator<std::pair<const EntryID, Entry>>,
        DefaultSubmaps,
        std::mutex>;

    EntryMap    entries;
    IdGenerator generator;
};

} // namespace MS::Manifest
