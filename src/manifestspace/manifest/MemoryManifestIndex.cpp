#include "manifest/MemoryManifestIndex.hpp"

#include "log/TaggedLogger.hpp"
#include "manifest/EntryID.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace MS::Manifest {

namespace {

constexpr int kMaxIdAttempts = 8;

} // namespace

MemoryManifestIndex::MemoryManifestIndex()
    : generator([] { return generateEntryID(); }) {}

MemoryManifestIndex::MemoryManifestIndex(IdGenerator generator)
    : generator(std::move(generator)) {}

auto MemoryManifestIndex::findEntries(Labels const& labels) -> Expected<std::vector<EntryMetadata>> {
    std::vector<EntryMetadata> matches;
    this->entries.for_each([&](auto const& kv) {
        if (labelsMatch(kv.second.metadata.labels, labels))
            matches.push_back(kv.second.metadata);
    });
    ms_log("findEntries matched " + std::to_string(matches.size()) + " entries", LogTag::Memory);
    return matches;
}

auto MemoryManifestIndex::getEntry(EntryID const& id) -> Expected<Entry> {
    std::optional<Entry> found;
    this->entries.if_contains(id, [&](auto const& kv) { found = kv.second; });
    if (!found) {
        return std::unexpected(Error{Error::Code::NotFound, "manifest entry not found: " + id});
    }
    return std::move(*found);
}

auto MemoryManifestIndex::putEntry(Labels const& labels, nlohmann::json const& payload) -> Expected<EntryID> {
    if (auto valid = validateLabels(labels); !valid)
        return std::unexpected(valid.error());

    Entry entry;
    entry.metadata.labels  = labels;
    entry.metadata.length  = payload.dump().size();
    entry.metadata.modTime = std::chrono::system_clock::now();
    entry.payload          = payload;

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        auto id = this->generator();
        if (id.empty())
            break;
        entry.metadata.id = id;
        if (this->entries.try_emplace(id, entry).second) {
            ms_log("putEntry created " + id, LogTag::Memory);
            return id;
        }
    }
    return std::unexpected(Error{Error::Code::UnknownError, "unable to allocate a unique manifest entry id"});
}

auto MemoryManifestIndex::deleteEntry(EntryID const& id) -> Expected<void> {
    [[maybe_unused]] auto erased = this->entries.erase(id);
    ms_log("deleteEntry " + id + (erased ? " removed" : " already absent"), LogTag::Memory);
    return {};
}

auto MemoryManifestIndex::entryCount() const -> std::size_t {
    return this->entries.size();
}

} // namespace MS::Manifest
