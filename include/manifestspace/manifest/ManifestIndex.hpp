#pragma once

#include "core/Error.hpp"
#include "manifest/EntryMetadata.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace MS::Manifest {

/**
 * Append-only store of immutable, identifier-addressed JSON entries.
 *
 * - Entries are never modified in place; an update is a put of a new entry followed
 *   by deletes of the old ones.
 * - findEntries returns every entry whose labels contain the query labels. Several
 *   entries may match when independent writers raced; no ordering is guaranteed.
 * - deleteEntry must succeed when the entry is already gone, since two writers may
 *   retire the same stale entry.
 * - Every call may block on I/O.
 */
class ManifestIndex {
public:
    virtual ~ManifestIndex() = default;

    [[nodiscard]] virtual auto findEntries(Labels const& labels) -> Expected<std::vector<EntryMetadata>> = 0;
    [[nodiscard]] virtual auto getEntry(EntryID const& id) -> Expected<Entry>                           = 0;
    [[nodiscard]] virtual auto putEntry(Labels const& labels, nlohmann::json const& payload) -> Expected<EntryID> = 0;
    [[nodiscard]] virtual auto deleteEntry(EntryID const& id) -> Expected<void>                         = 0;
};

// Shared check for putEntry: a manifest must carry a non-empty "type" label.
[[nodiscard]] auto validateLabels(Labels const& labels) -> Expected<void>;

} // namespace MS::Manifest
