#pragma once

#include "core/Error.hpp"
#include "maintenance/Params.hpp"
#include "manifest/EntryMetadata.hpp"
#include "repo/Repository.hpp"

#include <span>
#include <vector>

namespace MS::Maintenance {

inline constexpr char const* kManifestType = "maintenance";

// Label set identifying maintenance parameter manifests: {type: "maintenance"}.
[[nodiscard]] auto manifestLabels() -> Manifest::Labels;

// All physical entries currently holding maintenance parameters (may be 0, 1 or more).
[[nodiscard]] auto findParamsEntries(Repository const& repository) -> Expected<std::vector<Manifest::EntryMetadata>>;

// True when maintenance parameters have ever been stored, without decoding them.
[[nodiscard]] auto hasParams(Repository const& repository) -> Expected<bool>;

/**
 * Returns the effective maintenance parameters.
 *
 * No stored entry yields defaultParams(). With duplicates left by racing writers the
 * entry chosen by Manifest::pickLatestID is loaded, so every reader agrees on the
 * same entry set. Errors carry LookupFailed or LoadFailed.
 */
[[nodiscard]] auto getParams(Repository const& repository) -> Expected<Params>;

// Whether the stored owner equals this client's username@hostname. Advisory only.
[[nodiscard]] auto isOwnedByThisUser(Repository const& repository) -> Expected<bool>;

/**
 * Stores new maintenance parameters with the two-phase protocol:
 *   1. look up the entries currently holding parameters,
 *   2. commit: create a new entry with `params`,
 *   3. retire: delete the entries found in step 1.
 * A failed commit leaves the previous entries untouched and retires nothing. It does
 * not prove the new entry is absent: a backend may fail after the entry became visible
 * (a directory fsync after the rename), in which case it is one more duplicate.
 * A failed retire leaves the committed entry in place next to stale duplicates, which
 * readers resolve through the picker and the next successful write removes.
 */
[[nodiscard]] auto setParams(Repository const& repository, Params const& params) -> Expected<void>;

// Phase 1 of setParams: creates a new entry. Never touches existing entries.
// CommitFailed may follow an entry that is already visible.
[[nodiscard]] auto commitParams(Repository const& repository, Params const& params) -> Expected<Manifest::EntryID>;

// Phase 2 of setParams: deletes `stale` in order, stopping at the first failure.
// Only call after a successful commitParams, so one valid entry always exists.
[[nodiscard]] auto retireEntries(Repository const& repository, std::span<Manifest::EntryMetadata const> stale)
    -> Expected<void>;

} // namespace MS::Maintenance
