#pragma once

#include "core/Error.hpp"
#include "manifest/EntryMetadata.hpp"

#include <span>

namespace MS::Manifest {

/**
 * Picks one entry among duplicates sharing a label set.
 *
 * The rule is the greatest identifier under byte-wise string comparison. It uses
 * nothing but the identifiers, so any process looking at the same entry set picks the
 * same entry regardless of the order findEntries returned them in. Which duplicate
 * wins is arbitrary but consistent; near-simultaneous writers are an accepted race.
 *
 * Callers check for an empty set first; an empty span yields NotFound.
 */
[[nodiscard]] auto pickLatestID(std::span<EntryMetadata const> entries) -> Expected<EntryID>;

} // namespace MS::Manifest
