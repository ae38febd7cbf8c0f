#include "manifest/PickLatest.hpp"

#include <algorithm>

namespace MS::Manifest {

auto pickLatestID(std::span<EntryMetadata const> entries) -> Expected<EntryID> {
    if (entries.empty()) {
        return std::unexpected(Error{Error::Code::NotFound, "no manifest entries to pick from"});
    }
    auto latest = std::ranges::max_element(entries, {}, &EntryMetadata::id);
    return latest->id;
}

} // namespace MS::Manifest
