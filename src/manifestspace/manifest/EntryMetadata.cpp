#include "manifest/EntryMetadata.hpp"

namespace MS::Manifest {

auto labelsMatch(Labels const& labels, Labels const& query) -> bool {
    for (auto const& [key, value] : query) {
        auto it = labels.find(key);
        if (it == labels.end() || it->second != value)
            return false;
    }
    return true;
}

} // namespace MS::Manifest
