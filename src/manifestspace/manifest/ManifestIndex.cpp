#include "manifest/ManifestIndex.hpp"

namespace MS::Manifest {

auto validateLabels(Labels const& labels) -> Expected<void> {
    auto it = labels.find(kTypeLabel);
    if (it == labels.end() || it->second.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "manifest labels must include a non-empty 'type'"});
    }
    for (auto const& [key, value] : labels) {
        if (key.empty()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "manifest label keys must not be empty"});
        }
    }
    return {};
}

} // namespace MS::Manifest
