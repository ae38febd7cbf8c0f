#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace MS::Manifest {

using EntryID = std::string;
using Labels  = std::map<std::string, std::string>;

inline constexpr char const* kTypeLabel = "type";

struct EntryMetadata {
    EntryID                               id;
    Labels                                labels;
    std::size_t                           length = 0;
    std::chrono::system_clock::time_point modTime{};
};

struct Entry {
    EntryMetadata  metadata;
    nlohmann::json payload;
};

// True when every label in `query` is present in `labels` with the same value.
[[nodiscard]] auto labelsMatch(Labels const& labels, Labels const& query) -> bool;

} // namespace MS::Manifest
