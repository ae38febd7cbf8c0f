#pragma once

#include "manifest/EntryMetadata.hpp"

#include <chrono>
#include <cstddef>
#include <string_view>

namespace MS::Manifest {

inline constexpr std::size_t kEntryIDTimeDigits   = 12;
inline constexpr std::size_t kEntryIDRandomDigits = 20;
inline constexpr std::size_t kEntryIDLength       = kEntryIDTimeDigits + kEntryIDRandomDigits;

/**
 * Generates a new entry identifier: creation time in milliseconds as 12 hex digits
 * followed by 20 random hex digits. Identifiers created later by any process sort
 * after earlier ones (modulo clock skew) under plain string comparison.
 */
[[nodiscard]] auto generateEntryID(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) -> EntryID;

[[nodiscard]] auto isValidEntryID(std::string_view id) -> bool;

} // namespace MS::Manifest
