#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace MS::Storage {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;
[[nodiscard]] auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

// Writes to "<path>.tmp" and renames over `path`, so readers never observe a partial file.
// With fsyncData the parent directory is synced after the rename; if that fails the error
// is returned although `path` already holds the new contents.
[[nodiscard]] auto writeFileAtomic(std::filesystem::path const& path,
                                   std::span<const std::byte> data,
                                   bool fsyncData) -> Expected<void>;
[[nodiscard]] auto writeTextFileAtomic(std::filesystem::path const& path,
                                       std::string const& text,
                                       bool fsyncData) -> Expected<void>;

[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

// Returns false when the file was already gone.
[[nodiscard]] auto removeFile(std::filesystem::path const& path) -> Expected<bool>;

} // namespace MS::Storage
