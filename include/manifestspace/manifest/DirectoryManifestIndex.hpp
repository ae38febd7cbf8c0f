#pragma once

#include "manifest/ManifestIndex.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace MS::Manifest {

/**
 * Manifest index stored as one JSON file per entry in a shared directory.
 *
 * Several processes may open the same directory. An entry becomes visible atomically
 * (write to a temp file, then rename), a listing skips entries deleted underneath it,
 * and deleting a missing entry succeeds.
 *
 * File layout: <root>/<type label>/<entry id>.json holding
 *   {"id": ..., "labels": {...}, "modTime": <ms since epoch>, "payload": {...}}
 *
 * The type label is read from the directory name, so a query naming a type only opens
 * files of that type. A file whose envelope cannot be parsed is listed with the labels
 * its location implies ({type: <dir>}) and getEntry reports it as MalformedInput.
 */
class DirectoryManifestIndex final : public ManifestIndex {
public:
    struct Options {
        std::filesystem::path root;
        bool                  fsync = true;

        // Applies MANIFESTSPACE_FSYNC ("0"/"false" disables fsync).
        [[nodiscard]] static auto fromEnvironment(std::filesystem::path root) -> Options;
    };

    // Creates the root directory when missing.
    [[nodiscard]] static auto open(Options options) -> Expected<std::unique_ptr<DirectoryManifestIndex>>;

    [[nodiscard]] auto findEntries(Labels const& labels) -> Expected<std::vector<EntryMetadata>> override;
    [[nodiscard]] auto getEntry(EntryID const& id) -> Expected<Entry> override;
    [[nodiscard]] auto putEntry(Labels const& labels, nlohmann::json const& payload) -> Expected<EntryID> override;
    [[nodiscard]] auto deleteEntry(EntryID const& id) -> Expected<void> override;

    [[nodiscard]] auto root() const -> std::filesystem::path const& { return options.root; }

    // Type labels usable as a directory name: [A-Za-z0-9._-], not starting with '.'.
    [[nodiscard]] static auto isStorableType(std::string_view type) -> bool;

private:
    struct Location {
        std::filesystem::path path;
        std::string           type;
    };

    explicit DirectoryManifestIndex(Options options);

    [[nodiscard]] auto entryPath(std::string_view type, EntryID const& id) const -> std::filesystem::path;
    [[nodiscard]] auto listTypes() const -> Expected<std::vector<std::string>>;
    [[nodiscard]] auto locate(EntryID const& id) const -> Expected<std::optional<Location>>;
    [[nodiscard]] auto collectEntries(std::string const& type, Labels const& labels, std::vector<EntryMetadata>& matches) const
        -> Expected<void>;

    Options options;
};

} // namespace MS::Manifest
