#include "manifest/DirectoryManifestIndex.hpp"

#include "log/TaggedLogger.hpp"
#include "manifest/EntryID.hpp"
#include "storage/FileUtils.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace MS::Manifest {
namespace {

using Json = nlohmann::json;

constexpr std::string_view kEntryExtension = ".json";
constexpr int              kMaxIdAttempts  = 8;

[[nodiscard]] auto make_error(Error::Code code, std::string_view context, std::string_view detail) -> Error {
    std::string message;
    message.reserve(context.size() + detail.size() + 2);
    message.append(context);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

[[nodiscard]] auto to_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] auto labels_from_json(Json const& json, std::string_view context) -> Expected<Labels> {
    if (!json.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context, "labels must be a JSON object"));
    }
    Labels labels;
    for (auto const& [key, value] : json.items()) {
        if (!value.is_string()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, context, "label '" + key + "' must be a string"));
        }
        labels.emplace(key, value.get<std::string>());
    }
    return labels;
}

[[nodiscard]] auto entry_to_json(EntryMetadata const& metadata, Json const& payload) -> Json {
    Json labels = Json::object();
    for (auto const& [key, value] : metadata.labels)
        labels[key] = value;
    return Json{{"id", metadata.id},
                {"labels", std::move(labels)},
                {"modTime", to_millis(metadata.modTime)},
                {"payload", payload}};
}

[[nodiscard]] auto entry_from_text(std::string const& text, EntryID const& expectedId, std::string_view expectedType)
    -> Expected<Entry> {
    auto context = "manifest entry " + expectedId;
    auto json    = Json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context, "not a JSON object"));
    }

    auto idIt = json.find("id");
    if (idIt == json.end() || !idIt->is_string() || idIt->get<std::string>() != expectedId) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context, "id does not match file name"));
    }

    auto labelsIt = json.find("labels");
    if (labelsIt == json.end()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context, "labels are required"));
    }
    auto labels = labels_from_json(*labelsIt, context);
    if (!labels)
        return std::unexpected(labels.error());
    if (auto type = labels->find(kTypeLabel); type == labels->end() || type->second != expectedType) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context, "type label does not match directory"));
    }

    auto modTimeIt = json.find("modTime");
    if (modTimeIt == json.end() || !modTimeIt->is_number_integer()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context, "modTime must be an integer"));
    }

    auto payloadIt = json.find("payload");
    if (payloadIt == json.end()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context, "payload is required"));
    }

    Entry entry;
    entry.metadata.id      = expectedId;
    entry.metadata.labels  = std::move(*labels);
    entry.metadata.modTime = std::chrono::system_clock::time_point{std::chrono::milliseconds{modTimeIt->get<std::int64_t>()}};
    entry.payload          = std::move(*payloadIt);
    entry.metadata.length  = entry.payload.dump().size();
    return entry;
}

[[nodiscard]] auto normalize_flag(std::string_view raw) -> std::string {
    std::string normalized;
    normalized.reserve(raw.size());
    for (unsigned char ch : raw) {
        if (std::isspace(ch) != 0)
            continue;
        normalized.push_back(static_cast<char>(std::tolower(ch)));
    }
    return normalized;
}

} // namespace

auto DirectoryManifestIndex::Options::fromEnvironment(std::filesystem::path root) -> Options {
    Options options;
    options.root = std::move(root);
    if (auto* raw = std::getenv("MANIFESTSPACE_FSYNC")) {
        auto normalized = normalize_flag(raw);
        if (normalized == "0" || normalized == "false" || normalized == "off")
            options.fsync = false;
    }
    return options;
}

auto DirectoryManifestIndex::isStorableType(std::string_view type) -> bool {
    if (type.empty() || type.front() == '.')
        return false;
    for (unsigned char ch : type) {
        if (std::isalnum(ch) == 0 && ch != '-' && ch != '_' && ch != '.')
            return false;
    }
    return true;
}

DirectoryManifestIndex::DirectoryManifestIndex(Options options)
    : options(std::move(options)) {}

auto DirectoryManifestIndex::open(Options options) -> Expected<std::unique_ptr<DirectoryManifestIndex>> {
    if (options.root.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "manifest directory must not be empty"});
    }
    std::error_code ec;
    std::filesystem::create_directories(options.root, ec);
    if (ec) {
        return std::unexpected(make_error(Error::Code::IOFailure, "Failed to create manifest directory " + options.root.string(), ec.message()));
    }
    if (!std::filesystem::is_directory(options.root, ec)) {
        return std::unexpected(make_error(Error::Code::MalformedInput, options.root.string(), "is not a directory"));
    }
    ms_log("Opened manifest directory " + options.root.string(), LogTag::Directory);
    return std::unique_ptr<DirectoryManifestIndex>(new DirectoryManifestIndex(std::move(options)));
}

auto DirectoryManifestIndex::entryPath(std::string_view type, EntryID const& id) const -> std::filesystem::path {
    auto path = this->options.root / type / id;
    path += kEntryExtension;
    return path;
}

auto DirectoryManifestIndex::listTypes() const -> Expected<std::vector<std::string>> {
    std::error_code ec;
    auto            it = std::filesystem::directory_iterator(this->options.root, ec);
    if (ec) {
        return std::unexpected(make_error(Error::Code::IOFailure, "Failed to list " + this->options.root.string(), ec.message()));
    }
    std::vector<std::string> types;
    for (auto const end = std::filesystem::directory_iterator{}; it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_directory(typeEc))
            continue;
        auto name = it->path().filename().string();
        if (isStorableType(name))
            types.push_back(std::move(name));
    }
    if (ec) {
        return std::unexpected(make_error(Error::Code::IOFailure, "Failed to list " + this->options.root.string(), ec.message()));
    }
    return types;
}

auto DirectoryManifestIndex::locate(EntryID const& id) const -> Expected<std::optional<Location>> {
    auto types = this->listTypes();
    if (!types)
        return std::unexpected(types.error());
    for (auto& type : *types) {
        auto            path = this->entryPath(type, id);
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
            return Location{.path = std::move(path), .type = std::move(type)};
        if (ec) {
            return std::unexpected(make_error(Error::Code::IOFailure, "Failed to stat " + path.string(), ec.message()));
        }
    }
    return std::optional<Location>{};
}

auto DirectoryManifestIndex::collectEntries(std::string const& type,
                                            Labels const& labels,
                                            std::vector<EntryMetadata>& matches) const -> Expected<void> {
    auto            dir = this->options.root / type;
    std::error_code ec;
    auto            it = std::filesystem::directory_iterator(dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory)
            return {};
        return std::unexpected(make_error(Error::Code::IOFailure, "Failed to list " + dir.string(), ec.message()));
    }

    for (auto const end = std::filesystem::directory_iterator{}; it != end; it.increment(ec)) {
        auto const& path = it->path();
        if (path.extension() != kEntryExtension)
            continue;
        auto id = path.stem().string();
        if (!isValidEntryID(id))
            continue;

        auto text = Storage::readTextFile(path);
        if (!text) {
            // Retired by another writer between listing and reading.
            if (text.error().code == Error::Code::NotFound)
                continue;
            return std::unexpected(text.error());
        }

        EntryMetadata metadata;
        if (auto entry = entry_from_text(*text, id, type)) {
            metadata = std::move(entry->metadata);
        } else {
            // Listed with what its location tells; getEntry reports the damage.
            ms_log("Unreadable manifest entry " + path.string() + ": " + describeError(entry.error()), LogTag::Directory, LogTag::Warning);
            metadata.id     = id;
            metadata.labels = Labels{{kTypeLabel, type}};
            metadata.length = text->size();
        }
        if (labelsMatch(metadata.labels, labels))
            matches.push_back(std::move(metadata));
    }
    if (ec) {
        return std::unexpected(make_error(Error::Code::IOFailure, "Failed to list " + dir.string(), ec.message()));
    }
    return {};
}

auto DirectoryManifestIndex::findEntries(Labels const& labels) -> Expected<std::vector<EntryMetadata>> {
    std::vector<std::string> types;
    if (auto type = labels.find(kTypeLabel); type != labels.end()) {
        // Nothing of this type can have been stored.
        if (!isStorableType(type->second))
            return std::vector<EntryMetadata>{};
        types.push_back(type->second);
    } else {
        auto listed = this->listTypes();
        if (!listed)
            return std::unexpected(listed.error());
        types = std::move(*listed);
    }

    std::vector<EntryMetadata> matches;
    for (auto const& type : types) {
        if (auto collected = this->collectEntries(type, labels, matches); !collected)
            return std::unexpected(collected.error());
    }
    ms_log("findEntries matched " + std::to_string(matches.size()) + " entries", LogTag::Directory);
    return matches;
}

auto DirectoryManifestIndex::getEntry(EntryID const& id) -> Expected<Entry> {
    if (!isValidEntryID(id)) {
        return std::unexpected(make_error(Error::Code::NotFound, "manifest entry not found", id));
    }
    auto location = this->locate(id);
    if (!location)
        return std::unexpected(location.error());
    if (!*location) {
        return std::unexpected(make_error(Error::Code::NotFound, "manifest entry not found", id));
    }

    auto text = Storage::readTextFile((*location)->path);
    if (!text) {
        if (text.error().code == Error::Code::NotFound)
            return std::unexpected(make_error(Error::Code::NotFound, "manifest entry not found", id));
        return std::unexpected(text.error());
    }
    return entry_from_text(*text, id, (*location)->type);
}

auto DirectoryManifestIndex::putEntry(Labels const& labels, nlohmann::json const& payload) -> Expected<EntryID> {
    if (auto valid = validateLabels(labels); !valid)
        return std::unexpected(valid.error());
    auto const& type = labels.at(kTypeLabel);
    if (!isStorableType(type)) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "manifest type '" + type + "'", "not usable as a directory name"));
    }

    auto            dir = this->options.root / type;
    std::error_code ec;
    auto            created = std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(make_error(Error::Code::IOFailure, "Failed to create " + dir.string(), ec.message()));
    }
    if (created && this->options.fsync) {
        if (auto synced = Storage::fsyncDirectory(this->options.root); !synced)
            return std::unexpected(synced.error());
    }

    EntryMetadata metadata;
    metadata.labels  = labels;
    metadata.modTime = std::chrono::system_clock::now();

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        metadata.id = generateEntryID(metadata.modTime);
        auto taken  = this->locate(metadata.id);
        if (!taken)
            return std::unexpected(taken.error());
        if (*taken)
            continue;

        auto text = entry_to_json(metadata, payload).dump();
        if (auto written = Storage::writeTextFileAtomic(this->entryPath(type, metadata.id), text, this->options.fsync); !written)
            return std::unexpected(written.error());

        ms_log("putEntry created " + type + "/" + metadata.id, LogTag::Directory);
        return metadata.id;
    }
    return std::unexpected(Error{Error::Code::UnknownError, "unable to allocate a unique manifest entry id"});
}

auto DirectoryManifestIndex::deleteEntry(EntryID const& id) -> Expected<void> {
    if (!isValidEntryID(id)) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "invalid manifest entry id", id));
    }
    auto location = this->locate(id);
    if (!location)
        return std::unexpected(location.error());
    if (!*location) {
        ms_log("deleteEntry " + id + " already absent", LogTag::Directory);
        return {};
    }
    auto removed = Storage::removeFile((*location)->path);
    if (!removed)
        return std::unexpected(removed.error());
    ms_log("deleteEntry " + id + (*removed ? " removed" : " already absent"), LogTag::Directory);
    return {};
}

} // namespace MS::Manifest
