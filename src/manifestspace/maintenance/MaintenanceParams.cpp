#include "maintenance/MaintenanceParams.hpp"

#include "log/TaggedLogger.hpp"
#include "manifest/PickLatest.hpp"

#include <string>

namespace MS::Maintenance {

auto manifestLabels() -> Manifest::Labels {
    return Manifest::Labels{{Manifest::kTypeLabel, kManifestType}};
}

auto findParamsEntries(Repository const& repository) -> Expected<std::vector<Manifest::EntryMetadata>> {
    auto entries = repository.manifests().findEntries(manifestLabels());
    if (!entries)
        return std::unexpected(wrapError(entries.error(), Error::Code::LookupFailed, "looking for maintenance manifest"));
    return entries;
}

auto hasParams(Repository const& repository) -> Expected<bool> {
    auto entries = findParamsEntries(repository);
    if (!entries)
        return std::unexpected(entries.error());
    return !entries->empty();
}

auto getParams(Repository const& repository) -> Expected<Params> {
    auto entries = findParamsEntries(repository);
    if (!entries)
        return std::unexpected(entries.error());

    if (entries->empty()) {
        ms_log("No maintenance manifest, using defaults", LogTag::Maintenance);
        return defaultParams();
    }

    // Two clients creating the manifest at about the same time leave duplicates; any
    // consistent choice among them is acceptable.
    auto picked = Manifest::pickLatestID(*entries);
    if (!picked)
        return std::unexpected(wrapError(picked.error(), Error::Code::LookupFailed, "looking for maintenance manifest"));
    if (entries->size() > 1) {
        ms_log("Found " + std::to_string(entries->size()) + " maintenance manifests, using " + *picked, LogTag::Maintenance);
    }

    auto entry = repository.manifests().getEntry(*picked);
    if (!entry)
        return std::unexpected(wrapError(entry.error(), Error::Code::LoadFailed, "loading maintenance manifest"));

    auto params = paramsFromJson(entry->payload);
    if (!params)
        return std::unexpected(wrapError(params.error(), Error::Code::LoadFailed, "loading maintenance manifest"));
    return params;
}

auto isOwnedByThisUser(Repository const& repository) -> Expected<bool> {
    auto params = getParams(repository);
    if (!params) {
        auto const& inner = params.error();
        return std::unexpected(wrapError(inner, inner.code, "getting maintenance params"));
    }
    return params->isOwnedBy(repository.clientOptions().usernameAtHost());
}

auto commitParams(Repository const& repository, Params const& params) -> Expected<Manifest::EntryID> {
    auto id = repository.manifests().putEntry(manifestLabels(), paramsToJson(params));
    if (!id)
        return std::unexpected(wrapError(id.error(), Error::Code::CommitFailed, "put maintenance manifest"));
    ms_log("Committed maintenance manifest " + *id, LogTag::Maintenance);
    return id;
}

auto retireEntries(Repository const& repository, std::span<Manifest::EntryMetadata const> stale) -> Expected<void> {
    for (auto const& metadata : stale) {
        if (auto deleted = repository.manifests().deleteEntry(metadata.id); !deleted) {
            return std::unexpected(
                wrapError(deleted.error(), Error::Code::RetireFailed, "delete maintenance manifest " + metadata.id));
        }
        ms_log("Retired maintenance manifest " + metadata.id, LogTag::Maintenance);
    }
    return {};
}

auto setParams(Repository const& repository, Params const& params) -> Expected<void> {
    if (auto valid = validateParams(params); !valid)
        return std::unexpected(valid.error());

    auto previous = findParamsEntries(repository);
    if (!previous)
        return std::unexpected(previous.error());

    auto committed = commitParams(repository, params);
    if (!committed)
        return std::unexpected(committed.error());

    return retireEntries(repository, *previous);
}

} // namespace MS::Maintenance
