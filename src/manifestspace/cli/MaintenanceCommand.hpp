#pragma once

#include "core/Error.hpp"
#include "maintenance/Params.hpp"
#include "repo/ClientOptions.hpp"
#include "repo/Repository.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace MS::CLI {

enum class MaintenanceCommandKind {
    Info,
    Has,
    Set,
};

// Changes requested by `set`; unset fields keep their current value.
struct SetOptions {
    std::optional<std::string>              owner;
    std::optional<bool>                     enableQuick;
    std::optional<std::chrono::nanoseconds> quickInterval;
    std::optional<bool>                     enableFull;
    std::optional<std::chrono::nanoseconds> fullInterval;
    std::optional<std::int64_t>             maxRetainedLogCount;
    std::optional<std::chrono::nanoseconds> maxRetainedLogAge;
    std::optional<std::int64_t>             maxTotalRetainedLogSizeMB;
};

struct MaintenanceCliOptions {
    bool                                 show_help = false;
    std::optional<MaintenanceCommandKind> command;
    std::optional<std::filesystem::path> repo;
    SetOptions                           set;
};

// Parses "[--repo <dir>] <info|has|set> [set flags]". Errors are reported on stderr.
[[nodiscard]] auto parseMaintenanceCli(int argc, char** argv) -> std::optional<MaintenanceCliOptions>;

void printMaintenanceUsage(std::ostream& out);

/**
 * Applies `options` to `params`. "me" as owner resolves to `client.usernameAtHost()`.
 * Returns whether anything changed; an out of range value is MalformedInput.
 */
[[nodiscard]] auto applySetOptions(Maintenance::Params& params,
                                   SetOptions const& options,
                                   ClientOptions const& client,
                                   std::ostream& out) -> Expected<bool>;

// Human readable report printed by `info`.
void printParamsInfo(std::ostream& out, Maintenance::Params const& params, bool stored, bool ownedByThisUser);

// Runs one command against `repository`, printing to `out`. Returns the process exit code.
[[nodiscard]] auto runMaintenanceCommand(MaintenanceCliOptions const& options,
                                         Repository const& repository,
                                         std::ostream& out,
                                         std::ostream& err) -> int;

} // namespace MS::CLI
