#include "cli/MaintenanceCommand.hpp"

#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"
#include "maintenance/MaintenanceParams.hpp"
#include "utils/Duration.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <limits>
#include <string_view>

namespace MS::CLI {

namespace {

constexpr std::int64_t kBytesPerMB = std::int64_t{1} << 20;

auto parseCommandName(std::string_view token) -> std::optional<MaintenanceCommandKind> {
    if (token == "info")
        return MaintenanceCommandKind::Info;
    if (token == "has")
        return MaintenanceCommandKind::Has;
    if (token == "set")
        return MaintenanceCommandKind::Set;
    return std::nullopt;
}

auto durationOption(std::string name, std::optional<std::chrono::nanoseconds>& target) -> CommandLine::ValueHandler {
    return [name = std::move(name), &target](std::string_view value) -> Expected<void> {
        auto parsed = Utils::parseDuration(value);
        if (!parsed) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "option '" + name + "': " + parsed.error().message.value_or("invalid duration")});
        }
        target = *parsed;
        return {};
    };
}

auto requireText(std::string name, std::string what, std::function<void(std::string_view)> store) -> CommandLine::ValueHandler {
    return [name = std::move(name), what = std::move(what), store = std::move(store)](std::string_view value) -> Expected<void> {
        if (value.empty())
            return std::unexpected(Error{Error::Code::MalformedInput, "option '" + name + "' requires " + what});
        store(value);
        return {};
    };
}

auto reportUsageError(std::string const& message) -> void {
    ms_log(message, LogTag::Cli, LogTag::Failure);
    std::cerr << "manifestspace_maintenance: " << message << "\n";
}

auto yesNo(bool value) -> char const* {
    return value ? "yes" : "no";
}

void printCycle(std::ostream& out, char const* title, Maintenance::CycleParams const& cycle) {
    out << title << ":\n";
    out << "  scheduled: " << yesNo(cycle.enabled) << "\n";
    out << "  interval: " << Utils::formatDuration(cycle.interval) << "\n";
}

} // namespace

void printMaintenanceUsage(std::ostream& out) {
    out << "Usage: manifestspace_maintenance [--repo <dir>] <command> [options]\n"
           "\n"
           "Commands:\n"
           "  info    show the effective maintenance parameters\n"
           "  has     report whether maintenance parameters were ever stored\n"
           "  set     change maintenance parameters\n"
           "\n"
           "Options for set:\n"
           "  --owner=<user@host|me>\n"
           "  --enable-quick[=true|false]      --quick-interval=<duration>\n"
           "  --enable-full[=true|false]       --full-interval=<duration>\n"
           "  --max-retained-log-count=<n>     --max-retained-log-age=<duration>\n"
           "  --max-total-retained-log-size-mb=<n>\n"
           "\n"
           "The repository directory defaults to $MANIFESTSPACE_REPO.\n";
}

auto parseMaintenanceCli(int argc, char** argv) -> std::optional<MaintenanceCliOptions> {
    MaintenanceCliOptions options{};
    auto&                 set = options.set;

    CommandLine cli;
    cli.flag("--help", [&] { options.show_help = true; })
        .alias("-h", "--help")
        .value("--repo", requireText("--repo", "a directory", [&](std::string_view v) { options.repo = std::filesystem::path(v); }))
        .value("--owner", requireText("--owner", "user@host or 'me'", [&](std::string_view v) { set.owner = std::string(v); }))
        .boolean("--enable-quick", [&](bool v) { set.enableQuick = v; })
        .boolean("--enable-full", [&](bool v) { set.enableFull = v; })
        .value("--quick-interval", durationOption("--quick-interval", set.quickInterval))
        .value("--full-interval", durationOption("--full-interval", set.fullInterval))
        .value("--max-retained-log-age", durationOption("--max-retained-log-age", set.maxRetainedLogAge))
        .integer("--max-retained-log-count", [&](std::int64_t v) { set.maxRetainedLogCount = v; })
        .integer("--max-total-retained-log-size-mb", [&](std::int64_t v) { set.maxTotalRetainedLogSizeMB = v; });

    auto positionals = cli.parse(argc, argv);
    if (!positionals) {
        reportUsageError(positionals.error().message.value_or(describeError(positionals.error())));
        return std::nullopt;
    }
    if (positionals->empty())
        return options;

    auto const& name = positionals->front();
    auto command     = parseCommandName(name);
    if (!command) {
        reportUsageError("unknown command '" + name + "'");
        return std::nullopt;
    }
    if (positionals->size() > 1) {
        reportUsageError("unexpected argument '" + (*positionals)[1] + "'");
        return std::nullopt;
    }
    options.command = *command;
    return options;
}

auto applySetOptions(Maintenance::Params& params,
                     SetOptions const& options,
                     ClientOptions const& client,
                     std::ostream& out) -> Expected<bool> {
    bool changed = false;

    if (options.owner) {
        auto owner = *options.owner == "me" ? client.usernameAtHost() : *options.owner;
        out << "Setting maintenance owner to " << owner << ".\n";
        params.owner = std::move(owner);
        changed      = true;
    }
    if (options.enableQuick) {
        out << "Setting quick maintenance cycle enabled to " << yesNo(*options.enableQuick) << ".\n";
        params.quickCycle.enabled = *options.enableQuick;
        changed                   = true;
    }
    if (options.quickInterval) {
        out << "Setting quick maintenance cycle interval to " << Utils::formatDuration(*options.quickInterval) << ".\n";
        params.quickCycle.interval = *options.quickInterval;
        changed                    = true;
    }
    if (options.enableFull) {
        out << "Setting full maintenance cycle enabled to " << yesNo(*options.enableFull) << ".\n";
        params.fullCycle.enabled = *options.enableFull;
        changed                  = true;
    }
    if (options.fullInterval) {
        out << "Setting full maintenance cycle interval to " << Utils::formatDuration(*options.fullInterval) << ".\n";
        params.fullCycle.interval = *options.fullInterval;
        changed                   = true;
    }
    if (options.maxRetainedLogCount) {
        auto count = *options.maxRetainedLogCount;
        if (count < 0 || count > std::numeric_limits<int>::max())
            return std::unexpected(Error{Error::Code::MalformedInput, "--max-retained-log-count out of range"});
        out << "Setting maximum number of retained logs to " << count << ".\n";
        params.logRetention.maxCount = static_cast<int>(count);
        changed                      = true;
    }
    if (options.maxRetainedLogAge) {
        out << "Setting maximum age of retained logs to " << Utils::formatDuration(*options.maxRetainedLogAge) << ".\n";
        params.logRetention.maxAge = *options.maxRetainedLogAge;
        changed                    = true;
    }
    if (options.maxTotalRetainedLogSizeMB) {
        auto mb = *options.maxTotalRetainedLogSizeMB;
        if (mb < 0 || mb > std::numeric_limits<std::int64_t>::max() / kBytesPerMB)
            return std::unexpected(Error{Error::Code::MalformedInput, "--max-total-retained-log-size-mb out of range"});
        out << "Setting maximum total size of retained logs to " << mb << " MB.\n";
        params.logRetention.maxTotalSize = mb * kBytesPerMB;
        changed                          = true;
    }

    return changed;
}

void printParamsInfo(std::ostream& out, Maintenance::Params const& params, bool stored, bool ownedByThisUser) {
    out << "Owner: " << (params.owner.empty() ? std::string{"(none)"} : params.owner) << "\n";
    out << "Owned by this client: " << yesNo(ownedByThisUser) << "\n";
    if (!stored)
        out << "Parameters: defaults (never set)\n";
    printCycle(out, "Quick Cycle", params.quickCycle);
    printCycle(out, "Full Cycle", params.fullCycle);

    auto retention = params.logRetention.orDefault();
    out << "Log Retention:\n";
    out << "  max count: " << retention.maxCount << "\n";
    out << "  max age of logs: " << Utils::formatDuration(retention.maxAge) << "\n";
    out << "  max total size: " << retention.maxTotalSize / kBytesPerMB << " MB\n";
}

auto runMaintenanceCommand(MaintenanceCliOptions const& options,
                           Repository const& repository,
                           std::ostream& out,
                           std::ostream& err) -> int {
    if (!options.command) {
        err << "manifestspace_maintenance: missing command\n";
        printMaintenanceUsage(err);
        return EXIT_FAILURE;
    }

    switch (*options.command) {
    case MaintenanceCommandKind::Has: {
        auto has = Maintenance::hasParams(repository);
        if (!has) {
            err << "manifestspace_maintenance: " << describeError(has.error()) << "\n";
            return EXIT_FAILURE;
        }
        out << yesNo(*has) << "\n";
        return EXIT_SUCCESS;
    }
    case MaintenanceCommandKind::Info: {
        auto has = Maintenance::hasParams(repository);
        if (!has) {
            err << "manifestspace_maintenance: " << describeError(has.error()) << "\n";
            return EXIT_FAILURE;
        }
        auto params = Maintenance::getParams(repository);
        if (!params) {
            err << "manifestspace_maintenance: " << describeError(params.error()) << "\n";
            return EXIT_FAILURE;
        }
        auto owned = params->isOwnedBy(repository.clientOptions().usernameAtHost());
        printParamsInfo(out, *params, *has, owned);
        return EXIT_SUCCESS;
    }
    case MaintenanceCommandKind::Set: {
        auto params = Maintenance::getParams(repository);
        if (!params) {
            err << "manifestspace_maintenance: " << describeError(params.error()) << "\n";
            return EXIT_FAILURE;
        }
        auto changed = applySetOptions(*params, options.set, repository.clientOptions(), out);
        if (!changed) {
            err << "manifestspace_maintenance: " << describeError(changed.error()) << "\n";
            return EXIT_FAILURE;
        }
        if (!*changed) {
            err << "manifestspace_maintenance: no changes specified\n";
            return EXIT_FAILURE;
        }
        if (auto stored = Maintenance::setParams(repository, *params); !stored) {
            ms_log("setParams failed: " + describeError(stored.error()), LogTag::Cli, LogTag::Failure);
            err << "manifestspace_maintenance: " << describeError(stored.error()) << "\n";
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }
    }
    return EXIT_FAILURE;
}

} // namespace MS::CLI
