#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace MS::Maintenance {

// How often a maintenance cycle (quick or full) runs.
struct CycleParams {
    bool                     enabled  = false;
    std::chrono::nanoseconds interval{0};

    auto operator==(CycleParams const&) const -> bool = default;
};

// Retention limits for maintenance logs. Zero means "no limit" for each field.
struct LogRetentionOptions {
    std::int64_t             maxTotalSize = 0;
    int                      maxCount     = 0;
    std::chrono::nanoseconds maxAge{0};

    // Returns the defaults when no limit at all is set.
    [[nodiscard]] auto orDefault() const -> LogRetentionOptions;

    auto operator==(LogRetentionOptions const&) const -> bool = default;
};

/**
 * Repository-wide maintenance configuration, persisted as a JSON manifest payload:
 *
 *   {"owner": "user@host",
 *    "quick": {"enabled": true, "interval": <ns>},
 *    "full":  {"enabled": true, "interval": <ns>},
 *    "logRetention": {"maxTotalSize": <bytes>, "maxCount": <n>, "maxAge": <ns>}}
 *
 * `owner` names the client expected to run maintenance. It is advisory and grants no
 * exclusivity.
 */
struct Params {
    std::string         owner;
    CycleParams         quickCycle;
    CycleParams         fullCycle;
    LogRetentionOptions logRetention;

    [[nodiscard]] auto isOwnedBy(std::string const& usernameAtHost) const -> bool { return owner == usernameAtHost; }

    auto operator==(Params const&) const -> bool = default;
};

inline constexpr std::chrono::hours kDefaultQuickInterval{1};
inline constexpr std::chrono::hours kDefaultFullInterval{24};

[[nodiscard]] auto defaultLogRetention() -> LogRetentionOptions;

// Quick cycle every hour, full cycle every 24 hours, default log retention, no owner.
[[nodiscard]] auto defaultParams() -> Params;

// Rejects negative intervals and negative retention limits.
[[nodiscard]] auto validateParams(Params const& params) -> Expected<void>;

[[nodiscard]] auto paramsToJson(Params const& params) -> nlohmann::json;
[[nodiscard]] auto paramsFromJson(nlohmann::json const& json) -> Expected<Params>;

} // namespace MS::Maintenance
