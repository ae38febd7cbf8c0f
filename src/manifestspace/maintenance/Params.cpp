#include "maintenance/Params.hpp"

#include <limits>
#include <string_view>
#include <utility>

namespace MS::Maintenance {
namespace {

using Json = nlohmann::json;

constexpr std::int64_t kDefaultMaxTotalLogSize = std::int64_t{1} << 30;
constexpr int          kDefaultMaxLogCount     = 10000;
constexpr auto         kDefaultMaxLogAge       = std::chrono::hours{30 * 24};

[[nodiscard]] auto make_error(std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    message.append(": ");
    message.append(detail);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

[[nodiscard]] auto field_name(std::string_view parent, char const* key) -> std::string {
    if (parent.empty())
        return key;
    return std::string(parent) + "." + key;
}

// Members absent from the payload decode to their zero value.
[[nodiscard]] auto read_boolean(Json const& json, std::string_view parent, char const* key) -> Expected<bool> {
    if (auto it = json.find(key); it != json.end() && !it->is_null()) {
        if (!it->is_boolean())
            return std::unexpected(make_error(field_name(parent, key), "must be a bool"));
        return it->get<bool>();
    }
    return false;
}

[[nodiscard]] auto read_int64(Json const& json, std::string_view parent, char const* key) -> Expected<std::int64_t> {
    if (auto it = json.find(key); it != json.end() && !it->is_null()) {
        if (it->is_number_unsigned()) {
            auto value = it->get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                return std::unexpected(make_error(field_name(parent, key), "out of range"));
            return static_cast<std::int64_t>(value);
        }
        if (it->is_number_integer())
            return it->get<std::int64_t>();
        return std::unexpected(make_error(field_name(parent, key), "must be an integer"));
    }
    return std::int64_t{0};
}

[[nodiscard]] auto read_string(Json const& json, char const* key) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end() && !it->is_null()) {
        if (!it->is_string())
            return std::unexpected(make_error(key, "must be a string"));
        return it->get<std::string>();
    }
    return std::string{};
}

[[nodiscard]] auto ensure_object(Json const& json, std::string_view context) -> Expected<void> {
    if (!json.is_object())
        return std::unexpected(make_error(context, "must be a JSON object"));
    return {};
}

[[nodiscard]] auto cycle_to_json(CycleParams const& cycle) -> Json {
    return Json{{"enabled", cycle.enabled}, {"interval", cycle.interval.count()}};
}

[[nodiscard]] auto cycle_from_json(Json const& json, char const* key) -> Expected<CycleParams> {
    CycleParams cycle;
    auto        it = json.find(key);
    if (it == json.end() || it->is_null())
        return cycle;
    if (auto ensure = ensure_object(*it, key); !ensure)
        return std::unexpected(ensure.error());

    auto enabled = read_boolean(*it, key, "enabled");
    if (!enabled)
        return std::unexpected(enabled.error());
    auto interval = read_int64(*it, key, "interval");
    if (!interval)
        return std::unexpected(interval.error());

    cycle.enabled  = *enabled;
    cycle.interval = std::chrono::nanoseconds{*interval};
    return cycle;
}

[[nodiscard]] auto retention_to_json(LogRetentionOptions const& retention) -> Json {
    return Json{{"maxTotalSize", retention.maxTotalSize},
                {"maxCount", retention.maxCount},
                {"maxAge", retention.maxAge.count()}};
}

[[nodiscard]] auto retention_from_json(Json const& json) -> Expected<LogRetentionOptions> {
    constexpr char const* key = "logRetention";
    LogRetentionOptions   retention;
    auto                  it = json.find(key);
    if (it == json.end() || it->is_null())
        return retention;
    if (auto ensure = ensure_object(*it, key); !ensure)
        return std::unexpected(ensure.error());

    auto maxTotalSize = read_int64(*it, key, "maxTotalSize");
    if (!maxTotalSize)
        return std::unexpected(maxTotalSize.error());
    auto maxCount = read_int64(*it, key, "maxCount");
    if (!maxCount)
        return std::unexpected(maxCount.error());
    if (*maxCount > std::numeric_limits<int>::max() || *maxCount < std::numeric_limits<int>::min())
        return std::unexpected(make_error("logRetention.maxCount", "out of range"));
    auto maxAge = read_int64(*it, key, "maxAge");
    if (!maxAge)
        return std::unexpected(maxAge.error());

    retention.maxTotalSize = *maxTotalSize;
    retention.maxCount     = static_cast<int>(*maxCount);
    retention.maxAge       = std::chrono::nanoseconds{*maxAge};
    return retention;
}

} // namespace

auto LogRetentionOptions::orDefault() const -> LogRetentionOptions {
    if (maxTotalSize == 0 && maxCount == 0 && maxAge.count() == 0)
        return defaultLogRetention();
    return *this;
}

auto defaultLogRetention() -> LogRetentionOptions {
    return LogRetentionOptions{.maxTotalSize = kDefaultMaxTotalLogSize,
                               .maxCount     = kDefaultMaxLogCount,
                               .maxAge       = kDefaultMaxLogAge};
}

auto defaultParams() -> Params {
    Params params;
    params.fullCycle    = CycleParams{.enabled = true, .interval = kDefaultFullInterval};
    params.quickCycle   = CycleParams{.enabled = true, .interval = kDefaultQuickInterval};
    params.logRetention = defaultLogRetention();
    return params;
}

auto validateParams(Params const& params) -> Expected<void> {
    if (params.quickCycle.interval.count() < 0)
        return std::unexpected(make_error("quick.interval", "must not be negative"));
    if (params.fullCycle.interval.count() < 0)
        return std::unexpected(make_error("full.interval", "must not be negative"));
    if (params.logRetention.maxTotalSize < 0)
        return std::unexpected(make_error("logRetention.maxTotalSize", "must not be negative"));
    if (params.logRetention.maxCount < 0)
        return std::unexpected(make_error("logRetention.maxCount", "must not be negative"));
    if (params.logRetention.maxAge.count() < 0)
        return std::unexpected(make_error("logRetention.maxAge", "must not be negative"));
    return {};
}

auto paramsToJson(Params const& params) -> nlohmann::json {
    return Json{{"owner", params.owner},
                {"quick", cycle_to_json(params.quickCycle)},
                {"full", cycle_to_json(params.fullCycle)},
                {"logRetention", retention_to_json(params.logRetention)}};
}

auto paramsFromJson(nlohmann::json const& json) -> Expected<Params> {
    if (auto ensure = ensure_object(json, "maintenance params"); !ensure)
        return std::unexpected(ensure.error());

    auto owner = read_string(json, "owner");
    if (!owner)
        return std::unexpected(owner.error());
    auto quick = cycle_from_json(json, "quick");
    if (!quick)
        return std::unexpected(quick.error());
    auto full = cycle_from_json(json, "full");
    if (!full)
        return std::unexpected(full.error());
    auto retention = retention_from_json(json);
    if (!retention)
        return std::unexpected(retention.error());

    Params params;
    params.owner        = std::move(*owner);
    params.quickCycle   = *quick;
    params.fullCycle    = *full;
    params.logRetention = *retention;
    return params;
}

} // namespace MS::Maintenance
