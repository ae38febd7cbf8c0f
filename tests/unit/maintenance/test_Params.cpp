#include <doctest/doctest.h>

#include <manifestspace/maintenance/Params.hpp>

#include <chrono>

using namespace MS;
using namespace MS::Maintenance;
using namespace std::chrono_literals;

TEST_SUITE("maintenance.params") {
TEST_CASE("defaults") {
    auto params = defaultParams();
    CHECK(params.owner.empty());
    CHECK(params.quickCycle.enabled);
    CHECK(params.quickCycle.interval == 1h);
    CHECK(params.fullCycle.enabled);
    CHECK(params.fullCycle.interval == 24h);
    CHECK(params.logRetention.maxTotalSize == (std::int64_t{1} << 30));
    CHECK(params.logRetention.maxCount == 10000);
    CHECK(params.logRetention.maxAge == std::chrono::hours{30 * 24});
    CHECK(params == defaultParams());
}

TEST_CASE("zero retention falls back to defaults") {
    LogRetentionOptions none;
    CHECK(none.orDefault() == defaultLogRetention());

    LogRetentionOptions countOnly{.maxTotalSize = 0, .maxCount = 5, .maxAge = 0ns};
    CHECK(countOnly.orDefault() == countOnly);
}

TEST_CASE("isOwnedBy compares the full user@host") {
    Params params;
    params.owner = "alice@build-01";
    CHECK(params.isOwnedBy("alice@build-01"));
    CHECK_FALSE(params.isOwnedBy("alice@build-02"));
    CHECK_FALSE(Params{}.isOwnedBy("alice@build-01"));
}

TEST_CASE("json layout") {
    Params params     = defaultParams();
    params.owner      = "alice@build-01";
    params.quickCycle = {.enabled = false, .interval = 90min};
    auto json         = paramsToJson(params);

    CHECK(json["owner"] == "alice@build-01");
    CHECK(json["quick"]["enabled"] == false);
    CHECK(json["quick"]["interval"] == std::chrono::nanoseconds(90min).count());
    CHECK(json["full"]["interval"] == std::chrono::nanoseconds(24h).count());
    CHECK(json["logRetention"]["maxCount"] == 10000);

    auto decoded = paramsFromJson(json);
    REQUIRE(decoded.has_value());
    CHECK(*decoded == params);
}

TEST_CASE("missing members decode to zero values") {
    auto decoded = paramsFromJson(nlohmann::json{{"owner", "bob@ci"}, {"quick", nullptr}});
    REQUIRE(decoded.has_value());
    CHECK(decoded->owner == "bob@ci");
    CHECK(decoded->quickCycle == CycleParams{});
    CHECK(decoded->fullCycle == CycleParams{});
    CHECK(decoded->logRetention == LogRetentionOptions{});
}

TEST_CASE("malformed payloads name the field") {
    SUBCASE("not an object") {
        auto decoded = paramsFromJson(nlohmann::json::array({1, 2}));
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("wrong member type") {
        auto decoded = paramsFromJson(nlohmann::json{{"quick", {{"enabled", "yes"}}}});
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
        CHECK(decoded.error().message.value_or("") == "quick.enabled: must be a bool");
    }
    SUBCASE("owner is not a string") {
        auto decoded = paramsFromJson(nlohmann::json{{"owner", 7}});
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().message.value_or("") == "owner: must be a string");
    }
    SUBCASE("interval is not an integer") {
        auto decoded = paramsFromJson(nlohmann::json{{"full", {{"interval", 1.5}}}});
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().message.value_or("") == "full.interval: must be an integer");
    }
    SUBCASE("retention count overflows int") {
        auto decoded = paramsFromJson(nlohmann::json{{"logRetention", {{"maxCount", std::int64_t{1} << 40}}}});
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("validateParams rejects negative values") {
    CHECK(validateParams(defaultParams()).has_value());
    CHECK(validateParams(Params{}).has_value());

    auto params                 = defaultParams();
    params.quickCycle.interval  = -1s;
    auto invalid                = validateParams(params);
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().code == Error::Code::MalformedInput);

    params                       = defaultParams();
    params.logRetention.maxCount = -3;
    CHECK_FALSE(validateParams(params).has_value());
}
}
