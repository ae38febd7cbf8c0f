#include <doctest/doctest.h>

#include <manifestspace/manifest/PickLatest.hpp>

#include <algorithm>
#include <vector>

using namespace MS;
using namespace MS::Manifest;

namespace {
auto metadata(EntryID id) -> EntryMetadata {
    EntryMetadata md;
    md.id     = std::move(id);
    md.labels = {{kTypeLabel, "maintenance"}};
    return md;
}
} // namespace

TEST_SUITE("manifest.picklatest") {
TEST_CASE("picks the greatest id") {
    std::vector<EntryMetadata> entries{metadata("b"), metadata("c"), metadata("a")};
    auto picked = pickLatestID(entries);
    REQUIRE(picked.has_value());
    CHECK(*picked == "c");
}

TEST_CASE("result does not depend on input order") {
    std::vector<EntryMetadata> entries{metadata("0001"), metadata("0003"), metadata("0002"), metadata("0000")};
    std::sort(entries.begin(), entries.end(), [](auto const& l, auto const& r) { return l.id < r.id; });
    do {
        auto picked = pickLatestID(entries);
        REQUIRE(picked.has_value());
        CHECK(*picked == "0003");
    } while (std::next_permutation(entries.begin(), entries.end(), [](auto const& l, auto const& r) { return l.id < r.id; }));
}

TEST_CASE("single entry is returned as is") {
    std::vector<EntryMetadata> entries{metadata("only")};
    auto picked = pickLatestID(entries);
    REQUIRE(picked.has_value());
    CHECK(*picked == "only");
}

TEST_CASE("empty input is NotFound") {
    std::vector<EntryMetadata> entries;
    auto picked = pickLatestID(entries);
    REQUIRE_FALSE(picked.has_value());
    CHECK(picked.error().code == Error::Code::NotFound);
}
}
