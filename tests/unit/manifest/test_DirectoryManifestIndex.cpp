#include <doctest/doctest.h>

#include "../ManifestTestHelper.hpp"

#include <manifestspace/manifest/DirectoryManifestIndex.hpp>
#include <manifestspace/manifest/EntryID.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace MS;
using namespace MS::Manifest;

namespace {
auto openIndex(std::filesystem::path const& root) -> std::unique_ptr<DirectoryManifestIndex> {
    auto index = DirectoryManifestIndex::open({.root = root, .fsync = false});
    REQUIRE(index.has_value());
    return std::move(*index);
}

void writeRaw(std::filesystem::path const& path, std::string const& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}
} // namespace

TEST_SUITE("manifest.directory") {
TEST_CASE("open creates the root directory") {
    Test::TempDir tmp("ms_dir_open");
    auto root  = tmp.path / "nested" / "manifests";
    auto index = openIndex(root);
    CHECK(std::filesystem::is_directory(root));
    CHECK(index->root() == root);
}

TEST_CASE("open rejects an empty root or a plain file") {
    auto empty = DirectoryManifestIndex::open({});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == Error::Code::MalformedInput);

    Test::TempDir tmp("ms_dir_file");
    auto file = tmp.path / "plain";
    writeRaw(file, "x");
    CHECK_FALSE(DirectoryManifestIndex::open({.root = file, .fsync = false}).has_value());
}

TEST_CASE("entries round trip through the per-type layout") {
    Test::TempDir tmp("ms_dir_roundtrip");
    auto index = openIndex(tmp.path);

    nlohmann::json payload{{"owner", "alice@build-01"}, {"quick", {{"enabled", true}}}};
    auto id = index->putEntry({{kTypeLabel, "maintenance"}}, payload);
    REQUIRE(id.has_value());
    CHECK(isValidEntryID(*id));
    CHECK(std::filesystem::exists(tmp.path / "maintenance" / (*id + ".json")));

    auto entry = index->getEntry(*id);
    REQUIRE(entry.has_value());
    CHECK(entry->payload == payload);
    CHECK(entry->metadata.labels.at(kTypeLabel) == "maintenance");

    auto found = index->findEntries({{kTypeLabel, "maintenance"}});
    REQUIRE(found.has_value());
    REQUIRE(found->size() == 1);
    CHECK(found->front().id == *id);
}

TEST_CASE("queries without a type label span every type") {
    Test::TempDir tmp("ms_dir_alltypes");
    auto index = openIndex(tmp.path);
    auto a     = index->putEntry({{kTypeLabel, "maintenance"}, {"host", "h1"}}, nlohmann::json::object());
    auto b     = index->putEntry({{kTypeLabel, "snapshot"}, {"host", "h1"}}, nlohmann::json::object());
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(index->putEntry({{kTypeLabel, "snapshot"}, {"host", "h2"}}, nlohmann::json::object()).has_value());

    auto h1 = index->findEntries({{"host", "h1"}});
    REQUIRE(h1.has_value());
    CHECK(h1->size() == 2);

    auto all = index->findEntries({});
    REQUIRE(all.has_value());
    CHECK(all->size() == 3);

    auto none = index->findEntries({{kTypeLabel, "../maintenance"}});
    REQUIRE(none.has_value());
    CHECK(none->empty());

    // Ids resolve regardless of which type directory holds them.
    CHECK(index->getEntry(*b).has_value());
    REQUIRE(index->deleteEntry(*b).has_value());
    CHECK_FALSE(std::filesystem::exists(tmp.path / "snapshot" / (*b + ".json")));
}

TEST_CASE("two handles on one directory see each other") {
    Test::TempDir tmp("ms_dir_shared");
    auto writer = openIndex(tmp.path);
    auto reader = openIndex(tmp.path);

    auto id = writer->putEntry({{kTypeLabel, "maintenance"}}, nlohmann::json::object());
    REQUIRE(id.has_value());

    auto seen = reader->findEntries({{kTypeLabel, "maintenance"}});
    REQUIRE(seen.has_value());
    CHECK(seen->size() == 1);

    REQUIRE(reader->deleteEntry(*id).has_value());
    auto gone = writer->getEntry(*id);
    REQUIRE_FALSE(gone.has_value());
    CHECK(gone.error().code == Error::Code::NotFound);
}

TEST_CASE("listing ignores foreign and temporary files") {
    Test::TempDir tmp("ms_dir_foreign");
    auto index = openIndex(tmp.path);
    REQUIRE(index->putEntry({{kTypeLabel, "maintenance"}}, nlohmann::json::object()).has_value());

    writeRaw(tmp.path / "README.txt", "hello");
    writeRaw(tmp.path / "0123456789abcdef0123456789abcdef.json", "{}");
    writeRaw(tmp.path / "maintenance" / "notes.json", "{}");
    writeRaw(tmp.path / "maintenance" / "0123456789abcdef0123456789abcdef.json.tmp", "{partial");
    std::filesystem::create_directories(tmp.path / "maintenance" / "subdir");
    std::filesystem::create_directories(tmp.path / ".hidden");
    writeRaw(tmp.path / ".hidden" / "0123456789abcdef0123456789abcdef.json", "{partial");

    auto found = index->findEntries({{kTypeLabel, "maintenance"}});
    REQUIRE(found.has_value());
    CHECK(found->size() == 1);

    auto all = index->findEntries({});
    REQUIRE(all.has_value());
    CHECK(all->size() == 1);
}

TEST_CASE("types that cannot name a directory are rejected on put") {
    Test::TempDir tmp("ms_dir_badtype");
    auto index = openIndex(tmp.path);
    for (auto type : {"../escape", ".hidden", "a/b", ""}) {
        CAPTURE(type);
        auto id = index->putEntry({{kTypeLabel, type}}, nlohmann::json::object());
        REQUIRE_FALSE(id.has_value());
        CHECK(id.error().code == Error::Code::MalformedInput);
    }
    CHECK(DirectoryManifestIndex::isStorableType("maintenance"));
    CHECK(DirectoryManifestIndex::isStorableType("snapshot-v2.1_x"));
    CHECK_FALSE(std::filesystem::exists(tmp.path.parent_path() / "escape"));
}

TEST_CASE("corrupt entry is listed by its location and unreadable by id") {
    Test::TempDir tmp("ms_dir_corrupt");
    auto index = openIndex(tmp.path);
    auto good  = index->putEntry({{kTypeLabel, "maintenance"}}, nlohmann::json::object());
    REQUIRE(good.has_value());

    EntryID id = "ffffffffffffffffffffffffffffffff";
    writeRaw(tmp.path / "maintenance" / (id + ".json"), "{not json");

    auto found = index->findEntries({{kTypeLabel, "maintenance"}});
    REQUIRE(found.has_value());
    REQUIRE(found->size() == 2);
    for (auto const& md : *found)
        CHECK(md.labels.at(kTypeLabel) == "maintenance");

    // A label the envelope would carry cannot be matched from the location alone.
    auto narrowed = index->findEntries({{kTypeLabel, "maintenance"}, {"host", "h1"}});
    REQUIRE(narrowed.has_value());
    CHECK(narrowed->empty());

    auto entry = index->getEntry(id);
    REQUIRE_FALSE(entry.has_value());
    CHECK(entry.error().code == Error::Code::MalformedInput);

    // The damaged file can still be retired.
    REQUIRE(index->deleteEntry(id).has_value());
    CHECK_FALSE(std::filesystem::exists(tmp.path / "maintenance" / (id + ".json")));
}

TEST_CASE("corrupt entry of another type does not disturb other listings") {
    Test::TempDir tmp("ms_dir_corrupt_foreign");
    auto index = openIndex(tmp.path);
    REQUIRE(index->putEntry({{kTypeLabel, "maintenance"}}, nlohmann::json::object()).has_value());
    std::filesystem::create_directories(tmp.path / "snapshot");
    writeRaw(tmp.path / "snapshot" / "0123456789abcdef0123456789abcdef.json", "{garbage");

    auto found = index->findEntries({{kTypeLabel, "maintenance"}});
    REQUIRE(found.has_value());
    CHECK(found->size() == 1);
}

TEST_CASE("entry whose id disagrees with its file name is rejected") {
    Test::TempDir tmp("ms_dir_mismatch");
    auto index = openIndex(tmp.path);
    std::filesystem::create_directories(tmp.path / "maintenance");
    EntryID id = "0123456789abcdef0123456789abcdef";
    writeRaw(tmp.path / "maintenance" / (id + ".json"),
             R"({"id":"ffffffffffffffffffffffffffffffff","labels":{"type":"maintenance"},"modTime":0,"payload":{}})");
    auto entry = index->getEntry(id);
    REQUIRE_FALSE(entry.has_value());
    CHECK(entry.error().code == Error::Code::MalformedInput);
}

TEST_CASE("entry whose type disagrees with its directory is rejected") {
    Test::TempDir tmp("ms_dir_type_mismatch");
    auto index = openIndex(tmp.path);
    std::filesystem::create_directories(tmp.path / "maintenance");
    EntryID id = "0123456789abcdef0123456789abcdef";
    writeRaw(tmp.path / "maintenance" / (id + ".json"),
             R"({"id":"0123456789abcdef0123456789abcdef","labels":{"type":"snapshot"},"modTime":0,"payload":{}})");

    auto entry = index->getEntry(id);
    REQUIRE_FALSE(entry.has_value());
    CHECK(entry.error().code == Error::Code::MalformedInput);

    auto snapshots = index->findEntries({{kTypeLabel, "snapshot"}});
    REQUIRE(snapshots.has_value());
    CHECK(snapshots->empty());
}

TEST_CASE("delete is idempotent and validates ids") {
    Test::TempDir tmp("ms_dir_delete");
    auto index = openIndex(tmp.path);
    auto id = index->putEntry({{kTypeLabel, "maintenance"}}, nlohmann::json::object());
    REQUIRE(id.has_value());
    CHECK(index->deleteEntry(*id).has_value());
    CHECK(index->deleteEntry(*id).has_value());

    auto bad = index->deleteEntry("../escape");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == Error::Code::MalformedInput);

    auto missing = index->getEntry("../escape");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
}

TEST_CASE("fsync can be disabled from the environment") {
    ::setenv("MANIFESTSPACE_FSYNC", "off", 1);
    auto off = DirectoryManifestIndex::Options::fromEnvironment("/tmp/x");
    CHECK_FALSE(off.fsync);
    ::setenv("MANIFESTSPACE_FSYNC", "1", 1);
    auto on = DirectoryManifestIndex::Options::fromEnvironment("/tmp/x");
    CHECK(on.fsync);
    ::unsetenv("MANIFESTSPACE_FSYNC");
    CHECK(DirectoryManifestIndex::Options::fromEnvironment("/tmp/x").fsync);
}
}
