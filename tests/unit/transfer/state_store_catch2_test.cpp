// Durable state slots and single-writer leases

#include <catch2/catch_test_macros.hpp>

#include <sluice/transfer/json_codec.hpp>
#include <sluice/transfer/transfer.hpp>

#include "../../common/test_helpers_catch2.h"

using namespace sluice;
using namespace sluice::transfer;

namespace {
TransferState stateFor(const std::string& key, std::uint64_t bytes) {
    TransferState s;
    s.key = key;
    s.source = "https://example.com/a";
    s.destination = "mem://box/a";
    s.resolvedKey = "a";
    s.chunkSize = 4;
    s.bytesTransferred = bytes;
    s.sourceCursor = bytes;
    return s;
}

void exerciseStore(IStateStore& store) {
    auto empty = store.load("job-1");
    REQUIRE(empty);
    CHECK_FALSE(empty.value().has_value());

    REQUIRE(store.save("job-1", stateFor("job-1", 8)));
    auto loaded = store.load("job-1");
    REQUIRE(loaded);
    REQUIRE(loaded.value().has_value());
    CHECK(loaded.value()->bytesTransferred == 8);

    REQUIRE(store.save("job-1", stateFor("job-1", 12)));
    CHECK(store.load("job-1").value()->bytesTransferred == 12);

    REQUIRE(store.remove("job-1"));
    CHECK_FALSE(store.load("job-1").value().has_value());
}

void exerciseLeases(IStateStore& store) {
    auto first = store.acquire("job-2", "tester");
    REQUIRE(first);
    CHECK(first.value().held());

    auto second = store.acquire("job-2", "other");
    REQUIRE_FALSE(second);
    CHECK(second.error().code == ErrorCode::TransferInProgress);

    // Different keys do not contend
    auto unrelated = store.acquire("job-3", "other");
    REQUIRE(unrelated);

    first.value().reset();
    CHECK_FALSE(first.value().held());
    auto third = store.acquire("job-2", "other");
    CHECK(third);
}
} // namespace

TEST_CASE("InMemoryStateStore load/save/remove", "[transfer][state]") {
    auto store = makeInMemoryStateStore();
    exerciseStore(*store);
}

TEST_CASE("InMemoryStateStore leases are exclusive", "[transfer][state][lease]") {
    auto store = makeInMemoryStateStore();
    exerciseLeases(*store);

    // A lease released after its store is gone is harmless
    auto lease = store->acquire("job-9", "tester");
    REQUIRE(lease);
    store.reset();
    lease.value().reset();
}

TEST_CASE("FileStateStore load/save/remove", "[transfer][state]") {
    test::TempDir dir;
    auto store = makeFileStateStore(dir.path() / "state");
    REQUIRE(store);
    exerciseStore(*store.value());
}

TEST_CASE("FileStateStore state survives a new store instance", "[transfer][state]") {
    test::TempDir dir;
    {
        auto store = makeFileStateStore(dir.path());
        REQUIRE(store);
        REQUIRE(store.value()->save("job-1", stateFor("job-1", 4)));
    }
    auto reopened = makeFileStateStore(dir.path());
    REQUIRE(reopened);
    auto loaded = reopened.value()->load("job-1");
    REQUIRE(loaded);
    REQUIRE(loaded.value().has_value());
    CHECK(loaded.value()->bytesTransferred == 4);
    CHECK(std::filesystem::exists(dir.path() / "job-1.json"));
}

TEST_CASE("FileStateStore leases use per-key lock files", "[transfer][state][lease]") {
    test::TempDir dir;
    auto store = makeFileStateStore(dir.path());
    REQUIRE(store);
    exerciseLeases(*store.value());

    // flock is per open file description: a second store in the same process still contends
    auto other = makeFileStateStore(dir.path());
    REQUIRE(other);
    auto held = store.value()->acquire("job-5", "a");
    REQUIRE(held);
    auto contended = other.value()->acquire("job-5", "b");
    REQUIRE_FALSE(contended);
    CHECK(contended.error().code == ErrorCode::TransferInProgress);
}

TEST_CASE("FileStateStore reports corrupt and mismatched files", "[transfer][state]") {
    test::TempDir dir;
    auto store = makeFileStateStore(dir.path());
    REQUIRE(store);

    test::write_file(dir.path() / "garbage.json", "{ not json");
    auto garbage = store.value()->load("garbage");
    REQUIRE_FALSE(garbage);
    CHECK(garbage.error().code == ErrorCode::StateCorruption);

    test::write_file(dir.path() / "renamed.json",
                     transfer::stateToJson(stateFor("someone-else", 0)).dump());
    auto renamed = store.value()->load("renamed");
    REQUIRE_FALSE(renamed);
    CHECK(renamed.error().code == ErrorCode::StateCorruption);
}

TEST_CASE("FileStateStore rejects unsafe keys", "[transfer][state]") {
    test::TempDir dir;
    auto store = makeFileStateStore(dir.path());
    REQUIRE(store);
    for (const char* key : {"", "..", "a/b", "../escape"}) {
        INFO(key);
        auto r = store.value()->load(key);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidRequest);
    }
}
