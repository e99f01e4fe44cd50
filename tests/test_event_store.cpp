#include <catch2/catch_test_macros.hpp>
#include "attest/chain_store.hpp"
#include "attest/event_store.hpp"
#include "test_support.hpp"

using namespace attest;

namespace
{
    std::shared_ptr<RocksDbStorage> open_storage(const testing::TempDir &dir)
    {
        StorageConfig cfg;
        cfg.rocksdb_path = dir.str("db");
        cfg.sync_writes = false;
        return RocksDbStorage::open(cfg).value();
    }

    EventRecord make_record(const std::string &id, bool is_signed)
    {
        EventRecord r;
        r.event_id = id;
        r.timestamp = now_iso8601();
        r.device_timestamp = DeviceTimestamp{r.timestamp, ClockSource::Host, std::nullopt};
        r.event_type = event_types::kManualCapture;
        r.artifact_reference = "captures/" + id + ".jpg";
        r.artifact_encoding = "image/jpeg";
        r.artifact_hash = crypto::SHA256::hex_digest(id);
        if (is_signed)
        {
            r.signature = "c2lnbmF0dXJl";
            r.signature_metadata = SignatureMetadata{"Ed25519", "ed25519:0011223344556677", TrustLevel::Software};
            r.verified = true;
        }
        else
        {
            r.signature_metadata = SignatureMetadata::absent();
        }
        return r;
    }
}

TEST_CASE("Event put and get", "[events]")
{
    testing::TempDir dir;
    RocksDbEventStore store(open_storage(dir));

    auto record = make_record("e1", true);
    REQUIRE(store.put(record).has_value());

    auto loaded = store.get("e1").value();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->artifact_hash == record.artifact_hash);
    REQUIRE(loaded->signature == record.signature);
    REQUIRE(loaded->compute_link_hash().value() == record.compute_link_hash().value());

    REQUIRE_FALSE(store.get("missing").value().has_value());
}

TEST_CASE("Duplicate event ids are rejected", "[events]")
{
    testing::TempDir dir;
    RocksDbEventStore store(open_storage(dir));

    REQUIRE(store.put(make_record("e1", true)).has_value());
    auto dup = store.put(make_record("e1", false));
    REQUIRE_FALSE(dup.has_value());
    REQUIRE(dup.error().code == ErrorCode::DuplicateEvent);

    REQUIRE(store.get("e1").value()->is_signed());
}

TEST_CASE("Listing is newest first and joined with the chain", "[events]")
{
    testing::TempDir dir;
    auto storage = open_storage(dir);
    RocksDbEventStore store(storage);
    RocksDbChainStore chain(storage);

    std::optional<std::string> prev;
    for (const auto *id : {"e1", "e2", "e3"})
    {
        auto r = make_record(id, true);
        REQUIRE(store.put(r).has_value());
        auto hash = r.compute_link_hash().value();
        REQUIRE(chain.append(id, prev, hash).has_value());
        prev = hash;
    }
    REQUIRE(store.put(make_record("orphan", false)).has_value());

    auto all = store.list(10, 0).value();
    REQUIRE(all.size() == 4);
    REQUIRE(all[0].record.event_id == "orphan");
    REQUIRE(all[0].orphaned());
    REQUIRE(all[1].record.event_id == "e3");
    REQUIRE(all[1].position == 3u);
    REQUIRE(all[3].record.event_id == "e1");
    REQUIRE(all[3].position == 1u);

    auto page = store.list(2, 1).value();
    REQUIRE(page.size() == 2);
    REQUIRE(page[0].record.event_id == "e3");
    REQUIRE(page[1].record.event_id == "e2");

    auto json = all[1].to_json();
    REQUIRE(json["position"] == 3);
    REQUIRE(json["orphaned"] == false);
}

TEST_CASE("Stats count signed, verified and orphaned events", "[events]")
{
    testing::TempDir dir;
    auto storage = open_storage(dir);
    RocksDbEventStore store(storage);
    RocksDbChainStore chain(storage);

    auto a = make_record("a", true);
    auto b = make_record("b", false);
    auto c = make_record("c", true);
    REQUIRE(store.put(a).has_value());
    REQUIRE(store.put(b).has_value());
    REQUIRE(store.put(c).has_value());
    REQUIRE(chain.append("a", std::nullopt, a.compute_link_hash().value()).has_value());
    REQUIRE(chain.append("b", a.compute_link_hash().value(), b.compute_link_hash().value()).has_value());

    auto stats = store.stats().value();
    REQUIRE(stats.total == 3);
    REQUIRE(stats.signed_count == 2);
    REQUIRE(stats.verified == 2);
    REQUIRE(stats.orphaned == 1);
    REQUIRE(stats.to_json()["signed"] == 2);
}
