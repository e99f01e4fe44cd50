#include <catch2/catch_test_macros.hpp>
#include "attest/api_router.hpp"
#include "test_support.hpp"

using namespace attest;
using attest::testing::bytes_of;

namespace
{
    struct Fixture
    {
        testing::TempDir dir;
        std::shared_ptr<RocksDbStorage> storage;
        std::shared_ptr<ProvenanceEngine> engine;
        std::unique_ptr<ApiRouter> router;

        Fixture()
        {
            StorageConfig cfg;
            cfg.rocksdb_path = dir.str("db");
            cfg.sync_writes = false;
            storage = RocksDbStorage::open(cfg).value();

            auto signer = std::make_shared<SoftwareSigner>(crypto::KeyManager::ephemeral().value());
            engine = std::make_shared<ProvenanceEngine>(std::make_shared<RocksDbEventStore>(storage),
                                                        std::make_shared<RocksDbChainStore>(storage),
                                                        signer);
            REQUIRE(engine->initialize().has_value());
            router = std::make_unique<ApiRouter>(engine, nlohmann::json{{"device_id", "camera-01"}});
        }

        ApiResponse get(const std::string &target) const
        {
            return router->handle(ApiRequest{"GET", target, ""});
        }

        ApiResponse post(const std::string &target, const nlohmann::json &body) const
        {
            return router->handle(ApiRequest{"POST", target, body.dump()});
        }

        nlohmann::json create(const std::string &content)
        {
            auto res = post("/api/events", {{"event_type", "motion_detection"},
                                            {"trigger_payload", {{"pin", 17}}},
                                            {"artifact_base64", crypto::Base64::encode(bytes_of(content))},
                                            {"artifact_reference", content + ".jpg"},
                                            {"artifact_encoding", "image/jpeg"}});
            REQUIRE(res.status == 201);
            return res.body;
        }
    };
}

TEST_CASE("Health and status", "[api]")
{
    Fixture fx;
    auto health = fx.get("/health");
    REQUIRE(health.status == 200);
    REQUIRE(health.body["status"] == "ok");

    auto status = fx.get("/api/status");
    REQUIRE(status.status == 200);
    REQUIRE(status.body["device_id"] == "camera-01");
    REQUIRE(status.body["clock"] == "host");
    REQUIRE(status.body["signer"]["type"] == "software");
    REQUIRE(status.body["tip"].is_null());
}

TEST_CASE("Create, fetch and verify an event", "[api]")
{
    Fixture fx;
    auto created = fx.create("frame-1");
    REQUIRE(created["position"] == 1);
    REQUIRE(created["signed"] == true);
    REQUIRE(created["artifact_hash"] == crypto::SHA256::hex_digest(std::string("frame-1")));

    const std::string id = created["event_id"];

    auto fetched = fx.get("/api/events/" + id);
    REQUIRE(fetched.status == 200);
    REQUIRE(fetched.body["current_hash"] == created["current_hash"]);

    auto verified = fx.router->handle(ApiRequest{"POST", "/api/verify/" + id, ""});
    REQUIRE(verified.status == 200);
    REQUIRE(verified.body["valid"] == true);
    REQUIRE(verified.body["signature_metadata"]["trust"] == "software");
}

TEST_CASE("Listing honours limit and offset", "[api]")
{
    Fixture fx;
    fx.create("a");
    fx.create("b");
    auto newest = fx.create("c");

    auto page = fx.get("/api/events?limit=2&offset=0");
    REQUIRE(page.status == 200);
    REQUIRE(page.body["events"].size() == 2);
    REQUIRE(page.body["events"][0]["event_id"] == newest["event_id"]);

    auto rest = fx.get("/api/events?limit=2&offset=2");
    REQUIRE(rest.body["events"].size() == 1);

    REQUIRE(fx.get("/api/events?limit=abc").status == 400);
    REQUIRE(fx.get("/api/events?limit=0").status == 400);
}

TEST_CASE("Provenance endpoints", "[api]")
{
    Fixture fx;
    fx.create("a");
    fx.create("b");

    auto verify = fx.get("/api/provenance/verify");
    REQUIRE(verify.status == 200);
    REQUIRE(verify.body["valid"] == true);
    REQUIRE(verify.body["length"] == 2);

    auto status = fx.get("/api/provenance/status");
    REQUIRE(status.status == 200);
    REQUIRE(status.body["stats"]["total"] == 2);
    REQUIRE(status.body["signature_rate"] == 100.0);
}

TEST_CASE("Request errors map to HTTP statuses", "[api]")
{
    Fixture fx;

    REQUIRE(fx.get("/api/events/00000000-0000-4000-8000-000000000000").status == 404);
    REQUIRE(fx.router->handle(ApiRequest{"POST", "/api/verify/missing", ""}).status == 404);
    REQUIRE(fx.get("/nowhere").status == 404);
    REQUIRE(fx.router->handle(ApiRequest{"DELETE", "/api/events", ""}).status == 405);
    REQUIRE(fx.get("/api/verify/abc").status == 405);

    REQUIRE(fx.router->handle(ApiRequest{"POST", "/api/events", "{not json"}).status == 400);
    REQUIRE(fx.post("/api/events", {{"event_type", "motion_detection"}}).status == 400);
    REQUIRE(fx.post("/api/events", {{"event_type", "motion_detection"},
                                    {"artifact_base64", "%%%"},
                                    {"artifact_reference", "x"}})
                .status == 400);
    REQUIRE(fx.post("/api/events", {{"event_type", "Bad Type"},
                                    {"artifact_base64", "AAEC"},
                                    {"artifact_reference", "x"}})
                .status == 400);
}

TEST_CASE("Error codes map to statuses", "[api]")
{
    REQUIRE(ApiRouter::status_for(AttestError::not_found("x")) == 404);
    REQUIRE(ApiRouter::status_for(AttestError::duplicate_event("x")) == 409);
    REQUIRE(ApiRouter::status_for(AttestError::invalid_input("x")) == 400);
    REQUIRE(ApiRouter::status_for(AttestError::chain_append("x")) == 500);
    REQUIRE(ApiRouter::status_for(AttestError::storage("x")) == 500);
}

TEST_CASE("Query string parsing", "[api]")
{
    auto q = parse_query("limit=5&offset=10&flag&name=a+b");
    REQUIRE(q["limit"] == "5");
    REQUIRE(q["offset"] == "10");
    REQUIRE(q.contains("flag"));
    REQUIRE(q["name"] == "a b");
    REQUIRE(parse_query("").empty());
}
