#include <catch2/catch_test_macros.hpp>
#include "attest/chain_store.hpp"
#include "test_support.hpp"
#include <atomic>
#include <thread>
#include <vector>

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

    std::string hash_of(const std::string &s)
    {
        return crypto::SHA256::hex_digest(s);
    }
}

TEST_CASE("Empty chain has no tail", "[chain]")
{
    testing::TempDir dir;
    RocksDbChainStore chain(open_storage(dir));

    REQUIRE_FALSE(chain.tail_hash().value().has_value());
    REQUIRE(chain.read_ordered().value().empty());
    REQUIRE_FALSE(chain.find("nope").value().has_value());
}

TEST_CASE("Appends assign contiguous positions", "[chain]")
{
    testing::TempDir dir;
    RocksDbChainStore chain(open_storage(dir));

    auto p1 = chain.append("a", std::nullopt, hash_of("a"));
    REQUIRE(p1.value() == 1);
    auto p2 = chain.append("b", hash_of("a"), hash_of("b"));
    REQUIRE(p2.value() == 2);
    auto p3 = chain.append("c", hash_of("b"), hash_of("c"));
    REQUIRE(p3.value() == 3);

    REQUIRE(chain.tail_hash().value() == hash_of("c"));

    auto links = chain.read_ordered().value();
    REQUIRE(links.size() == 3);
    REQUIRE(links[0].event_id == "a");
    REQUIRE_FALSE(links[0].previous_hash.has_value());
    REQUIRE(links[2].previous_hash == hash_of("b"));
    REQUIRE(links[2].position == 3);
    REQUIRE_FALSE(links[2].appended_at.empty());

    auto found = chain.find("b").value();
    REQUIRE(found.has_value());
    REQUIRE(found->position == 2);
}

TEST_CASE("Positions sort numerically past nine", "[chain]")
{
    testing::TempDir dir;
    RocksDbChainStore chain(open_storage(dir));

    std::optional<std::string> prev;
    for (int i = 0; i < 12; ++i)
    {
        auto id = "e" + std::to_string(i);
        REQUIRE(chain.append(id, prev, hash_of(id)).has_value());
        prev = hash_of(id);
    }

    auto links = chain.read_ordered().value();
    REQUIRE(links.size() == 12);
    for (std::size_t i = 0; i < links.size(); ++i)
        REQUIRE(links[i].position == i + 1);
    REQUIRE(chain.tail_hash().value() == hash_of("e11"));
}

TEST_CASE("Stale previous hash is rejected", "[chain]")
{
    testing::TempDir dir;
    RocksDbChainStore chain(open_storage(dir));

    REQUIRE(chain.append("a", std::nullopt, hash_of("a")).has_value());

    auto genesis_again = chain.append("b", std::nullopt, hash_of("b"));
    REQUIRE_FALSE(genesis_again.has_value());
    REQUIRE(genesis_again.error().code == ErrorCode::ChainAppendFailure);

    auto wrong = chain.append("b", hash_of("zzz"), hash_of("b"));
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().code == ErrorCode::ChainAppendFailure);

    REQUIRE(chain.read_ordered().value().size() == 1);
}

TEST_CASE("An event can be linked only once", "[chain]")
{
    testing::TempDir dir;
    RocksDbChainStore chain(open_storage(dir));

    REQUIRE(chain.append("a", std::nullopt, hash_of("a")).has_value());
    auto dup = chain.append("a", hash_of("a"), hash_of("a2"));
    REQUIRE_FALSE(dup.has_value());
    REQUIRE(dup.error().code == ErrorCode::ChainAppendFailure);
}

TEST_CASE("Chain survives reopening", "[chain]")
{
    testing::TempDir dir;
    {
        RocksDbChainStore chain(open_storage(dir));
        REQUIRE(chain.append("a", std::nullopt, hash_of("a")).has_value());
        REQUIRE(chain.append("b", hash_of("a"), hash_of("b")).has_value());
    }

    RocksDbChainStore reopened(open_storage(dir));
    REQUIRE(reopened.tail_hash().value() == hash_of("b"));
    REQUIRE(reopened.append("c", hash_of("b"), hash_of("c")).value() == 3);
}

TEST_CASE("Concurrent appends with the same tail get one winner", "[chain][concurrency]")
{
    testing::TempDir dir;
    RocksDbChainStore chain(open_storage(dir));
    REQUIRE(chain.append("root", std::nullopt, hash_of("root")).has_value());

    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&, i] {
            auto id = "t" + std::to_string(i);
            if (chain.append(id, hash_of("root"), hash_of(id)))
                ++successes;
        });
    }
    for (auto &t : threads)
        t.join();

    REQUIRE(successes == 1);
    REQUIRE(chain.read_ordered().value().size() == 2);
}
