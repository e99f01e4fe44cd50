#pragma once

#include "types.hpp"
#include "config.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace attest
{

    /** Key layout shared by the event and chain stores. */
    namespace storage_keys
    {
        inline constexpr const char *kEventPrefix = "event/";
        inline constexpr const char *kEventSeqPrefix = "event_seq/";
        inline constexpr const char *kChainPrefix = "chain/";
        inline constexpr const char *kChainIndexPrefix = "chain_idx/";
        inline constexpr const char *kEventSeqCounter = "meta/event_seq";

        /** Zero-padded to 20 digits so lexical order is numeric order */
        std::string pad_sequence(uint64_t n);

        std::string event(const std::string &event_id);
        std::string event_seq(uint64_t seq);
        std::string chain(uint64_t position);
        std::string chain_index(const std::string &event_id);
    } // namespace storage_keys

    using KeyValue = std::pair<std::string, std::string>;

    /** Group of puts and deletes applied atomically by RocksDbStorage::write. */
    class StorageBatch
    {
    public:
        void put(std::string key, std::string value);
        void erase(std::string key);

        struct Op
        {
            std::string key;
            std::optional<std::string> value; // nullopt: delete
        };

        const std::vector<Op> &ops() const { return ops_; }
        bool empty() const { return ops_.empty(); }

    private:
        std::vector<Op> ops_;
    };

    /**
     * Thin RocksDB wrapper: one database holds events, links and counters.
     * Reads are safe from any thread; callers serialize read-modify-write.
     */
    class RocksDbStorage
    {
    public:
        /** Opens (creating if missing) cfg.rocksdb_path; throws AttestError on failure */
        explicit RocksDbStorage(const StorageConfig &cfg);
        ~RocksDbStorage();

        RocksDbStorage(const RocksDbStorage &) = delete;
        RocksDbStorage &operator=(const RocksDbStorage &) = delete;

        static Result<std::shared_ptr<RocksDbStorage>> open(const StorageConfig &cfg);

        Result<std::optional<std::string>> get(const std::string &key) const;
        Result<void> put(const std::string &key, const std::string &value);
        Result<void> erase(const std::string &key);
        Result<void> write(const StorageBatch &batch);

        /** All entries whose key starts with prefix, ascending, after skipping offset, at most limit */
        Result<std::vector<KeyValue>> scan_prefix(const std::string &prefix,
                                                  std::size_t offset = 0,
                                                  std::optional<std::size_t> limit = std::nullopt,
                                                  bool reverse = false) const;

        /** Greatest key with the given prefix */
        Result<std::optional<KeyValue>> last_with_prefix(const std::string &prefix) const;

        const std::string &path() const;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace attest
