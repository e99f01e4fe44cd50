#pragma once

#include "types.hpp"
#include "event_record.hpp"
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace attest
{

    /** An event joined with its chain link; position and hash are absent for orphans */
    struct EventListing
    {
        EventRecord record;
        std::optional<uint64_t> position;
        std::optional<std::string> current_hash;

        bool orphaned() const { return !position.has_value(); }
        nlohmann::json to_json() const;
    };

    struct EventStats
    {
        uint64_t total{0};
        uint64_t signed_count{0};
        uint64_t verified{0};
        uint64_t orphaned{0};

        nlohmann::json to_json() const;
    };

    /**
     * Durable store of full event records, one per event_id.
     */
    class EventStore
    {
    public:
        virtual ~EventStore() = default;

        /** DuplicateEvent if record.event_id already exists */
        virtual Result<void> put(const EventRecord &record) = 0;

        virtual Result<std::optional<EventRecord>> get(const std::string &event_id) const = 0;

        /** Newest first by write order */
        virtual Result<std::vector<EventListing>> list(std::size_t limit, std::size_t offset) const = 0;

        virtual Result<EventStats> stats() const = 0;
    };

    /**
     * Events live in the same RocksDB database as the chain so listings can
     * join against the chain index.
     */
    class RocksDbEventStore : public EventStore
    {
    public:
        explicit RocksDbEventStore(std::shared_ptr<RocksDbStorage> storage);

        Result<void> put(const EventRecord &record) override;
        Result<std::optional<EventRecord>> get(const std::string &event_id) const override;
        Result<std::vector<EventListing>> list(std::size_t limit, std::size_t offset) const override;
        Result<EventStats> stats() const override;

    private:
        Result<EventListing> join(EventRecord record) const;

        std::shared_ptr<RocksDbStorage> storage_;
        std::mutex write_mutex_;
    };

    Result<EventRecord> parse_event_record(const std::string &raw);

} // namespace attest
