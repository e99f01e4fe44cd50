#include "attest/event_store.hpp"
#include "attest/chain_store.hpp"
#include <charconv>
#include <format>

namespace attest
{

    Result<EventRecord> parse_event_record(const std::string &raw)
    {
        auto j = nlohmann::json::parse(raw, nullptr, false);
        if (j.is_discarded())
            return std::unexpected(AttestError(ErrorCode::ParsingError, "Stored event record is not valid JSON"));
        return EventRecord::from_json(j);
    }

    nlohmann::json EventListing::to_json() const
    {
        auto j = record.to_json();
        j["position"] = position ? nlohmann::json(*position) : nlohmann::json(nullptr);
        j["current_hash"] = current_hash ? nlohmann::json(*current_hash) : nlohmann::json(nullptr);
        j["orphaned"] = orphaned();
        return j;
    }

    nlohmann::json EventStats::to_json() const
    {
        return {{"total", total},
                {"signed", signed_count},
                {"verified", verified},
                {"orphaned", orphaned}};
    }

    RocksDbEventStore::RocksDbEventStore(std::shared_ptr<RocksDbStorage> storage)
        : storage_(std::move(storage))
    {
        if (!storage_)
            throw std::invalid_argument("RocksDbEventStore requires storage");
    }

    Result<void> RocksDbEventStore::put(const EventRecord &record)
    {
        if (record.event_id.empty())
            return std::unexpected(AttestError::invalid_input("event_id must not be empty"));

        std::lock_guard lock(write_mutex_);

        auto existing = storage_->get(storage_keys::event(record.event_id));
        if (!existing)
            return std::unexpected(existing.error());
        if (*existing)
            return std::unexpected(AttestError::duplicate_event("Event already exists: " + record.event_id));

        auto counter = storage_->get(storage_keys::kEventSeqCounter);
        if (!counter)
            return std::unexpected(counter.error());
        uint64_t seq = 0;
        if (*counter)
        {
            const auto &raw = **counter;
            auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), seq);
            if (ec != std::errc{} || ptr != raw.data() + raw.size())
                return std::unexpected(AttestError::storage("Corrupt event sequence counter: " + raw));
        }
        ++seq;

        StorageBatch batch;
        batch.put(storage_keys::event(record.event_id), record.to_json().dump());
        batch.put(storage_keys::event_seq(seq), record.event_id);
        batch.put(storage_keys::kEventSeqCounter, std::to_string(seq));
        return storage_->write(batch);
    }

    Result<std::optional<EventRecord>> RocksDbEventStore::get(const std::string &event_id) const
    {
        auto raw = storage_->get(storage_keys::event(event_id));
        if (!raw)
            return std::unexpected(raw.error());
        if (!*raw)
            return std::optional<EventRecord>{};

        auto record = parse_event_record(**raw);
        if (!record)
            return std::unexpected(record.error());
        return std::optional<EventRecord>(std::move(*record));
    }

    Result<EventListing> RocksDbEventStore::join(EventRecord record) const
    {
        EventListing listing{std::move(record), std::nullopt, std::nullopt};

        RocksDbChainStore chain(storage_);
        auto link = chain.find(listing.record.event_id);
        if (!link)
            return std::unexpected(link.error());
        if (*link)
        {
            listing.position = (*link)->position;
            listing.current_hash = (*link)->current_hash;
        }
        return listing;
    }

    Result<std::vector<EventListing>> RocksDbEventStore::list(std::size_t limit, std::size_t offset) const
    {
        auto ids = storage_->scan_prefix(storage_keys::kEventSeqPrefix, offset, limit, true);
        if (!ids)
            return std::unexpected(ids.error());

        std::vector<EventListing> out;
        out.reserve(ids->size());
        for (const auto &[seq_key, event_id] : *ids)
        {
            auto record = get(event_id);
            if (!record)
                return std::unexpected(record.error());
            if (!*record)
                continue; // sequence entry without a record

            auto listing = join(std::move(**record));
            if (!listing)
                return std::unexpected(listing.error());
            out.push_back(std::move(*listing));
        }
        return out;
    }

    Result<EventStats> RocksDbEventStore::stats() const
    {
        auto entries = storage_->scan_prefix(storage_keys::kEventPrefix);
        if (!entries)
            return std::unexpected(entries.error());

        EventStats stats;
        for (const auto &[key, value] : *entries)
        {
            auto record = parse_event_record(value);
            if (!record)
                return std::unexpected(AttestError(record.error().code,
                                                   std::format("{}: {}", key, record.error().what())));
            ++stats.total;
            if (record->is_signed())
                ++stats.signed_count;
            if (record->verified)
                ++stats.verified;

            auto linked = storage_->get(storage_keys::chain_index(record->event_id));
            if (!linked)
                return std::unexpected(linked.error());
            if (!*linked)
                ++stats.orphaned;
        }
        return stats;
    }

} // namespace attest
