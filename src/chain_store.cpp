#include "attest/chain_store.hpp"
#include "attest/clock.hpp"
#include <nlohmann/json.hpp>
#include <charconv>
#include <cstring>
#include <format>

namespace attest
{

    namespace
    {
        Result<uint64_t> position_from_key(const std::string &key)
        {
            std::string_view digits(key);
            digits.remove_prefix(std::strlen(storage_keys::kChainPrefix));
            uint64_t position = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), position);
            if (ec != std::errc{} || ptr != digits.data() + digits.size())
                return std::unexpected(AttestError(ErrorCode::ParsingError, "Malformed chain key: " + key));
            return position;
        }
    } // namespace

    Result<ChainLink> parse_chain_link(const std::string &raw)
    {
        auto j = nlohmann::json::parse(raw, nullptr, false);
        if (j.is_discarded())
            return std::unexpected(AttestError(ErrorCode::ParsingError, "Stored chain link is not valid JSON"));
        return ChainLink::from_json(j);
    }

    RocksDbChainStore::RocksDbChainStore(std::shared_ptr<RocksDbStorage> storage)
        : storage_(std::move(storage))
    {
        if (!storage_)
            throw std::invalid_argument("RocksDbChainStore requires storage");
    }

    Result<RocksDbChainStore::Tail> RocksDbChainStore::tail() const
    {
        auto last = storage_->last_with_prefix(storage_keys::kChainPrefix);
        if (!last)
            return std::unexpected(last.error());
        if (!*last)
            return Tail{};

        auto position = position_from_key((*last)->first);
        if (!position)
            return std::unexpected(position.error());
        auto link = parse_chain_link((*last)->second);
        if (!link)
            return std::unexpected(link.error());
        return Tail{*position, link->current_hash};
    }

    Result<uint64_t> RocksDbChainStore::append(const std::string &event_id,
                                               const std::optional<std::string> &previous_hash,
                                               const std::string &current_hash)
    {
        std::lock_guard lock(append_mutex_);

        auto existing = storage_->get(storage_keys::chain_index(event_id));
        if (!existing)
            return std::unexpected(AttestError::chain_append(existing.error().what()));
        if (*existing)
        {
            return std::unexpected(AttestError::chain_append(
                std::format("Event {} is already linked at position {}", event_id, **existing)));
        }

        auto t = tail();
        if (!t)
            return std::unexpected(AttestError::chain_append(t.error().what()));
        if (t->hash != previous_hash)
        {
            return std::unexpected(AttestError::chain_append(
                std::format("Stale previous_hash for {}: tail is {}, got {}",
                            event_id, t->hash.value_or("<genesis>"), previous_hash.value_or("<genesis>"))));
        }

        ChainLink link;
        link.event_id = event_id;
        link.previous_hash = previous_hash;
        link.current_hash = current_hash;
        link.position = t->position + 1;
        link.appended_at = now_iso8601();

        StorageBatch batch;
        batch.put(storage_keys::chain(link.position), link.to_json().dump());
        batch.put(storage_keys::chain_index(event_id), std::to_string(link.position));
        if (auto written = storage_->write(batch); !written)
            return std::unexpected(AttestError::chain_append(written.error().what()));
        return link.position;
    }

    Result<std::vector<ChainLink>> RocksDbChainStore::read_ordered() const
    {
        auto entries = storage_->scan_prefix(storage_keys::kChainPrefix);
        if (!entries)
            return std::unexpected(entries.error());

        std::vector<ChainLink> links;
        links.reserve(entries->size());
        for (const auto &[key, value] : *entries)
        {
            auto link = parse_chain_link(value);
            if (!link)
                return std::unexpected(AttestError(link.error().code,
                                                   std::format("{}: {}", key, link.error().what())));
            links.push_back(std::move(*link));
        }
        return links;
    }

    Result<std::optional<std::string>> RocksDbChainStore::tail_hash() const
    {
        auto t = tail();
        if (!t)
            return std::unexpected(t.error());
        return t->hash;
    }

    Result<std::optional<ChainLink>> RocksDbChainStore::find(const std::string &event_id) const
    {
        auto index = storage_->get(storage_keys::chain_index(event_id));
        if (!index)
            return std::unexpected(index.error());
        if (!*index)
            return std::optional<ChainLink>{};

        auto position = position_from_key(storage_keys::kChainPrefix + **index);
        if (!position)
            return std::unexpected(position.error());

        auto raw = storage_->get(storage_keys::chain(*position));
        if (!raw)
            return std::unexpected(raw.error());
        if (!*raw)
            return std::optional<ChainLink>{};

        auto link = parse_chain_link(**raw);
        if (!link)
            return std::unexpected(link.error());
        return std::optional<ChainLink>(std::move(*link));
    }

} // namespace attest
