#pragma once

#include "types.hpp"
#include "event_record.hpp"
#include "storage.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace attest
{

    /**
     * Ordered, append-only ledger of chain links. Positions start at 1 and
     * are assigned by the store.
     */
    class ChainStore
    {
    public:
        virtual ~ChainStore() = default;

        /**
         * Append a link after the current tail.
         * @param previous_hash Must equal the current tail hash (nullopt on an empty chain)
         * @return Assigned position, or ChainAppendFailure for a stale
         *         previous_hash or an already linked event_id
         */
        virtual Result<uint64_t> append(const std::string &event_id,
                                        const std::optional<std::string> &previous_hash,
                                        const std::string &current_hash) = 0;

        /** All links, lowest position first */
        virtual Result<std::vector<ChainLink>> read_ordered() const = 0;

        virtual Result<std::optional<std::string>> tail_hash() const = 0;

        virtual Result<std::optional<ChainLink>> find(const std::string &event_id) const = 0;
    };

    class RocksDbChainStore : public ChainStore
    {
    public:
        explicit RocksDbChainStore(std::shared_ptr<RocksDbStorage> storage);

        Result<uint64_t> append(const std::string &event_id,
                                const std::optional<std::string> &previous_hash,
                                const std::string &current_hash) override;

        Result<std::vector<ChainLink>> read_ordered() const override;
        Result<std::optional<std::string>> tail_hash() const override;
        Result<std::optional<ChainLink>> find(const std::string &event_id) const override;

    private:
        struct Tail
        {
            uint64_t position{0};
            std::optional<std::string> hash;
        };

        Result<Tail> tail() const;

        std::shared_ptr<RocksDbStorage> storage_;
        std::mutex append_mutex_;
    };

    /** Parse a stored link value */
    Result<ChainLink> parse_chain_link(const std::string &raw);

} // namespace attest
