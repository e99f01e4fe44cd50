#pragma once

#include "types.hpp"
#include "audit.hpp"
#include "chain_store.hpp"
#include "clock.hpp"
#include "crypto.hpp"
#include "event_record.hpp"
#include "event_store.hpp"
#include "signer.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace attest
{

    struct Trigger
    {
        std::string event_type;
        nlohmann::json trigger_payload = nlohmann::json::object();
    };

    struct Artifact
    {
        crypto::Bytes bytes; // hashed exactly as given
        std::string reference;
        std::string encoding;
    };

    struct FinalizedRecord
    {
        EventRecord record;
        std::string current_hash;
        uint64_t position{0};

        bool is_signed() const { return record.is_signed(); }
        nlohmann::json to_json() const;
    };

    struct VerifyEventResult
    {
        std::string event_id;
        bool valid{false};
        std::optional<std::string> reason; // unsigned | signature_invalid
        SignatureMetadata signature_metadata;

        nlohmann::json to_json() const;
    };

    enum class ChainIssueKind
    {
        LinkBroken,
        GenesisInvalid,
        PositionGap,
        HashMismatch,
        MissingEvent
    };

    std::string chain_issue_kind_to_string(ChainIssueKind kind);

    struct ChainIssue
    {
        ChainIssueKind kind;
        uint64_t position{0};
        std::string event_id;
        std::optional<std::string> expected;
        std::optional<std::string> actual;

        nlohmann::json to_json() const;
    };

    struct ChainVerification
    {
        bool valid{true};
        uint64_t length{0};
        std::vector<ChainIssue> issues;

        nlohmann::json to_json() const;
    };

    struct ChainStatus
    {
        ChainVerification verification;
        EventStats stats;
        double signature_rate{0.0}; // percent, one decimal
        std::optional<std::string> tip;

        nlohmann::json to_json() const;
    };

    /**
     * Creates signed, hash-linked event records and verifies them.
     *
     * The cursor (hash of the chain tip) is the only mutable shared state.
     * create_record holds the writer mutex from reading the cursor until it
     * advances it; verification never takes that mutex.
     */
    class ProvenanceEngine
    {
    public:
        ProvenanceEngine(std::shared_ptr<EventStore> events,
                         std::shared_ptr<ChainStore> chain,
                         std::shared_ptr<Signer> signer,
                         std::shared_ptr<TimeSource> clock = nullptr,
                         AuditLogger audit = AuditLogger(false));

        /** Seed the cursor from the chain store tail */
        Result<void> initialize();

        /**
         * Hash, sign, persist and link one event. An unavailable signer
         * yields an unsigned record. If the chain append fails after the
         * event was stored, the event stays orphaned, the cursor is not
         * advanced and ChainAppendFailure is returned with the event id as
         * subject.
         */
        Result<FinalizedRecord> create_record(const Trigger &trigger, const Artifact &artifact);

        /** NotFound if the event does not exist */
        Result<VerifyEventResult> verify_event(const std::string &event_id) const;

        /** Integrity violations are reported in the result, never as errors */
        Result<ChainVerification> verify_chain() const;

        Result<ChainStatus> chain_status() const;

        /** NotFound if the event does not exist */
        Result<EventListing> get_event(const std::string &event_id) const;

        Result<std::vector<EventListing>> list_events(std::size_t limit, std::size_t offset) const;

        std::optional<std::string> tip() const;

        const Signer &signer() const { return *signer_; }
        const TimeSource &clock() const { return *clock_; }

    private:
        Result<void> seed_cursor_locked();
        DeviceTimestamp device_timestamp();

        std::shared_ptr<EventStore> events_;
        std::shared_ptr<ChainStore> chain_;
        std::shared_ptr<Signer> signer_;
        std::shared_ptr<TimeSource> clock_;
        HostClock host_clock_;
        AuditLogger audit_;

        mutable std::mutex writer_mutex_;
        std::optional<std::string> cursor_;
        bool initialized_{false};
    };

} // namespace attest
