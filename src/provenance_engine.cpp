#include "attest/provenance_engine.hpp"
#include "attest/json_canonicalization.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <format>

namespace attest
{

    using Json = nlohmann::json;

    namespace
    {
        Json optional_json(const std::optional<std::string> &value)
        {
            return value ? Json(*value) : Json(nullptr);
        }

        crypto::Bytes to_bytes(const std::string &s)
        {
            return crypto::Bytes(s.begin(), s.end());
        }
    } // namespace

    // ========== Result types ==========

    Json FinalizedRecord::to_json() const
    {
        auto j = record.to_json();
        j["current_hash"] = current_hash;
        j["position"] = position;
        j["signed"] = is_signed();
        return j;
    }

    Json VerifyEventResult::to_json() const
    {
        return Json{{"event_id", event_id},
                    {"valid", valid},
                    {"reason", optional_json(reason)},
                    {"signature_metadata", signature_metadata.to_json()}};
    }

    std::string chain_issue_kind_to_string(ChainIssueKind kind)
    {
        switch (kind)
        {
        case ChainIssueKind::LinkBroken:
            return "link_broken";
        case ChainIssueKind::GenesisInvalid:
            return "genesis_invalid";
        case ChainIssueKind::PositionGap:
            return "position_gap";
        case ChainIssueKind::HashMismatch:
            return "hash_mismatch";
        case ChainIssueKind::MissingEvent:
            return "missing_event";
        }
        return "unknown";
    }

    Json ChainIssue::to_json() const
    {
        return Json{{"kind", chain_issue_kind_to_string(kind)},
                    {"position", position},
                    {"event_id", event_id},
                    {"expected", optional_json(expected)},
                    {"actual", optional_json(actual)}};
    }

    Json ChainVerification::to_json() const
    {
        Json list = Json::array();
        for (const auto &issue : issues)
            list.push_back(issue.to_json());
        return Json{{"valid", valid}, {"length", length}, {"issues", list}};
    }

    Json ChainStatus::to_json() const
    {
        return Json{{"chain", verification.to_json()},
                    {"stats", stats.to_json()},
                    {"signature_rate", signature_rate},
                    {"tip", optional_json(tip)}};
    }

    // ========== ProvenanceEngine ==========

    ProvenanceEngine::ProvenanceEngine(std::shared_ptr<EventStore> events,
                                       std::shared_ptr<ChainStore> chain,
                                       std::shared_ptr<Signer> signer,
                                       std::shared_ptr<TimeSource> clock,
                                       AuditLogger audit)
        : events_(std::move(events)),
          chain_(std::move(chain)),
          signer_(std::move(signer)),
          clock_(std::move(clock)),
          audit_(std::move(audit))
    {
        if (!events_ || !chain_ || !signer_)
            throw std::invalid_argument("ProvenanceEngine requires an event store, a chain store and a signer");
        if (!clock_)
            clock_ = std::make_shared<HostClock>();
    }

    Result<void> ProvenanceEngine::initialize()
    {
        std::lock_guard lock(writer_mutex_);
        return seed_cursor_locked();
    }

    Result<void> ProvenanceEngine::seed_cursor_locked()
    {
        auto tail = chain_->tail_hash();
        if (!tail)
            return std::unexpected(tail.error());
        cursor_ = *tail;
        initialized_ = true;
        spdlog::info("Provenance cursor seeded at {}", cursor_.value_or("<genesis>"));
        return {};
    }

    DeviceTimestamp ProvenanceEngine::device_timestamp()
    {
        auto ts = clock_->now();
        if (ts)
            return *ts;

        spdlog::warn("Time source {} failed, using host clock: {}", clock_->describe(), ts.error().what());
        auto host = host_clock_.now();
        if (host)
            return *host;
        return DeviceTimestamp{now_iso8601(), ClockSource::Host, std::nullopt};
    }

    Result<FinalizedRecord> ProvenanceEngine::create_record(const Trigger &trigger, const Artifact &artifact)
    {
        if (!is_valid_event_type(trigger.event_type))
            return std::unexpected(AttestError::invalid_input(std::format("Invalid event_type: '{}'", trigger.event_type)));
        if (!trigger.trigger_payload.is_object())
            return std::unexpected(AttestError::invalid_input("trigger_payload must be a JSON object"));
        if (!json::is_valid_utf8(artifact.reference))
            return std::unexpected(AttestError::invalid_input("artifact reference is not valid UTF-8"));
        if (!json::is_valid_utf8(artifact.encoding))
            return std::unexpected(AttestError::invalid_input("artifact encoding is not valid UTF-8"));

        EventRecord record;
        record.event_id = crypto::SecureRandom::uuid_v4();
        record.timestamp = now_iso8601();
        record.device_timestamp = device_timestamp();
        record.event_type = trigger.event_type;
        record.trigger_payload = trigger.trigger_payload;
        record.artifact_reference = artifact.reference;
        record.artifact_encoding = artifact.encoding;
        record.artifact_hash = crypto::SHA256::hex_digest(artifact.bytes);

        std::lock_guard lock(writer_mutex_);
        if (!initialized_)
        {
            if (auto seeded = seed_cursor_locked(); !seeded)
                return std::unexpected(seeded.error());
        }

        record.previous_hash = cursor_;
        auto payload = record.signable_payload();
        if (!payload)
            return std::unexpected(payload.error());

        auto sig = signer_->sign(to_bytes(*payload));
        if (sig)
        {
            record.signature = sig->signature_b64();
            record.signature_metadata = sig->metadata();
            record.verified = true;
        }
        else
        {
            spdlog::error("All signers failed for event {}, storing it unsigned: {}", record.event_id, sig.error().what());
            record.signature = std::nullopt;
            record.signature_metadata = SignatureMetadata::absent();
            record.verified = false;
        }

        auto current_hash = compute_link_hash(*payload, record.signature);

        if (auto stored = events_->put(record); !stored)
            return std::unexpected(stored.error().with_subject(record.event_id));

        auto position = chain_->append(record.event_id, record.previous_hash, current_hash);
        if (!position)
        {
            spdlog::error("Chain append failed, event {} is orphaned: {}", record.event_id, position.error().what());
            audit_.log("record_orphaned", record.event_id, "failure",
                       Json{{"error", position.error().what()}, {"previous_hash", optional_json(record.previous_hash)}});
            return std::unexpected(AttestError::chain_append(
                                       std::format("Event {} stored but not linked: {}", record.event_id, position.error().what()))
                                       .with_subject(record.event_id));
        }

        cursor_ = current_hash;

        audit_.log("record_created", record.event_id, "success",
                   Json{{"position", *position},
                        {"current_hash", current_hash},
                        {"trust", trust_to_string(record.signature_metadata.trust)}});

        return FinalizedRecord{std::move(record), std::move(current_hash), *position};
    }

    Result<VerifyEventResult> ProvenanceEngine::verify_event(const std::string &event_id) const
    {
        auto found = events_->get(event_id);
        if (!found)
            return std::unexpected(found.error());
        if (!*found)
            return std::unexpected(AttestError::not_found("Event not found: " + event_id).with_subject(event_id));

        const auto &record = **found;
        VerifyEventResult result;
        result.event_id = event_id;
        result.signature_metadata = record.signature_metadata;

        if (!record.signature)
        {
            result.valid = false;
            result.reason = "unsigned";
            return result;
        }

        auto payload = record.signable_payload();
        if (!payload)
            return std::unexpected(payload.error());

        auto stored = SignResult::from_stored(*record.signature, record.signature_metadata);
        if (!stored)
        {
            spdlog::warn("Stored signature of {} is not valid base64: {}", event_id, stored.error().what());
            result.valid = false;
            result.reason = "signature_invalid";
            return result;
        }

        result.valid = signer_->verify(to_bytes(*payload), *stored);
        if (!result.valid)
            result.reason = "signature_invalid";
        return result;
    }

    Result<ChainVerification> ProvenanceEngine::verify_chain() const
    {
        auto links = chain_->read_ordered();
        if (!links)
            return std::unexpected(links.error());

        ChainVerification out;
        out.length = links->size();

        for (std::size_t i = 0; i < links->size(); ++i)
        {
            const auto &link = (*links)[i];
            const uint64_t expected_position = i + 1;

            if (link.position != expected_position)
            {
                out.issues.push_back(ChainIssue{ChainIssueKind::PositionGap, link.position, link.event_id,
                                                std::to_string(expected_position), std::to_string(link.position)});
            }

            if (i == 0)
            {
                if (link.previous_hash)
                {
                    out.issues.push_back(ChainIssue{ChainIssueKind::GenesisInvalid, link.position, link.event_id,
                                                    std::nullopt, link.previous_hash});
                }
            }
            else
            {
                const auto &prior = (*links)[i - 1];
                if (link.previous_hash != prior.current_hash)
                {
                    out.issues.push_back(ChainIssue{ChainIssueKind::LinkBroken, link.position, link.event_id,
                                                    prior.current_hash, link.previous_hash});
                }
            }

            auto record = events_->get(link.event_id);
            if (!record)
                return std::unexpected(record.error());
            if (!*record)
            {
                out.issues.push_back(ChainIssue{ChainIssueKind::MissingEvent, link.position, link.event_id,
                                                std::nullopt, std::nullopt});
                continue;
            }

            auto recomputed = (*record)->compute_link_hash();
            std::optional<std::string> actual = recomputed ? std::optional<std::string>(*recomputed) : std::nullopt;
            if (actual != link.current_hash)
            {
                out.issues.push_back(ChainIssue{ChainIssueKind::HashMismatch, link.position, link.event_id,
                                                link.current_hash, actual});
            }
        }

        out.valid = out.issues.empty();
        if (!out.valid)
            spdlog::warn("Chain verification found {} issue(s) over {} link(s)", out.issues.size(), out.length);

        audit_.log("chain_verified", "chain", out.valid ? "valid" : "invalid",
                   Json{{"length", out.length}, {"issues", out.issues.size()}});
        return out;
    }

    Result<ChainStatus> ProvenanceEngine::chain_status() const
    {
        auto verification = verify_chain();
        if (!verification)
            return std::unexpected(verification.error());
        auto stats = events_->stats();
        if (!stats)
            return std::unexpected(stats.error());

        ChainStatus status;
        status.verification = std::move(*verification);
        status.stats = *stats;
        if (stats->total > 0)
        {
            double rate = static_cast<double>(stats->signed_count) * 100.0 / static_cast<double>(stats->total);
            status.signature_rate = std::round(rate * 10.0) / 10.0;
        }
        status.tip = tip();
        return status;
    }

    Result<EventListing> ProvenanceEngine::get_event(const std::string &event_id) const
    {
        auto found = events_->get(event_id);
        if (!found)
            return std::unexpected(found.error());
        if (!*found)
            return std::unexpected(AttestError::not_found("Event not found: " + event_id).with_subject(event_id));

        EventListing listing{std::move(**found), std::nullopt, std::nullopt};
        auto link = chain_->find(event_id);
        if (!link)
            return std::unexpected(link.error());
        if (*link)
        {
            listing.position = (*link)->position;
            listing.current_hash = (*link)->current_hash;
        }
        return listing;
    }

    Result<std::vector<EventListing>> ProvenanceEngine::list_events(std::size_t limit, std::size_t offset) const
    {
        return events_->list(limit, offset);
    }

    std::optional<std::string> ProvenanceEngine::tip() const
    {
        std::lock_guard lock(writer_mutex_);
        return cursor_;
    }

} // namespace attest
