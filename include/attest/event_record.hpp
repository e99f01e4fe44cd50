#pragma once

#include "types.hpp"
#include "clock.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace attest
{

    /** Hashed in place of a signature when an event could not be signed */
    inline constexpr const char *kUnsignedMarker = "unsigned";

    /**
     * Who signed an event and how to check it.
     * trust == Absent means no signature was produced.
     */
    struct SignatureMetadata
    {
        std::string algorithm;
        std::string key_id;
        TrustLevel trust{TrustLevel::Absent};

        static SignatureMetadata absent();

        nlohmann::json to_json() const;
        static Result<SignatureMetadata> from_json(const nlohmann::json &j);
    };

    /**
     * One event as persisted in the event store.
     *
     * The signable fields (event_id, timestamp, device_timestamp.iso/source,
     * event_type, trigger_payload, artifact_hash, previous_hash) are the only
     * input to the signature and, together with the signature, to the link
     * hash. Everything else is descriptive.
     */
    struct EventRecord
    {
        std::string event_id;
        std::string timestamp;
        DeviceTimestamp device_timestamp;
        std::string event_type;
        nlohmann::json trigger_payload = nlohmann::json::object();

        std::string artifact_reference;
        std::string artifact_encoding;
        std::string artifact_hash; // SHA-256 hex

        std::optional<std::string> previous_hash; // chain tip at creation, absent for genesis
        std::optional<std::string> signature;     // base64
        SignatureMetadata signature_metadata;
        bool verified{false}; // signing succeeded at write time

        nlohmann::json to_json() const;
        static Result<EventRecord> from_json(const nlohmann::json &j);

        /**
         * RFC 8785 canonical JSON of the signable fields. Fails only when the
         * trigger payload holds a value JSON cannot represent (NaN, Inf).
         */
        Result<std::string> signable_payload() const;

        /**
         * SHA-256 hex over signable_payload() followed by the base64
         * signature, or kUnsignedMarker when unsigned.
         */
        Result<std::string> compute_link_hash() const;

        bool is_signed() const { return signature.has_value(); }
    };

    /**
     * Link hash from an already-built payload
     */
    std::string compute_link_hash(const std::string &signable_payload,
                                  const std::optional<std::string> &signature_b64);

    /**
     * Position of one event in the append-only chain.
     */
    struct ChainLink
    {
        std::string event_id;
        std::optional<std::string> previous_hash;
        std::string current_hash;
        uint64_t position{0};
        std::string appended_at;

        nlohmann::json to_json() const;
        static Result<ChainLink> from_json(const nlohmann::json &j);
    };

} // namespace attest
