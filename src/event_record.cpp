#include "attest/event_record.hpp"
#include "attest/crypto.hpp"
#include "attest/json_canonicalization.hpp"
#include <format>

namespace attest
{

    using Json = nlohmann::json;

    namespace
    {
        Json optional_string(const std::optional<std::string> &value)
        {
            return value ? Json(*value) : Json(nullptr);
        }

        std::optional<std::string> read_optional_string(const Json &j, const char *field)
        {
            if (!j.contains(field) || j[field].is_null())
                return std::nullopt;
            return j[field].get<std::string>();
        }
    } // namespace

    // ========== SignatureMetadata ==========

    SignatureMetadata SignatureMetadata::absent()
    {
        return SignatureMetadata{"", "", TrustLevel::Absent};
    }

    Json SignatureMetadata::to_json() const
    {
        return Json{
            {"algorithm", algorithm},
            {"key_id", key_id},
            {"trust", trust_to_string(trust)}};
    }

    Result<SignatureMetadata> SignatureMetadata::from_json(const Json &j)
    {
        try
        {
            SignatureMetadata meta;
            meta.algorithm = j.value("algorithm", "");
            meta.key_id = j.value("key_id", "");
            auto trust = trust_from_string(j.at("trust").get<std::string>());
            if (!trust)
                return std::unexpected(AttestError(ErrorCode::ParsingError, trust.error()));
            meta.trust = *trust;
            return meta;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(AttestError(ErrorCode::ParsingError,
                                               std::format("Failed to parse signature metadata: {}", e.what())));
        }
    }

    // ========== EventRecord ==========

    Json EventRecord::to_json() const
    {
        return Json{
            {"event_id", event_id},
            {"timestamp", timestamp},
            {"device_timestamp", device_timestamp.to_json()},
            {"event_type", event_type},
            {"trigger_payload", trigger_payload},
            {"artifact_reference", artifact_reference},
            {"artifact_encoding", artifact_encoding},
            {"artifact_hash", artifact_hash},
            {"previous_hash", optional_string(previous_hash)},
            {"signature", optional_string(signature)},
            {"signature_metadata", signature_metadata.to_json()},
            {"verified", verified}};
    }

    Result<EventRecord> EventRecord::from_json(const Json &j)
    {
        try
        {
            EventRecord record;
            record.event_id = j.at("event_id").get<std::string>();
            record.timestamp = j.at("timestamp").get<std::string>();

            auto device_ts = DeviceTimestamp::from_json(j.at("device_timestamp"));
            if (!device_ts)
                return std::unexpected(device_ts.error());
            record.device_timestamp = *device_ts;

            record.event_type = j.at("event_type").get<std::string>();
            record.trigger_payload = j.value("trigger_payload", Json::object());
            record.artifact_reference = j.value("artifact_reference", "");
            record.artifact_encoding = j.value("artifact_encoding", "");
            record.artifact_hash = j.at("artifact_hash").get<std::string>();
            record.previous_hash = read_optional_string(j, "previous_hash");
            record.signature = read_optional_string(j, "signature");

            auto meta = SignatureMetadata::from_json(j.at("signature_metadata"));
            if (!meta)
                return std::unexpected(meta.error());
            record.signature_metadata = *meta;

            record.verified = j.value("verified", false);
            return record;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(AttestError(ErrorCode::ParsingError,
                                               std::format("Failed to parse EventRecord: {}", e.what())));
        }
    }

    Result<std::string> EventRecord::signable_payload() const
    {
        // Field list is fixed; adding a field here invalidates every stored hash.
        // temperature_c is not signed.
        Json j = {
            {"event_id", event_id},
            {"timestamp", timestamp},
            {"device_timestamp", {{"iso", device_timestamp.iso}, {"source", clock_source_to_string(device_timestamp.source)}}},
            {"event_type", event_type},
            {"trigger_payload", trigger_payload},
            {"artifact_hash", artifact_hash},
            {"previous_hash", optional_string(previous_hash)}};

        return json::RFC8785Canonicalizer::canonicalize(j);
    }

    Result<std::string> EventRecord::compute_link_hash() const
    {
        auto payload = signable_payload();
        if (!payload)
            return std::unexpected(payload.error());
        return attest::compute_link_hash(*payload, signature);
    }

    std::string compute_link_hash(const std::string &signable_payload,
                                  const std::optional<std::string> &signature_b64)
    {
        std::string input = signable_payload;
        input += signature_b64 ? *signature_b64 : std::string(kUnsignedMarker);
        return crypto::SHA256::hex_digest(input);
    }

    // ========== ChainLink ==========

    Json ChainLink::to_json() const
    {
        return Json{
            {"event_id", event_id},
            {"previous_hash", optional_string(previous_hash)},
            {"current_hash", current_hash},
            {"position", position},
            {"appended_at", appended_at}};
    }

    Result<ChainLink> ChainLink::from_json(const Json &j)
    {
        try
        {
            ChainLink link;
            link.event_id = j.at("event_id").get<std::string>();
            link.previous_hash = read_optional_string(j, "previous_hash");
            link.current_hash = j.at("current_hash").get<std::string>();
            link.position = j.at("position").get<uint64_t>();
            link.appended_at = j.value("appended_at", "");
            return link;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(AttestError(ErrorCode::ParsingError,
                                               std::format("Failed to parse ChainLink: {}", e.what())));
        }
    }

} // namespace attest
