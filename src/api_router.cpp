#include "attest/api_router.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <format>

namespace attest
{
    using Json = nlohmann::json;

    namespace
    {
        ApiResponse ok_json(Json body, int status = 200)
        {
            return ApiResponse{status, std::move(body)};
        }

        ApiResponse bad_request(const std::string &why)
        {
            return ApiResponse{400, Json{{"error", why}}};
        }

        ApiResponse not_found(const std::string &why = "not found")
        {
            return ApiResponse{404, Json{{"error", why}}};
        }

        ApiResponse method_not_allowed()
        {
            return ApiResponse{405, Json{{"error", "method not allowed"}}};
        }

        ApiResponse from_error(const AttestError &error)
        {
            Json body{{"error", error.what()}, {"code", error_code_to_string(error.code)}};
            if (error.code == ErrorCode::ChainAppendFailure && !error.subject.empty())
                body["orphaned_event_id"] = error.subject;
            int status = ApiRouter::status_for(error);
            if (status >= 500)
                spdlog::error("API error: {}", error.what());
            return ApiResponse{status, std::move(body)};
        }

        std::optional<std::size_t> parse_size(const std::string &s)
        {
            std::size_t out = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec != std::errc{} || ptr != s.data() + s.size())
                return std::nullopt;
            return out;
        }

        bool starts_with(const std::string &s, const std::string &prefix)
        {
            return s.rfind(prefix, 0) == 0;
        }
    } // namespace

    std::map<std::string, std::string> parse_query(const std::string &query)
    {
        std::map<std::string, std::string> out;
        std::size_t start = 0;
        while (start <= query.size())
        {
            auto end = query.find('&', start);
            if (end == std::string::npos)
                end = query.size();
            auto pair = query.substr(start, end - start);
            if (!pair.empty())
            {
                auto eq = pair.find('=');
                std::string key = pair.substr(0, eq);
                std::string value = eq == std::string::npos ? "" : pair.substr(eq + 1);
                std::replace(value.begin(), value.end(), '+', ' ');
                out[key] = value;
            }
            start = end + 1;
        }
        return out;
    }

    ApiRouter::ApiRouter(std::shared_ptr<ProvenanceEngine> engine, Json service_info)
        : engine_(std::move(engine)), service_info_(std::move(service_info))
    {
        if (!engine_)
            throw std::invalid_argument("ApiRouter requires an engine");
    }

    int ApiRouter::status_for(const AttestError &error)
    {
        switch (error.code)
        {
        case ErrorCode::InvalidInput:
        case ErrorCode::ValidationError:
        case ErrorCode::ParsingError:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::DuplicateEvent:
            return 409;
        case ErrorCode::Timeout:
        case ErrorCode::SignerUnavailable:
            return 503;
        default:
            return 500;
        }
    }

    ApiResponse ApiRouter::handle(const ApiRequest &req) const
    {
        std::string path = req.target;
        std::string query;
        if (auto q = path.find('?'); q != std::string::npos)
        {
            query = path.substr(q + 1);
            path = path.substr(0, q);
        }

        const bool is_get = req.method == "GET";
        const bool is_post = req.method == "POST";
        if (!is_get && !is_post)
            return method_not_allowed();

        if (path == "/health")
            return is_get ? ok_json({{"status", "ok"}}) : method_not_allowed();

        if (path == "/api/status")
            return is_get ? status() : method_not_allowed();

        if (path == "/api/events")
            return is_get ? list_events(parse_query(query)) : create_event(req.body);

        const std::string events_prefix = "/api/events/";
        if (starts_with(path, events_prefix) && path.size() > events_prefix.size())
            return is_get ? get_event(path.substr(events_prefix.size())) : method_not_allowed();

        const std::string verify_prefix = "/api/verify/";
        if (starts_with(path, verify_prefix) && path.size() > verify_prefix.size())
            return is_post ? verify_event(path.substr(verify_prefix.size())) : method_not_allowed();

        if (path == "/api/provenance/status")
            return is_get ? provenance_status() : method_not_allowed();

        if (path == "/api/provenance/verify")
            return is_get ? verify_chain() : method_not_allowed();

        return not_found();
    }

    ApiResponse ApiRouter::status() const
    {
        Json body = service_info_;
        body["signer"] = engine_->signer().status();
        body["clock"] = engine_->clock().describe();
        auto tip = engine_->tip();
        body["tip"] = tip ? Json(*tip) : Json(nullptr);
        return ok_json(std::move(body));
    }

    ApiResponse ApiRouter::list_events(const std::map<std::string, std::string> &query) const
    {
        std::size_t limit = kDefaultLimit;
        std::size_t offset = 0;
        if (auto it = query.find("limit"); it != query.end())
        {
            auto parsed = parse_size(it->second);
            if (!parsed || *parsed == 0)
                return bad_request("limit must be a positive integer");
            limit = std::min(*parsed, kMaxLimit);
        }
        if (auto it = query.find("offset"); it != query.end())
        {
            auto parsed = parse_size(it->second);
            if (!parsed)
                return bad_request("offset must be a non-negative integer");
            offset = *parsed;
        }

        auto events = engine_->list_events(limit, offset);
        if (!events)
            return from_error(events.error());

        Json list = Json::array();
        for (const auto &e : *events)
            list.push_back(e.to_json());
        return ok_json({{"events", list}, {"limit", limit}, {"offset", offset}});
    }

    ApiResponse ApiRouter::get_event(const std::string &event_id) const
    {
        auto event = engine_->get_event(event_id);
        if (!event)
            return from_error(event.error());
        return ok_json(event->to_json());
    }

    ApiResponse ApiRouter::create_event(const std::string &body) const
    {
        auto j = Json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return bad_request("body must be a JSON object");

        if (!j.contains("event_type") || !j["event_type"].is_string())
            return bad_request("event_type is required");
        if (!j.contains("artifact_base64") || !j["artifact_base64"].is_string())
            return bad_request("artifact_base64 is required");
        if (!j.contains("artifact_reference") || !j["artifact_reference"].is_string())
            return bad_request("artifact_reference is required");

        Trigger trigger;
        trigger.event_type = j["event_type"].get<std::string>();
        if (j.contains("trigger_payload") && !j["trigger_payload"].is_null())
        {
            if (!j["trigger_payload"].is_object())
                return bad_request("trigger_payload must be an object");
            trigger.trigger_payload = j["trigger_payload"];
        }

        auto bytes = crypto::Base64::decode(j["artifact_base64"].get<std::string>());
        if (!bytes)
            return bad_request("artifact_base64 is not valid base64");

        Artifact artifact;
        artifact.bytes = std::move(*bytes);
        artifact.reference = j["artifact_reference"].get<std::string>();
        artifact.encoding = j.value("artifact_encoding", "application/octet-stream");

        auto record = engine_->create_record(trigger, artifact);
        if (!record)
            return from_error(record.error());
        return ok_json(record->to_json(), 201);
    }

    ApiResponse ApiRouter::verify_event(const std::string &event_id) const
    {
        auto result = engine_->verify_event(event_id);
        if (!result)
            return from_error(result.error());
        return ok_json(result->to_json());
    }

    ApiResponse ApiRouter::provenance_status() const
    {
        auto status = engine_->chain_status();
        if (!status)
            return from_error(status.error());
        return ok_json(status->to_json());
    }

    ApiResponse ApiRouter::verify_chain() const
    {
        auto result = engine_->verify_chain();
        if (!result)
            return from_error(result.error());
        return ok_json(result->to_json());
    }

} // namespace attest
