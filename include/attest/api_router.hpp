#pragma once

#include "provenance_engine.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>

namespace attest
{
    struct ApiRequest
    {
        std::string method; // GET, POST
        std::string target; // path with optional query string
        std::string body;
    };

    struct ApiResponse
    {
        int status{200};
        nlohmann::json body;
    };

    /**
     * Maps HTTP-shaped requests onto the provenance engine. Knows nothing
     * about sockets so it can be exercised directly.
     *
     *   GET  /health
     *   GET  /api/status
     *   GET  /api/events?limit=&offset=
     *   GET  /api/events/<id>
     *   POST /api/events
     *   POST /api/verify/<id>
     *   GET  /api/provenance/status
     *   GET  /api/provenance/verify
     */
    class ApiRouter
    {
    public:
        static constexpr std::size_t kDefaultLimit = 50;
        static constexpr std::size_t kMaxLimit = 500;

        /** service_info is merged into /api/status (device id, storage path, ...) */
        ApiRouter(std::shared_ptr<ProvenanceEngine> engine, nlohmann::json service_info = nlohmann::json::object());

        ApiResponse handle(const ApiRequest &req) const;

        /** HTTP status for an engine error */
        static int status_for(const AttestError &error);

    private:
        ApiResponse status() const;
        ApiResponse list_events(const std::map<std::string, std::string> &query) const;
        ApiResponse get_event(const std::string &event_id) const;
        ApiResponse create_event(const std::string &body) const;
        ApiResponse verify_event(const std::string &event_id) const;
        ApiResponse provenance_status() const;
        ApiResponse verify_chain() const;

        std::shared_ptr<ProvenanceEngine> engine_;
        nlohmann::json service_info_;
    };

    /** Split "a=1&b=2" into a map; no percent-decoding beyond '+' */
    std::map<std::string, std::string> parse_query(const std::string &query);

} // namespace attest
