#pragma once

#include "types.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace attest
{
    /**
     * Install the "attest" spdlog logger as default: console sink, plus a file
     * sink when cfg.file is set.
     */
    Result<void> init_logging(const LoggingConfig &cfg);

    struct AuditEvent
    {
        std::string ts;
        std::string actor;
        std::string action; // record_created, record_orphaned, chain_verified, key_rotated
        std::string resource;
        std::string result;
        nlohmann::json details;

        nlohmann::json to_json() const;
    };

    /** Emits one JSON line per audit event through spdlog. */
    class AuditLogger
    {
    public:
        explicit AuditLogger(bool enabled = true, std::string actor = "attest");

        void log(const std::string &action,
                 const std::string &resource,
                 const std::string &result,
                 nlohmann::json details = nlohmann::json::object()) const;

        void log(AuditEvent event) const;

        bool enabled() const { return enabled_; }

    private:
        bool enabled_;
        std::string actor_;
    };

} // namespace attest
