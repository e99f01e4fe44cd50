#include "attest/audit.hpp"
#include "attest/clock.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <format>
#include <vector>

namespace attest
{

    Result<void> init_logging(const LoggingConfig &cfg)
    {
        auto level = spdlog::level::from_str(cfg.level);
        if (level == spdlog::level::off && cfg.level != "off")
        {
            return std::unexpected(AttestError::config(std::format("Unknown log level: {}", cfg.level)));
        }

        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            if (!cfg.file.empty())
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false));

            auto logger = std::make_shared<spdlog::logger>("attest", sinks.begin(), sinks.end());
            logger->set_level(level);
            logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%l] %v");
            spdlog::set_default_logger(logger);
        }
        catch (const spdlog::spdlog_ex &e)
        {
            return std::unexpected(AttestError(ErrorCode::IOError, std::format("Failed to initialise logging: {}", e.what())));
        }
        return {};
    }

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"actor", actor},
                              {"action", action},
                              {"resource", resource},
                              {"result", result},
                              {"details", details}};
    }

    AuditLogger::AuditLogger(bool enabled, std::string actor)
        : enabled_(enabled), actor_(std::move(actor))
    {
    }

    void AuditLogger::log(const std::string &action,
                          const std::string &resource,
                          const std::string &result,
                          nlohmann::json details) const
    {
        log(AuditEvent{now_iso8601(), actor_, action, resource, result, std::move(details)});
    }

    void AuditLogger::log(AuditEvent event) const
    {
        if (!enabled_)
            return;
        if (event.ts.empty())
            event.ts = now_iso8601();
        nlohmann::json j = event.to_json();
        j["audit"] = true;
        spdlog::info(j.dump());
    }

} // namespace attest
