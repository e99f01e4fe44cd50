#include "attest/clock.hpp"
#include <format>

namespace attest
{

    std::string clock_source_to_string(ClockSource source)
    {
        return source == ClockSource::Device ? "device" : "host";
    }

    Result<ClockSource> clock_source_from_string(const std::string &s)
    {
        if (s == "device")
            return ClockSource::Device;
        if (s == "host")
            return ClockSource::Host;
        return std::unexpected(AttestError::invalid_input(std::format("Invalid clock source: {}", s)));
    }

    nlohmann::json DeviceTimestamp::to_json() const
    {
        nlohmann::json j = {
            {"iso", iso},
            {"source", clock_source_to_string(source)}};
        if (temperature_c)
            j["temperature_c"] = *temperature_c;
        return j;
    }

    Result<DeviceTimestamp> DeviceTimestamp::from_json(const nlohmann::json &j)
    {
        try
        {
            DeviceTimestamp ts;
            ts.iso = j.at("iso").get<std::string>();
            auto source = clock_source_from_string(j.at("source").get<std::string>());
            if (!source)
                return std::unexpected(source.error());
            ts.source = *source;
            if (j.contains("temperature_c") && !j["temperature_c"].is_null())
                ts.temperature_c = j["temperature_c"].get<double>();
            return ts;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AttestError(ErrorCode::ParsingError,
                                               std::format("Failed to parse device timestamp: {}", e.what())));
        }
    }

    std::string format_iso8601(std::chrono::system_clock::time_point tp)
    {
        auto t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        if (ms.count() < 0)
        {
            ms += std::chrono::milliseconds(1000);
            t -= 1;
        }

        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

    std::string now_iso8601()
    {
        return format_iso8601(std::chrono::system_clock::now());
    }

    Result<DeviceTimestamp> HostClock::now()
    {
        return DeviceTimestamp{now_iso8601(), ClockSource::Host, std::nullopt};
    }

} // namespace attest
