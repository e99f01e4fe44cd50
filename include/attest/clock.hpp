#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace attest
{

    enum class ClockSource
    {
        Device,
        Host
    };

    std::string clock_source_to_string(ClockSource source);
    Result<ClockSource> clock_source_from_string(const std::string &s);

    /**
     * Timestamp reported by a time collaborator.
     * temperature_c is set by clocks with an on-die sensor (e.g. DS3231).
     */
    struct DeviceTimestamp
    {
        std::string iso;
        ClockSource source{ClockSource::Host};
        std::optional<double> temperature_c;

        nlohmann::json to_json() const;
        static Result<DeviceTimestamp> from_json(const nlohmann::json &j);
    };

    /** ISO-8601 UTC with millisecond precision: 2024-01-31T12:00:00.000Z */
    std::string format_iso8601(std::chrono::system_clock::time_point tp);

    std::string now_iso8601();

    /**
     * Source of device timestamps. Implementations may talk to a hardware
     * RTC; HostClock is the always-available fallback.
     */
    class TimeSource
    {
    public:
        virtual ~TimeSource() = default;

        virtual Result<DeviceTimestamp> now() = 0;

        /** Short description for status output */
        virtual std::string describe() const = 0;
    };

    class HostClock : public TimeSource
    {
    public:
        Result<DeviceTimestamp> now() override;
        std::string describe() const override { return "host"; }
    };

} // namespace attest
