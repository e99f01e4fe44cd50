#pragma once

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>

namespace attest
{

    /**
     * Confidence level attached to a signature.
     * Selects the verification routine for a stored signature.
     */
    enum class TrustLevel
    {
        Absent = 0,
        Software = 1,
        Hardware = 2
    };

    inline std::string trust_to_string(TrustLevel trust)
    {
        switch (trust)
        {
        case TrustLevel::Absent:
            return "absent";
        case TrustLevel::Software:
            return "software";
        case TrustLevel::Hardware:
            return "hardware";
        }
        return "absent";
    }

    inline std::expected<TrustLevel, std::string> trust_from_string(const std::string &s)
    {
        if (s == "absent")
            return TrustLevel::Absent;
        if (s == "software")
            return TrustLevel::Software;
        if (s == "hardware")
            return TrustLevel::Hardware;
        return std::unexpected(std::format("Invalid trust level: {}", s));
    }

    /**
     * Error categories for attest operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        ValidationError,
        StorageError,
        NotFound,
        DuplicateEvent,
        ChainAppendFailure,
        SignerUnavailable,
        Timeout,
        InvalidInput,
        InternalError,
        IOError,
        ParsingError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        case ErrorCode::ValidationError:
            return "validation_error";
        case ErrorCode::StorageError:
            return "storage_error";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::DuplicateEvent:
            return "duplicate_event";
        case ErrorCode::ChainAppendFailure:
            return "chain_append_failure";
        case ErrorCode::SignerUnavailable:
            return "signer_unavailable";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::InternalError:
            return "internal_error";
        case ErrorCode::IOError:
            return "io_error";
        case ErrorCode::ParsingError:
            return "parsing_error";
        }
        return "internal_error";
    }

    /**
     * attest error with code and message
     */
    class AttestError : public std::runtime_error
    {
    public:
        ErrorCode code;
        std::string subject; // id of the affected record, if any

        AttestError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        AttestError with_subject(std::string id) const
        {
            AttestError copy = *this;
            copy.subject = std::move(id);
            return copy;
        }

        static AttestError config(const std::string &msg)
        {
            return AttestError(ErrorCode::ConfigError, msg);
        }

        static AttestError crypto(const std::string &msg)
        {
            return AttestError(ErrorCode::CryptoError, msg);
        }

        static AttestError validation(const std::string &msg)
        {
            return AttestError(ErrorCode::ValidationError, msg);
        }

        static AttestError storage(const std::string &msg)
        {
            return AttestError(ErrorCode::StorageError, msg);
        }

        static AttestError not_found(const std::string &msg)
        {
            return AttestError(ErrorCode::NotFound, msg);
        }

        static AttestError duplicate_event(const std::string &msg)
        {
            return AttestError(ErrorCode::DuplicateEvent, msg);
        }

        static AttestError chain_append(const std::string &msg)
        {
            return AttestError(ErrorCode::ChainAppendFailure, msg);
        }

        static AttestError signer_unavailable(const std::string &msg)
        {
            return AttestError(ErrorCode::SignerUnavailable, msg);
        }

        static AttestError timeout(const std::string &msg)
        {
            return AttestError(ErrorCode::Timeout, msg);
        }

        static AttestError invalid_input(const std::string &msg)
        {
            return AttestError(ErrorCode::InvalidInput, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, AttestError>;

    /**
     * Predefined event type tags. Other tags are accepted if they pass
     * is_valid_event_type().
     */
    namespace event_types
    {
        inline constexpr const char *kMotionDetection = "motion_detection";
        inline constexpr const char *kManualCapture = "manual_capture";
    }

    /** Non-empty and limited to [a-z0-9_] */
    bool is_valid_event_type(const std::string &tag);

} // namespace attest
