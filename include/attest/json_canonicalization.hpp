#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace attest::json
{

    /**
     * RFC 8785 JSON Canonicalization Scheme (JCS)
     *
     * Produces the byte sequence that link hashes and signatures are computed
     * over, so the output for a given value must never change:
     * - object members sorted by the UTF-16 code units of their names
     * - no insignificant whitespace
     * - minimal string escaping, lowercase \u00xx for other control characters
     * - numbers in ECMAScript Number.prototype.toString form
     *
     * NaN, infinities and invalid UTF-8 cannot be represented and are rejected.
     */
    class RFC8785Canonicalizer
    {
    public:
        static Result<std::string> canonicalize(const nlohmann::json &value);

        /**
         * Parse JSON text and canonicalize it
         */
        static Result<std::string> canonicalize_string(const std::string &json_str);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output);
        static Result<void> serialize_string(const std::string &str, std::string &output);
        static Result<void> serialize_number(const nlohmann::json &num, std::string &output);
        static Result<void> serialize_object(const nlohmann::json &obj, std::string &output);
        static Result<void> serialize_array(const nlohmann::json &arr, std::string &output);
    };

    /**
     * ECMAScript shortest round-trip rendering of a finite double
     */
    std::string format_es_number(double value);

    /** True if str is well-formed UTF-8 and can be stored in a JSON string */
    bool is_valid_utf8(std::string_view str);

} // namespace attest::json
