#include "attest/json_canonicalization.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <string_view>
#include <utility>
#include <vector>

namespace attest::json
{

    namespace
    {
        /**
         * Decode UTF-8 into UTF-16 code units. Returns false on malformed input
         * (overlong forms, surrogates, truncated sequences).
         */
        bool utf8_to_utf16(std::string_view in, std::u16string &out)
        {
            out.clear();
            out.reserve(in.size());
            size_t i = 0;
            while (i < in.size())
            {
                auto c = static_cast<unsigned char>(in[i]);
                char32_t cp = 0;
                size_t extra = 0;
                if (c < 0x80)
                {
                    cp = c;
                }
                else if ((c & 0xE0) == 0xC0)
                {
                    cp = c & 0x1F;
                    extra = 1;
                }
                else if ((c & 0xF0) == 0xE0)
                {
                    cp = c & 0x0F;
                    extra = 2;
                }
                else if ((c & 0xF8) == 0xF0)
                {
                    cp = c & 0x07;
                    extra = 3;
                }
                else
                {
                    return false;
                }

                if (i + extra >= in.size())
                {
                    return false;
                }
                for (size_t k = 1; k <= extra; ++k)
                {
                    auto cc = static_cast<unsigned char>(in[i + k]);
                    if ((cc & 0xC0) != 0x80)
                        return false;
                    cp = (cp << 6) | (cc & 0x3F);
                }

                static constexpr char32_t min_for_len[] = {0, 0x80, 0x800, 0x10000};
                if (cp < min_for_len[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                    return false;

                if (cp >= 0x10000)
                {
                    cp -= 0x10000;
                    out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
                    out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
                }
                else
                {
                    out.push_back(static_cast<char16_t>(cp));
                }
                i += extra + 1;
            }
            return true;
        }
    } // namespace

    bool is_valid_utf8(std::string_view str)
    {
        std::u16string scratch;
        return utf8_to_utf16(str, scratch);
    }

    std::string format_es_number(double value)
    {
        if (value == 0.0)
            return "0"; // also -0

        // Shortest round-trip digits in scientific form: d[.ddd]e[+-]XX
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
        std::string_view sci(buf, static_cast<size_t>(res.ptr - buf));

        bool negative = false;
        if (!sci.empty() && sci.front() == '-')
        {
            negative = true;
            sci.remove_prefix(1);
        }

        auto e_pos = sci.find('e');
        std::string digits;
        for (char ch : sci.substr(0, e_pos))
        {
            if (ch != '.')
                digits += ch;
        }
        int exponent = 0;
        auto exp_sv = sci.substr(e_pos + 1);
        if (!exp_sv.empty() && exp_sv.front() == '+')
            exp_sv.remove_prefix(1);
        std::from_chars(exp_sv.data(), exp_sv.data() + exp_sv.size(), exponent);

        const int k = static_cast<int>(digits.size());
        const int n = exponent + 1;

        std::string out = negative ? "-" : "";
        if (k <= n && n <= 21)
        {
            out += digits;
            out.append(static_cast<size_t>(n - k), '0');
        }
        else if (0 < n && n <= 21)
        {
            out += digits.substr(0, static_cast<size_t>(n));
            out += '.';
            out += digits.substr(static_cast<size_t>(n));
        }
        else if (-6 < n && n <= 0)
        {
            out += "0.";
            out.append(static_cast<size_t>(-n), '0');
            out += digits;
        }
        else
        {
            out += digits.front();
            if (k > 1)
            {
                out += '.';
                out += digits.substr(1);
            }
            out += 'e';
            out += (n - 1) < 0 ? '-' : '+';
            out += std::to_string(std::abs(n - 1));
        }
        return out;
    }

    Result<std::string> RFC8785Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string output;
        if (auto res = serialize_value(value, output); !res)
        {
            return std::unexpected(res.error());
        }
        return output;
    }

    Result<std::string> RFC8785Canonicalizer::canonicalize_string(const std::string &json_str)
    {
        nlohmann::json parsed;
        try
        {
            parsed = nlohmann::json::parse(json_str);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AttestError::invalid_input(
                std::format("JSON parse error: {}", e.what())));
        }
        return canonicalize(parsed);
    }

    Result<void> RFC8785Canonicalizer::serialize_value(const nlohmann::json &value, std::string &output)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            output += "null";
            return {};

        case nlohmann::json::value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return serialize_number(value, output);

        case nlohmann::json::value_t::string:
            return serialize_string(value.get_ref<const std::string &>(), output);

        case nlohmann::json::value_t::array:
            return serialize_array(value, output);

        case nlohmann::json::value_t::object:
            return serialize_object(value, output);

        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
        }
        return std::unexpected(AttestError::invalid_input("Value has no JSON representation"));
    }

    Result<void> RFC8785Canonicalizer::serialize_string(const std::string &str, std::string &output)
    {
        std::u16string scratch;
        if (!utf8_to_utf16(str, scratch))
        {
            return std::unexpected(AttestError::invalid_input("String is not valid UTF-8"));
        }

        output += '"';
        for (unsigned char ch : str)
        {
            switch (ch)
            {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                if (ch < 0x20)
                    output += std::format("\\u{:04x}", static_cast<int>(ch));
                else
                    output += static_cast<char>(ch);
                break;
            }
        }
        output += '"';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_number(const nlohmann::json &num, std::string &output)
    {
        // Integers beyond 2^53 lose precision in IEEE 754 and are serialized as
        // the double an ECMAScript parser would read.
        constexpr int64_t max_safe = 9007199254740991;
        if (num.is_number_unsigned())
        {
            auto v = num.get<uint64_t>();
            if (v <= static_cast<uint64_t>(max_safe))
                output += std::to_string(v);
            else
                output += format_es_number(static_cast<double>(v));
            return {};
        }
        if (num.is_number_integer())
        {
            auto v = num.get<int64_t>();
            if (v <= max_safe && v >= -max_safe)
                output += std::to_string(v);
            else
                output += format_es_number(static_cast<double>(v));
            return {};
        }

        double value = num.get<double>();
        if (!std::isfinite(value))
        {
            return std::unexpected(AttestError::invalid_input("NaN and Infinity are not valid JSON numbers"));
        }
        output += format_es_number(value);
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_object(const nlohmann::json &obj, std::string &output)
    {
        std::vector<std::pair<std::u16string, nlohmann::json::const_iterator>> members;
        members.reserve(obj.size());
        for (auto it = obj.begin(); it != obj.end(); ++it)
        {
            std::u16string key16;
            if (!utf8_to_utf16(it.key(), key16))
            {
                return std::unexpected(AttestError::invalid_input("Object key is not valid UTF-8"));
            }
            members.emplace_back(std::move(key16), it);
        }
        std::sort(members.begin(), members.end(),
                  [](const auto &a, const auto &b) { return a.first < b.first; });

        output += '{';
        bool first = true;
        for (const auto &[_, it] : members)
        {
            if (!first)
                output += ',';
            first = false;

            if (auto res = serialize_string(it.key(), output); !res)
                return res;
            output += ':';
            if (auto res = serialize_value(it.value(), output); !res)
                return res;
        }
        output += '}';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_array(const nlohmann::json &arr, std::string &output)
    {
        output += '[';
        bool first = true;
        for (const auto &item : arr)
        {
            if (!first)
                output += ',';
            first = false;
            if (auto res = serialize_value(item, output); !res)
                return res;
        }
        output += ']';
        return {};
    }

} // namespace attest::json
