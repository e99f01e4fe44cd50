#include "attest/types.hpp"
#include <algorithm>

namespace attest
{

    bool is_valid_event_type(const std::string &tag)
    {
        if (tag.empty() || tag.size() > 64)
            return false;
        return std::all_of(tag.begin(), tag.end(), [](unsigned char c) {
            return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        });
    }

} // namespace attest
