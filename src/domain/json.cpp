#include "cw/json.hpp"

#include <cstdio>

namespace cw {

std::string json_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (const char c : s)
    {
        const auto uc = static_cast<unsigned char>(c);
        switch (c)
        {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (uc < 0x20 || uc == 0x7f)
                {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
                    out += buf;
                }
                else
                {
                    out += c;
                }
        }
    }
    return out;
}

std::string json_quote(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    out += json_escape(s);
    out += '"';
    return out;
}

} // namespace cw
