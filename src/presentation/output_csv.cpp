#include "cw/output.hpp"

#include <sstream>
#include <string_view>

#include "cw/classify.hpp"

namespace cw
{
// RFC 4180: quote when the field holds a separator, quote or line break
static std::string csv_field(std::string_view s)
{
    if (s.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(s);
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s)
    {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string build_csv(const BatchResult &result)
{
    std::ostringstream os;
    os << "host,port,expiry,days_left,status,error\n";
    for (const auto &o : result.outcomes)
    {
        os << csv_field(o.host) << ','
           << o.port << ','
           << csv_field(expiry_display(o.expiry)) << ',';
        if (o.days_left) os << *o.days_left;
        os << ',' << status_str(o.status)
           << ',' << csv_field(o.error) << '\n';
    }
    return os.str();
}
} // namespace cw
