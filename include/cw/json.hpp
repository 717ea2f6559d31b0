#pragma once

#include <string>
#include <string_view>

namespace cw {

// Escapes s for use inside a JSON string literal (quotes not included).
std::string json_escape(std::string_view s);

// "\"" + json_escape(s) + "\""
std::string json_quote(std::string_view s);

} // namespace cw
