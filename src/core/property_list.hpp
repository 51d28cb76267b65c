#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string_view>

namespace waypoint::plist
{

class ParseError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// Both decoders map dict -> object, array -> array, string/date/data -> string,
// integer/real -> number and true/false -> boolean. Data payloads are kept as
// base64 text, dates as ISO 8601 UTC strings.
[[nodiscard]] nlohmann::json ParseXml(std::string_view data);
[[nodiscard]] nlohmann::json ParseBinary(std::string_view data);

//! Picks the decoder from the "bplist00" magic.
[[nodiscard]] nlohmann::json Parse(std::string_view data);

[[nodiscard]] bool IsBinary(std::string_view data) noexcept;

} // namespace waypoint::plist
