#pragma once

#include "core/manifest.hpp"

#include <array>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint
{

inline constexpr std::string_view kUrlTypesKey = "CFBundleURLTypes";
inline constexpr std::string_view kUrlSchemesKey = "CFBundleURLSchemes";
inline constexpr std::array<std::string_view, 2> kWebSchemes{"http", "https"};

//! A structurally malformed URL-type declaration. location() is the key path
//! inside the manifest, e.g. "CFBundleURLTypes[1].CFBundleURLSchemes".
class FilterError : public std::runtime_error
{
  public:
    FilterError(std::string location, const std::string& message);

    [[nodiscard]] const std::string& location() const noexcept { return location_; }

  private:
    std::string location_;
};

struct SchemeScan
{
    std::set<std::string> schemes;
    std::vector<FilterError> errors;
};

// Every URL-type entry is read on its own. A malformed entry, or a malformed
// scheme inside an entry, is recorded in |errors| and the remaining entries
// still contribute their schemes.
[[nodiscard]] SchemeScan SupportedSchemes(const ManifestDocument& manifest);

//! Exact, case-sensitive match against http/https.
[[nodiscard]] bool HandlesWebUrls(const std::set<std::string>& schemes);

} // namespace waypoint
