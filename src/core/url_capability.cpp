#include "core/url_capability.hpp"

#include <algorithm>
#include <utility>

namespace waypoint
{
namespace
{
std::string IndexedPath(std::string_view base, std::size_t index)
{
    return std::string{base} + "[" + std::to_string(index) + "]";
}

void CollectEntrySchemes(const nlohmann::json& entry, const std::string& entryPath, SchemeScan& scan)
{
    if (!entry.is_object())
    {
        scan.errors.emplace_back(entryPath, entryPath + " is not a dictionary");
        return;
    }

    const auto schemesIt = entry.find(std::string{kUrlSchemesKey});
    if (schemesIt == entry.end())
    {
        return;
    }

    const std::string schemesPath = entryPath + "." + std::string{kUrlSchemesKey};
    if (!schemesIt->is_array())
    {
        scan.errors.emplace_back(schemesPath, schemesPath + " is not an array");
        return;
    }

    for (std::size_t index = 0; index < schemesIt->size(); ++index)
    {
        const auto& scheme = (*schemesIt)[index];
        if (!scheme.is_string())
        {
            const std::string schemePath = IndexedPath(schemesPath, index);
            scan.errors.emplace_back(schemePath, schemePath + " is not a string");
            continue;
        }
        scan.schemes.insert(scheme.get<std::string>());
    }
}
} // namespace

FilterError::FilterError(std::string location, const std::string& message)
    : std::runtime_error(message)
    , location_(std::move(location))
{}

SchemeScan SupportedSchemes(const ManifestDocument& manifest)
{
    SchemeScan scan;

    switch (manifest.Probe(kUrlTypesKey, nlohmann::json::value_t::array))
    {
    case FieldStatus::Missing:
        return scan;
    case FieldStatus::WrongType:
        scan.errors.emplace_back(std::string{kUrlTypesKey}, std::string{kUrlTypesKey} + " is not an array");
        return scan;
    case FieldStatus::Present:
        break;
    }

    const nlohmann::json& urlTypes = *manifest.GetArray(kUrlTypesKey);
    for (std::size_t index = 0; index < urlTypes.size(); ++index)
    {
        CollectEntrySchemes(urlTypes[index], IndexedPath(kUrlTypesKey, index), scan);
    }

    return scan;
}

bool HandlesWebUrls(const std::set<std::string>& schemes)
{
    return std::any_of(kWebSchemes.begin(), kWebSchemes.end(), [&schemes](std::string_view scheme) {
        return schemes.count(std::string{scheme}) > 0;
    });
}

} // namespace waypoint
