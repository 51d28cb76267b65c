#include "core/manifest.hpp"

#include "core/property_list.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace waypoint
{
namespace
{
bool MatchesType(const nlohmann::json& value, nlohmann::json::value_t expected)
{
    using value_t = nlohmann::json::value_t;
    switch (expected)
    {
    case value_t::number_integer:
    case value_t::number_unsigned:
        return value.is_number_integer();
    case value_t::number_float:
        return value.is_number();
    default:
        return value.type() == expected;
    }
}
} // namespace

ManifestError::ManifestError(Kind kind, std::filesystem::path path, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
    , path_(std::move(path))
{}

ManifestDocument::ManifestDocument(std::filesystem::path path, nlohmann::json root)
    : path_(std::move(path))
    , root_(std::move(root))
{}

ManifestDocument ManifestDocument::Load(const std::filesystem::path& path)
{
    std::error_code error;
    if (!std::filesystem::exists(path, error))
    {
        if (error)
        {
            throw ManifestError(
                ManifestError::Kind::Unreadable, path, "Unable to access manifest " + path.string() + ": " + error.message());
        }
        throw ManifestError(ManifestError::Kind::NotFound, path, "Manifest not found: " + path.string());
    }

    if (!std::filesystem::is_regular_file(path, error))
    {
        throw ManifestError(ManifestError::Kind::Unreadable, path, "Manifest is not a regular file: " + path.string());
    }

    std::ifstream input{path, std::ios::binary};
    if (!input.is_open())
    {
        throw ManifestError(ManifestError::Kind::Unreadable, path, "Unable to open manifest: " + path.string());
    }

    const std::string data{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad())
    {
        throw ManifestError(ManifestError::Kind::Unreadable, path, "Unable to read manifest: " + path.string());
    }

    return Parse(data, path);
}

ManifestDocument ManifestDocument::Parse(std::string_view data, const std::filesystem::path& path)
{
    nlohmann::json root;
    try
    {
        root = plist::Parse(data);
    }
    catch (const plist::ParseError& ex)
    {
        throw ManifestError(ManifestError::Kind::Malformed, path, ex.what());
    }

    if (!root.is_object())
    {
        throw ManifestError(ManifestError::Kind::Malformed, path, "Manifest root must be a dictionary.");
    }

    return ManifestDocument{path, std::move(root)};
}

const nlohmann::json* ManifestDocument::Find(std::string_view key) const
{
    const auto it = root_.find(std::string{key});
    if (it == root_.end())
    {
        return nullptr;
    }
    return &*it;
}

bool ManifestDocument::Contains(std::string_view key) const
{
    return Find(key) != nullptr;
}

FieldStatus ManifestDocument::Probe(std::string_view key, nlohmann::json::value_t expected) const
{
    const nlohmann::json* value = Find(key);
    if (value == nullptr)
    {
        return FieldStatus::Missing;
    }
    return MatchesType(*value, expected) ? FieldStatus::Present : FieldStatus::WrongType;
}

std::optional<std::string> ManifestDocument::GetString(std::string_view key) const
{
    const nlohmann::json* value = Find(key);
    if (value == nullptr || !value->is_string())
    {
        return std::nullopt;
    }
    return value->get<std::string>();
}

const nlohmann::json* ManifestDocument::GetArray(std::string_view key) const
{
    const nlohmann::json* value = Find(key);
    return value != nullptr && value->is_array() ? value : nullptr;
}

const nlohmann::json* ManifestDocument::GetDict(std::string_view key) const
{
    const nlohmann::json* value = Find(key);
    return value != nullptr && value->is_object() ? value : nullptr;
}

} // namespace waypoint
