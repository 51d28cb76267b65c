#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace waypoint
{

class ManifestError : public std::runtime_error
{
  public:
    enum class Kind
    {
        NotFound,
        Unreadable,
        Malformed,
    };

    ManifestError(Kind kind, std::filesystem::path path, const std::string& message);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  private:
    Kind kind_;
    std::filesystem::path path_;
};

enum class FieldStatus
{
    Present,
    Missing,
    WrongType,
};

/**
 * @brief A parsed application descriptor (Info.plist).
 *
 * The document root is always a dictionary. Lookups never throw: absent keys
 * and keys holding a different value type both come back empty, and Probe()
 * tells the two apart for callers that must report which one happened.
 */
class ManifestDocument
{
  public:
    ManifestDocument() = default;

    //! Reads and decodes the property list at |path|. Throws ManifestError.
    static ManifestDocument Load(const std::filesystem::path& path);

    //! Decodes an in-memory property list; |path| is only used in errors.
    static ManifestDocument Parse(std::string_view data, const std::filesystem::path& path = {});

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const nlohmann::json& root() const noexcept { return root_; }

    [[nodiscard]] bool Contains(std::string_view key) const;
    [[nodiscard]] FieldStatus Probe(std::string_view key, nlohmann::json::value_t expected) const;

    [[nodiscard]] std::optional<std::string> GetString(std::string_view key) const;
    [[nodiscard]] const nlohmann::json* GetArray(std::string_view key) const;
    [[nodiscard]] const nlohmann::json* GetDict(std::string_view key) const;

  private:
    ManifestDocument(std::filesystem::path path, nlohmann::json root);

    [[nodiscard]] const nlohmann::json* Find(std::string_view key) const;

    std::filesystem::path path_;
    nlohmann::json root_ = nlohmann::json::object();
};

} // namespace waypoint
