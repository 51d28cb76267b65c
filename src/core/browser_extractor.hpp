#pragma once

#include "core/browser.hpp"
#include "core/manifest.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace waypoint
{

inline constexpr std::string_view kExecutableKey = "CFBundleExecutable";
inline constexpr std::string_view kNameKey = "CFBundleName";
inline constexpr std::string_view kShortVersionKey = "CFBundleShortVersionString";
inline constexpr std::string_view kIconFileKey = "CFBundleIconFile";
inline constexpr std::string_view kCopyrightKey = "NSHumanReadableCopyright";
inline constexpr std::string_view kGetInfoKey = "CFBundleGetInfoString";
inline constexpr std::string_view kArchitecturesKey = "LSArchitecturePriority";

class ExtractError : public std::runtime_error
{
  public:
    enum class Kind
    {
        MissingField,
        WrongType,
        EmptyField,
        InvalidValue,
    };

    ExtractError(Kind kind, std::string field, const std::string& message);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

  private:
    Kind kind_;
    std::string field_;
};

//! Where executables and resources live relative to a bundle's Contents directory.
struct BundleLayout
{
    std::filesystem::path executableDirectory = "MacOS";
    std::filesystem::path resourcesDirectory = "Resources";
};

/**
 * @brief Builds a BrowserCandidate from a manifest that passed the URL filter.
 *
 * @param appRoot The bundle's Contents directory.
 * @throws ExtractError naming the offending field when a required field is
 *         absent, not a string, empty, or (for the executable) not a plain
 *         file name. A missing executable file is not an error.
 */
[[nodiscard]] BrowserCandidate ExtractBrowser(
    const ManifestDocument& manifest,
    const std::filesystem::path& appRoot,
    const BundleLayout& layout = {});

[[nodiscard]] BinaryType ParseArchitectures(const ManifestDocument& manifest);

} // namespace waypoint
