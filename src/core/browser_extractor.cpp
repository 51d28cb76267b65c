#include "core/browser_extractor.hpp"

#include <system_error>
#include <utility>

namespace waypoint
{
namespace
{
std::string RequireString(const ManifestDocument& manifest, std::string_view key)
{
    switch (manifest.Probe(key, nlohmann::json::value_t::string))
    {
    case FieldStatus::Missing:
        throw ExtractError(
            ExtractError::Kind::MissingField, std::string{key}, "No " + std::string{key} + " found in Info.plist");
    case FieldStatus::WrongType:
        throw ExtractError(
            ExtractError::Kind::WrongType, std::string{key}, "Cannot convert " + std::string{key} + " to a string");
    case FieldStatus::Present:
        break;
    }

    std::string value = *manifest.GetString(key);
    if (value.empty())
    {
        throw ExtractError(ExtractError::Kind::EmptyField, std::string{key}, std::string{key} + " is empty");
    }
    return value;
}

void ValidateExecutableName(const std::string& name)
{
    const std::filesystem::path relative{name};
    bool escapes = relative.has_root_path();
    for (const auto& part : relative)
    {
        if (part == "..")
        {
            escapes = true;
        }
    }

    if (escapes)
    {
        throw ExtractError(
            ExtractError::Kind::InvalidValue,
            std::string{kExecutableKey},
            std::string{kExecutableKey} + " must name a file inside the bundle: " + name);
    }
}

std::filesystem::path MakeAbsolute(const std::filesystem::path& path)
{
    std::error_code error;
    std::filesystem::path absolute = std::filesystem::absolute(path, error);
    if (error)
    {
        absolute = path;
    }
    return absolute.lexically_normal();
}

bool IsRegularFile(const std::filesystem::path& path)
{
    std::error_code error;
    return std::filesystem::is_regular_file(path, error);
}
} // namespace

ExtractError::ExtractError(Kind kind, std::string field, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
    , field_(std::move(field))
{}

BinaryType ParseArchitectures(const ManifestDocument& manifest)
{
    const nlohmann::json* architectures = manifest.GetArray(kArchitecturesKey);
    if (architectures == nullptr)
    {
        return BinaryType::None;
    }

    bool arm64 = false;
    bool x64 = false;
    bool x86 = false;
    for (const auto& entry : *architectures)
    {
        if (!entry.is_string())
        {
            continue;
        }

        const auto& name = entry.get_ref<const std::string&>();
        arm64 = arm64 || name == "arm64";
        x64 = x64 || name == "x86_64";
        x86 = x86 || name == "i386";
    }

    if (arm64 && (x64 || x86))
    {
        return BinaryType::Universal;
    }
    if (arm64)
    {
        return BinaryType::Arm64;
    }
    if (x64)
    {
        return BinaryType::X64;
    }
    return x86 ? BinaryType::X86 : BinaryType::None;
}

BrowserCandidate ExtractBrowser(
    const ManifestDocument& manifest,
    const std::filesystem::path& appRoot,
    const BundleLayout& layout)
{
    const std::string executableName = RequireString(manifest, kExecutableKey);
    const std::string name = RequireString(manifest, kNameKey);
    const std::string versionCode = RequireString(manifest, kShortVersionKey);
    ValidateExecutableName(executableName);

    BrowserCandidate browser;
    browser.executablePath = MakeAbsolute(appRoot / layout.executableDirectory / executableName);
    browser.executableExists = IsRegularFile(browser.executablePath);
    browser.displayName = name;

    browser.version.productName = name;
    browser.version.productVersion = versionCode;
    browser.version.companyName = manifest.GetString(kCopyrightKey).value_or(std::string{});
    browser.version.fileDescription = manifest.GetString(kGetInfoKey).value_or(std::string{});
    browser.version.binaryType = ParseArchitectures(manifest);

    if (auto iconFile = manifest.GetString(kIconFileKey); iconFile && !iconFile->empty())
    {
        std::filesystem::path iconPath = appRoot / layout.resourcesDirectory / *iconFile;
        if (!iconPath.has_extension())
        {
            iconPath += ".icns";
        }
        browser.iconPath = MakeAbsolute(iconPath);
        browser.iconResolved = IsRegularFile(browser.iconPath);
    }

    return browser;
}

} // namespace waypoint
