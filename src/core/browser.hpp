#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint
{

enum class BinaryType
{
    None,
    X86,
    X64,
    Arm64,
    Universal,
};

[[nodiscard]] std::string_view ToString(BinaryType type) noexcept;

struct VersionInfo
{
    std::string productName;
    std::string productVersion;
    std::string companyName;
    std::string fileDescription;
    BinaryType binaryType = BinaryType::None;
};

//! One discovered application able to open http/https URLs. Built once per
//! successful extraction and not modified afterwards.
struct BrowserCandidate
{
    // Absolute, argument free path to the launchable binary.
    std::filesystem::path executablePath;
    std::vector<std::string> launchArguments;
    std::string displayName;
    VersionInfo version;
    std::filesystem::path iconPath;
    bool executableExists = false;
    bool iconResolved = false;
};

enum class ErrorCategory
{
    NotFound,
    Malformed,
    MissingField,
    ResourceUnavailable,
    SizeMismatch,
};

[[nodiscard]] std::string_view ToString(ErrorCategory category) noexcept;

struct ScanDiagnostic
{
    std::filesystem::path source;
    std::string stage;
    ErrorCategory category = ErrorCategory::Malformed;
    std::string message;
};

} // namespace waypoint
