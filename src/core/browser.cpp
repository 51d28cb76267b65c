#include "core/browser.hpp"

namespace waypoint
{

std::string_view ToString(BinaryType type) noexcept
{
    switch (type)
    {
    case BinaryType::X86:
        return "x86";
    case BinaryType::X64:
        return "x64";
    case BinaryType::Arm64:
        return "ARM64";
    case BinaryType::Universal:
        return "Universal";
    case BinaryType::None:
        break;
    }
    return {};
}

std::string_view ToString(ErrorCategory category) noexcept
{
    switch (category)
    {
    case ErrorCategory::NotFound:
        return "not found";
    case ErrorCategory::Malformed:
        return "malformed";
    case ErrorCategory::MissingField:
        return "missing field";
    case ErrorCategory::ResourceUnavailable:
        return "resource unavailable";
    case ErrorCategory::SizeMismatch:
        return "size mismatch";
    }
    return "unknown";
}

} // namespace waypoint
