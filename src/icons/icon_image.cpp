#include "icons/icon_image.hpp"

#include <utility>

namespace waypoint::icons
{

IconError::IconError(Kind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
{}

ErrorCategory CategoryFor(IconError::Kind kind) noexcept
{
    switch (kind)
    {
    case IconError::Kind::SizeMismatch:
        return ErrorCategory::SizeMismatch;
    case IconError::Kind::HandleInvalid:
    case IconError::Kind::MetadataUnavailable:
    case IconError::Kind::NoPixelData:
    case IconError::Kind::ResourceUnavailable:
        return ErrorCategory::ResourceUnavailable;
    case IconError::Kind::ConversionFailed:
        break;
    }
    return ErrorCategory::Malformed;
}

IconImage::IconImage(int width, int height, std::vector<std::uint8_t> pixels)
    : width_(width)
    , height_(height)
    , pixels_(std::move(pixels))
{}

IconImage IconImage::Create(int width, int height, std::vector<std::uint8_t> pixels)
{
    if (width <= 0 || height <= 0)
    {
        throw IconError(IconError::Kind::SizeMismatch, "Icon dimensions must be positive");
    }

    const std::size_t expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * kBytesPerPixel;
    if (pixels.size() != expected)
    {
        throw IconError(
            IconError::Kind::SizeMismatch,
            "Icon buffer holds " + std::to_string(pixels.size()) + " bytes, expected " + std::to_string(expected));
    }

    return IconImage{width, height, std::move(pixels)};
}

} // namespace waypoint::icons
