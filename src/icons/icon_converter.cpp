#include "icons/icon_converter.hpp"

#if defined(_WIN32)
#include "icons/win32_icon_backend.hpp"
#else
#include "icons/sdl_icon_backend.hpp"
#endif

#include <SDL2/SDL.h>

#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace waypoint::icons
{
namespace
{
// 64 MiB of raw pixels, far beyond any real icon.
constexpr std::size_t kMaxPixelBytes = std::size_t{64} * 1024 * 1024;

template <typename... Visitors>
struct Overloaded : Visitors...
{
    using Visitors::operator()...;
};
template <typename... Visitors>
Overloaded(Visitors...) -> Overloaded<Visitors...>;

std::size_t RowBytes(const BitmapMetrics& metrics)
{
    return static_cast<std::size_t>(metrics.width) * static_cast<std::size_t>(metrics.bitsPerPixel / 8);
}

void ValidateMetrics(const BitmapMetrics& metrics)
{
    if (metrics.width <= 0 || metrics.height <= 0 || metrics.bitsPerPixel <= 0 || metrics.bitsPerPixel % 8 != 0)
    {
        throw IconError(
            IconError::Kind::MetadataUnavailable,
            "Icon bitmap reports unusable metrics " + std::to_string(metrics.width) + "x"
                + std::to_string(metrics.height) + "@" + std::to_string(metrics.bitsPerPixel) + "bpp");
    }

    if (RowBytes(metrics) > kMaxPixelBytes / static_cast<std::size_t>(metrics.height))
    {
        throw IconError(IconError::Kind::MetadataUnavailable, "Icon bitmap is implausibly large");
    }
}

std::vector<std::uint8_t> TransferDeviceDependent(IconBackend& backend, NativeBitmap bitmap, const BitmapMetrics& metrics)
{
    const std::size_t expected = RowBytes(metrics) * static_cast<std::size_t>(metrics.height);
    std::vector<std::uint8_t> pixels(expected, 0);

    const std::size_t copied = backend.TransferBits(bitmap, pixels);
    if (copied != expected)
    {
        throw IconError(
            IconError::Kind::SizeMismatch,
            "Pixel transfer returned " + std::to_string(copied) + " bytes, expected " + std::to_string(expected));
    }
    return pixels;
}

std::vector<std::uint8_t> CopySection(const DeviceIndependentSection& section)
{
    if (section.bits == nullptr)
    {
        throw IconError(IconError::Kind::NoPixelData, "Device independent bitmap has no pixel data");
    }

    const std::size_t rowBytes = RowBytes(section.metrics);
    if (section.stride < rowBytes)
    {
        throw IconError(
            IconError::Kind::SizeMismatch,
            "Bitmap stride " + std::to_string(section.stride) + " is shorter than a row of "
                + std::to_string(rowBytes) + " bytes");
    }

    const auto height = static_cast<std::size_t>(section.metrics.height);
    std::vector<std::uint8_t> pixels(rowBytes * height);
    for (std::size_t row = 0; row < height; ++row)
    {
        const std::size_t sourceRow = section.bottomUp ? height - 1 - row : row;
        std::memcpy(pixels.data() + row * rowBytes, section.bits + sourceRow * section.stride, rowBytes);
    }
    return pixels;
}

IconImage PackageImage(const BitmapMetrics& metrics, std::vector<std::uint8_t> raw)
{
    std::uint32_t sourceFormat = metrics.pixelFormat;
    if (sourceFormat == SDL_PIXELFORMAT_UNKNOWN)
    {
        if (metrics.bitsPerPixel != 32)
        {
            throw IconError(
                IconError::Kind::ConversionFailed,
                "Unknown " + std::to_string(metrics.bitsPerPixel) + "bpp pixel format");
        }
        sourceFormat = SDL_PIXELFORMAT_BGRA32;
    }

    if (SDL_BYTESPERPIXEL(sourceFormat) * 8 != static_cast<std::uint32_t>(metrics.bitsPerPixel))
    {
        throw IconError(
            IconError::Kind::ConversionFailed,
            std::string{"Pixel format "} + SDL_GetPixelFormatName(sourceFormat) + " does not match "
                + std::to_string(metrics.bitsPerPixel) + "bpp");
    }

    if (sourceFormat == SDL_PIXELFORMAT_BGRA32 && metrics.alphaMode == AlphaMode::Premultiplied)
    {
        return IconImage::Create(metrics.width, metrics.height, std::move(raw));
    }

    const int pitch = metrics.width * static_cast<int>(IconImage::kBytesPerPixel);
    std::vector<std::uint8_t> bgra;
    if (sourceFormat == SDL_PIXELFORMAT_BGRA32)
    {
        bgra = std::move(raw);
    }
    else
    {
        bgra.resize(static_cast<std::size_t>(pitch) * static_cast<std::size_t>(metrics.height));
        if (SDL_ConvertPixels(
                metrics.width,
                metrics.height,
                sourceFormat,
                raw.data(),
                static_cast<int>(RowBytes(metrics)),
                SDL_PIXELFORMAT_BGRA32,
                bgra.data(),
                pitch)
            != 0)
        {
            throw IconError(IconError::Kind::ConversionFailed, std::string{"SDL_ConvertPixels: "} + SDL_GetError());
        }
    }

    if (metrics.alphaMode == AlphaMode::Premultiplied)
    {
        return IconImage::Create(metrics.width, metrics.height, std::move(bgra));
    }

    // SDL only premultiplies ARGB8888, which is BGRA32 on little-endian hosts.
    std::vector<std::uint8_t> premultiplied(bgra.size());
    if (SDL_PremultiplyAlpha(
            metrics.width,
            metrics.height,
            SDL_PIXELFORMAT_BGRA32,
            bgra.data(),
            pitch,
            SDL_PIXELFORMAT_BGRA32,
            premultiplied.data(),
            pitch)
        != 0)
    {
        throw IconError(IconError::Kind::ConversionFailed, std::string{"SDL_PremultiplyAlpha: "} + SDL_GetError());
    }

    return IconImage::Create(metrics.width, metrics.height, std::move(premultiplied));
}
} // namespace

IconImage ConvertIcon(IconBackend& backend, NativeIcon icon)
{
    const std::optional<IconParts> parts = icon != nullptr ? backend.ResolveParts(icon) : std::nullopt;
    ScopedBitmap color{backend, parts ? parts->color : nullptr};
    ScopedBitmap mask{backend, parts ? parts->mask : nullptr};
    if (!color)
    {
        throw IconError(IconError::Kind::HandleInvalid, "Unable to resolve the icon's color bitmap");
    }

    const std::optional<BitmapLayout> layout = backend.QueryLayout(color.get());
    if (!layout)
    {
        throw IconError(IconError::Kind::MetadataUnavailable, "Unable to query the icon bitmap layout");
    }

    const BitmapMetrics metrics = std::visit([](const auto& bitmap) { return bitmap.metrics; }, *layout);
    ValidateMetrics(metrics);

    std::vector<std::uint8_t> raw = std::visit(
        Overloaded{
            [&](const DeviceDependentBitmap& bitmap) {
                return TransferDeviceDependent(backend, color.get(), bitmap.metrics);
            },
            [](const DeviceIndependentSection& section) { return CopySection(section); },
        },
        *layout);

    return PackageImage(metrics, std::move(raw));
}

IconImage ResolveIcon(const BrowserCandidate& browser, IconBackend& backend)
{
    const std::optional<NativeIcon> opened = backend.OpenIcon(browser);
    if (!opened || *opened == nullptr)
    {
        throw IconError(
            IconError::Kind::ResourceUnavailable, "No icon available for " + browser.executablePath.string());
    }

    ScopedIcon icon{backend, *opened};
    return ConvertIcon(backend, icon.get());
}

std::unique_ptr<IconBackend> CreatePlatformIconBackend()
{
#if defined(_WIN32)
    return std::make_unique<Win32IconBackend>();
#else
    return std::make_unique<SdlIconBackend>();
#endif
}

} // namespace waypoint::icons
