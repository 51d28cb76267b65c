#include "icons/sdl_icon_backend.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>
#include <system_error>

namespace waypoint::icons
{
namespace
{
SDL_Surface* AsSurface(void* handle)
{
    return static_cast<SDL_Surface*>(handle);
}

std::string LowercaseExtension(const std::filesystem::path& path)
{
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

BitmapMetrics MetricsFor(const SDL_Surface* surface)
{
    BitmapMetrics metrics;
    metrics.width = surface->w;
    metrics.height = surface->h;
    metrics.bitsPerPixel = surface->format->BytesPerPixel * 8;
    metrics.pixelFormat = surface->format->format;
    metrics.alphaMode = AlphaMode::Straight;
    return metrics;
}
} // namespace

std::optional<std::filesystem::path> SdlIconBackend::FindBitmapIcon(const BrowserCandidate& browser)
{
    if (browser.iconPath.empty())
    {
        return std::nullopt;
    }

    std::error_code error;
    if (LowercaseExtension(browser.iconPath) == ".bmp")
    {
        if (std::filesystem::is_regular_file(browser.iconPath, error))
        {
            return browser.iconPath;
        }
        return std::nullopt;
    }

    std::filesystem::path sibling = browser.iconPath;
    sibling.replace_extension(".bmp");
    if (std::filesystem::is_regular_file(sibling, error))
    {
        return sibling;
    }
    return std::nullopt;
}

std::optional<NativeIcon> SdlIconBackend::OpenIcon(const BrowserCandidate& browser)
{
    const auto bitmapPath = FindBitmapIcon(browser);
    if (!bitmapPath)
    {
        return std::nullopt;
    }

    SDL_Surface* surface = SDL_LoadBMP(bitmapPath->string().c_str());
    if (surface == nullptr)
    {
        return std::nullopt;
    }
    return surface;
}

void SdlIconBackend::CloseIcon(NativeIcon icon) noexcept
{
    SDL_FreeSurface(AsSurface(icon));
}

std::optional<IconParts> SdlIconBackend::ResolveParts(NativeIcon icon)
{
    SDL_Surface* surface = AsSurface(icon);
    if (surface == nullptr || surface->format == nullptr)
    {
        return std::nullopt;
    }

    // SDL keeps alpha inside the color surface, so there is no separate mask.
    // Palette surfaces (1, 4 and 8 bit BMPs) are expanded here because
    // SDL_ConvertPixels cannot read indexed formats.
    SDL_Surface* color = SDL_ISPIXELFORMAT_INDEXED(surface->format->format)
        ? SDL_ConvertSurfaceFormat(surface, SDL_PIXELFORMAT_BGRA32, 0)
        : SDL_ConvertSurface(surface, surface->format, surface->flags & SDL_RLEACCEL);
    if (color == nullptr)
    {
        return std::nullopt;
    }
    return IconParts{color, nullptr};
}

std::optional<BitmapLayout> SdlIconBackend::QueryLayout(NativeBitmap bitmap)
{
    SDL_Surface* surface = AsSurface(bitmap);
    if (surface == nullptr || surface->format == nullptr)
    {
        return std::nullopt;
    }

    if (SDL_MUSTLOCK(surface))
    {
        return BitmapLayout{DeviceDependentBitmap{MetricsFor(surface)}};
    }

    DeviceIndependentSection section;
    section.metrics = MetricsFor(surface);
    section.bits = static_cast<const std::uint8_t*>(surface->pixels);
    section.stride = surface->pitch > 0 ? static_cast<std::size_t>(surface->pitch) : 0;
    return BitmapLayout{section};
}

std::size_t SdlIconBackend::TransferBits(NativeBitmap bitmap, std::span<std::uint8_t> destination)
{
    SDL_Surface* surface = AsSurface(bitmap);
    if (surface == nullptr || surface->format == nullptr)
    {
        return 0;
    }

    const std::size_t rowBytes = static_cast<std::size_t>(surface->w) * surface->format->BytesPerPixel;
    const std::size_t total = rowBytes * static_cast<std::size_t>(surface->h);
    if (destination.size() < total || SDL_LockSurface(surface) != 0)
    {
        return 0;
    }

    const auto* source = static_cast<const std::uint8_t*>(surface->pixels);
    if (source == nullptr)
    {
        SDL_UnlockSurface(surface);
        return 0;
    }

    for (int row = 0; row < surface->h; ++row)
    {
        std::memcpy(
            destination.data() + static_cast<std::size_t>(row) * rowBytes,
            source + static_cast<std::size_t>(row) * static_cast<std::size_t>(surface->pitch),
            rowBytes);
    }
    SDL_UnlockSurface(surface);
    return total;
}

void SdlIconBackend::ReleaseBitmap(NativeBitmap bitmap) noexcept
{
    SDL_FreeSurface(AsSurface(bitmap));
}

} // namespace waypoint::icons
