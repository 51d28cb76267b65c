#include "icons/win32_icon_backend.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>

#include <SDL2/SDL.h>

#include <climits>
#include <cstdlib>

namespace waypoint::icons
{
namespace
{
std::uint32_t PixelFormatFor(int bitsPerPixel)
{
    switch (bitsPerPixel)
    {
    case 32:
        return SDL_PIXELFORMAT_BGRA32;
    case 24:
        return SDL_PIXELFORMAT_BGR24;
    default:
        return SDL_PIXELFORMAT_UNKNOWN;
    }
}

BitmapMetrics MetricsFor(const BITMAP& bitmap, int height)
{
    BitmapMetrics metrics;
    metrics.width = bitmap.bmWidth;
    metrics.height = height;
    metrics.bitsPerPixel = bitmap.bmBitsPixel;
    metrics.pixelFormat = PixelFormatFor(bitmap.bmBitsPixel);
    metrics.alphaMode = AlphaMode::Straight;
    return metrics;
}

// Device-dependent bitmaps are always read back through GetDIBits as 32bpp.
BitmapMetrics TransferMetricsFor(const BITMAP& bitmap)
{
    BitmapMetrics metrics;
    metrics.width = bitmap.bmWidth;
    metrics.height = bitmap.bmHeight;
    metrics.bitsPerPixel = 32;
    metrics.pixelFormat = SDL_PIXELFORMAT_BGRA32;
    metrics.alphaMode = AlphaMode::Straight;
    return metrics;
}
} // namespace

std::optional<NativeIcon> Win32IconBackend::OpenIcon(const BrowserCandidate& browser)
{
    const std::filesystem::path& source = browser.iconResolved ? browser.iconPath : browser.executablePath;
    if (source.empty())
    {
        return std::nullopt;
    }

    HICON large = nullptr;
    const UINT extracted = ExtractIconExW(source.wstring().c_str(), 0, &large, nullptr, 1);
    if (extracted == 0 || extracted == UINT_MAX || large == nullptr)
    {
        return std::nullopt;
    }
    return static_cast<NativeIcon>(large);
}

void Win32IconBackend::CloseIcon(NativeIcon icon) noexcept
{
    ::DestroyIcon(static_cast<HICON>(icon));
}

std::optional<IconParts> Win32IconBackend::ResolveParts(NativeIcon icon)
{
    ICONINFO info{};
    if (!GetIconInfo(static_cast<HICON>(icon), &info))
    {
        return std::nullopt;
    }
    // Monochrome icons have no color bitmap; the converter reports that and
    // still releases the mask.
    return IconParts{info.hbmColor, info.hbmMask};
}

std::optional<BitmapLayout> Win32IconBackend::QueryLayout(NativeBitmap bitmap)
{
    DIBSECTION dib{};
    const int bytesRead = GetObjectW(static_cast<HGDIOBJ>(bitmap), sizeof(DIBSECTION), &dib);

    if (bytesRead == static_cast<int>(sizeof(DIBSECTION)))
    {
        DeviceIndependentSection section;
        section.metrics = MetricsFor(dib.dsBm, std::abs(dib.dsBmih.biHeight));
        section.bits = static_cast<const std::uint8_t*>(dib.dsBm.bmBits);
        section.stride = dib.dsBm.bmWidthBytes > 0 ? static_cast<std::size_t>(dib.dsBm.bmWidthBytes) : 0;
        section.bottomUp = dib.dsBmih.biHeight > 0;
        return BitmapLayout{section};
    }

    if (bytesRead == static_cast<int>(sizeof(BITMAP)))
    {
        return BitmapLayout{DeviceDependentBitmap{TransferMetricsFor(dib.dsBm)}};
    }

    return std::nullopt;
}

std::size_t Win32IconBackend::TransferBits(NativeBitmap bitmap, std::span<std::uint8_t> destination)
{
    const auto handle = static_cast<HBITMAP>(bitmap);
    BITMAP info{};
    if (GetObjectW(handle, sizeof(BITMAP), &info) != static_cast<int>(sizeof(BITMAP)) || info.bmWidth <= 0
        || info.bmHeight <= 0)
    {
        return 0;
    }

    const std::size_t rowBytes = static_cast<std::size_t>(info.bmWidth) * 4;
    const std::size_t expected = rowBytes * static_cast<std::size_t>(info.bmHeight);
    if (destination.size() < expected)
    {
        return 0;
    }

    BITMAPINFO request{};
    request.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
    request.bmiHeader.biWidth = info.bmWidth;
    request.bmiHeader.biHeight = -info.bmHeight;
    request.bmiHeader.biPlanes = 1;
    request.bmiHeader.biBitCount = 32;
    request.bmiHeader.biCompression = BI_RGB;

    HDC screen = GetDC(nullptr);
    if (screen == nullptr)
    {
        return 0;
    }
    const int lines = GetDIBits(
        screen, handle, 0, static_cast<UINT>(info.bmHeight), destination.data(), &request, DIB_RGB_COLORS);
    ReleaseDC(nullptr, screen);
    if (lines <= 0)
    {
        return 0;
    }

    const std::size_t copied = rowBytes * static_cast<std::size_t>(lines);
    // Sources without an alpha channel come back with the reserved byte zeroed.
    if (info.bmBitsPixel < 32)
    {
        for (std::size_t offset = 3; offset < copied; offset += 4)
        {
            destination[offset] = 0xFF;
        }
    }
    return copied;
}

void Win32IconBackend::ReleaseBitmap(NativeBitmap bitmap) noexcept
{
    DeleteObject(static_cast<HGDIOBJ>(bitmap));
}

} // namespace waypoint::icons
