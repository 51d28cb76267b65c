#pragma once

#include "core/browser.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <variant>

namespace waypoint::icons
{

// Opaque platform objects: HICON/HBITMAP on Windows, SDL_Surface* elsewhere.
using NativeIcon = void*;
using NativeBitmap = void*;

struct IconParts
{
    NativeBitmap color = nullptr;
    NativeBitmap mask = nullptr;
};

enum class AlphaMode
{
    Straight,
    Premultiplied,
};

struct BitmapMetrics
{
    int width = 0;
    int height = 0;
    int bitsPerPixel = 0;
    // SDL_PIXELFORMAT_* value, SDL_PIXELFORMAT_UNKNOWN when the platform
    // does not say. Unknown 32-bit data is treated as BGRA.
    std::uint32_t pixelFormat = 0;
    AlphaMode alphaMode = AlphaMode::Straight;
};

//! Pixels live on the device; they have to be copied out with TransferBits().
struct DeviceDependentBitmap
{
    BitmapMetrics metrics;
};

//! Pixels are directly addressable in memory.
struct DeviceIndependentSection
{
    BitmapMetrics metrics;
    const std::uint8_t* bits = nullptr;
    std::size_t stride = 0;
    bool bottomUp = false;
};

using BitmapLayout = std::variant<DeviceDependentBitmap, DeviceIndependentSection>;

//! Platform seam used by the icon converter. Every object returned by
//! OpenIcon() or ResolveParts() must be handed back to CloseIcon() or
//! ReleaseBitmap() exactly once.
class IconBackend
{
  public:
    virtual ~IconBackend() = default;

    [[nodiscard]] virtual std::optional<NativeIcon> OpenIcon(const BrowserCandidate& browser) = 0;
    virtual void CloseIcon(NativeIcon icon) noexcept = 0;

    [[nodiscard]] virtual std::optional<IconParts> ResolveParts(NativeIcon icon) = 0;
    [[nodiscard]] virtual std::optional<BitmapLayout> QueryLayout(NativeBitmap bitmap) = 0;
    //! Copies device-dependent pixels into |destination| and returns the
    //! number of bytes written, 0 on failure.
    [[nodiscard]] virtual std::size_t TransferBits(NativeBitmap bitmap, std::span<std::uint8_t> destination) = 0;
    virtual void ReleaseBitmap(NativeBitmap bitmap) noexcept = 0;
};

class ScopedBitmap
{
  public:
    ScopedBitmap(IconBackend& backend, NativeBitmap bitmap) noexcept : backend_(backend), bitmap_(bitmap) {}
    ~ScopedBitmap()
    {
        if (bitmap_ != nullptr)
        {
            backend_.ReleaseBitmap(bitmap_);
        }
    }

    ScopedBitmap(const ScopedBitmap&) = delete;
    ScopedBitmap& operator=(const ScopedBitmap&) = delete;

    [[nodiscard]] NativeBitmap get() const noexcept { return bitmap_; }
    explicit operator bool() const noexcept { return bitmap_ != nullptr; }

  private:
    IconBackend& backend_;
    NativeBitmap bitmap_;
};

class ScopedIcon
{
  public:
    ScopedIcon(IconBackend& backend, NativeIcon icon) noexcept : backend_(backend), icon_(icon) {}
    ~ScopedIcon()
    {
        if (icon_ != nullptr)
        {
            backend_.CloseIcon(icon_);
        }
    }

    ScopedIcon(const ScopedIcon&) = delete;
    ScopedIcon& operator=(const ScopedIcon&) = delete;

    [[nodiscard]] NativeIcon get() const noexcept { return icon_; }

  private:
    IconBackend& backend_;
    NativeIcon icon_;
};

} // namespace waypoint::icons
