#pragma once

#include "icons/icon_backend.hpp"

namespace waypoint::icons
{

//! GDI backend: HICON from the executable or its icon file, HBITMAP parts
//! from GetIconInfo. GetObject tells DIB sections and device bitmaps apart.
class Win32IconBackend final : public IconBackend
{
  public:
    [[nodiscard]] std::optional<NativeIcon> OpenIcon(const BrowserCandidate& browser) override;
    void CloseIcon(NativeIcon icon) noexcept override;

    [[nodiscard]] std::optional<IconParts> ResolveParts(NativeIcon icon) override;
    [[nodiscard]] std::optional<BitmapLayout> QueryLayout(NativeBitmap bitmap) override;
    [[nodiscard]] std::size_t TransferBits(NativeBitmap bitmap, std::span<std::uint8_t> destination) override;
    void ReleaseBitmap(NativeBitmap bitmap) noexcept override;
};

} // namespace waypoint::icons
