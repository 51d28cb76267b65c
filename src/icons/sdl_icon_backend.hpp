#pragma once

#include "icons/icon_backend.hpp"

#include <filesystem>
#include <optional>

namespace waypoint::icons
{

/**
 * @brief Icon backend built on SDL surfaces.
 *
 * A native icon is an SDL_Surface* loaded from the bundle's icon file (BMP).
 * Surfaces that must be locked before their pixels can be read (RLE encoded)
 * take the device-dependent path; every other surface is read in place.
 */
class SdlIconBackend final : public IconBackend
{
  public:
    [[nodiscard]] std::optional<NativeIcon> OpenIcon(const BrowserCandidate& browser) override;
    void CloseIcon(NativeIcon icon) noexcept override;

    [[nodiscard]] std::optional<IconParts> ResolveParts(NativeIcon icon) override;
    [[nodiscard]] std::optional<BitmapLayout> QueryLayout(NativeBitmap bitmap) override;
    [[nodiscard]] std::size_t TransferBits(NativeBitmap bitmap, std::span<std::uint8_t> destination) override;
    void ReleaseBitmap(NativeBitmap bitmap) noexcept override;

    //! The BMP file SDL can load for |browser|, if any. An .icns icon is
    //! matched with a .bmp of the same name next to it.
    [[nodiscard]] static std::optional<std::filesystem::path> FindBitmapIcon(const BrowserCandidate& browser);
};

} // namespace waypoint::icons
