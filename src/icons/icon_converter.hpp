#pragma once

#include "icons/icon_backend.hpp"
#include "icons/icon_image.hpp"

#include <memory>

namespace waypoint::icons
{

/**
 * @brief Decodes a native icon into a BGRA8 premultiplied IconImage.
 *
 * The icon's color and mask bitmaps are released before this returns, on
 * success and on every IconError. The native icon itself stays owned by the
 * caller.
 *
 * @throws IconError HandleInvalid, MetadataUnavailable, SizeMismatch,
 *         NoPixelData or ConversionFailed.
 */
[[nodiscard]] IconImage ConvertIcon(IconBackend& backend, NativeIcon icon);

//! Opens the candidate's icon through |backend|, converts it and closes it.
//! Throws IconError(ResourceUnavailable) when the candidate has no usable icon.
[[nodiscard]] IconImage ResolveIcon(const BrowserCandidate& browser, IconBackend& backend);

//! Win32 GDI backend on Windows, SDL surface backend everywhere else.
[[nodiscard]] std::unique_ptr<IconBackend> CreatePlatformIconBackend();

} // namespace waypoint::icons
