#pragma once

#include "core/browser.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace waypoint::icons
{

class IconError : public std::runtime_error
{
  public:
    enum class Kind
    {
        HandleInvalid,
        MetadataUnavailable,
        SizeMismatch,
        NoPixelData,
        ConversionFailed,
        ResourceUnavailable,
    };

    IconError(Kind kind, const std::string& message);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

  private:
    Kind kind_;
};

[[nodiscard]] ErrorCategory CategoryFor(IconError::Kind kind) noexcept;

enum class PixelFormat
{
    Bgra8Premultiplied,
};

//! Decoded icon ready for any UI layer. The pixel buffer always holds exactly
//! width * height * 4 bytes, rows top-down with no padding.
class IconImage
{
  public:
    static constexpr std::size_t kBytesPerPixel = 4;

    //! Throws IconError(SizeMismatch) when |pixels| does not match the size.
    static IconImage Create(int width, int height, std::vector<std::uint8_t> pixels);

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] PixelFormat format() const noexcept { return PixelFormat::Bgra8Premultiplied; }
    [[nodiscard]] const std::vector<std::uint8_t>& pixels() const noexcept { return pixels_; }

  private:
    IconImage(int width, int height, std::vector<std::uint8_t> pixels);

    int width_ = 0;
    int height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

} // namespace waypoint::icons
