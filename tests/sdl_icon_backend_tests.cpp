#include "doctest/doctest.h"

#include "icons/icon_converter.hpp"
#include "icons/sdl_icon_backend.hpp"
#include "test_helpers.hpp"
#include "utils/scoped_handle.hpp"

#include <SDL2/SDL.h>

#include <cstdint>
#include <vector>

using waypoint::BrowserCandidate;
using waypoint::icons::IconError;
using waypoint::icons::SdlIconBackend;
using waypoint::testing::TempDirectory;
using waypoint::testing::WriteFile;

namespace
{
using SurfaceHandle = waypoint::Handle<SDL_Surface, SDL_FreeSurface>;

SurfaceHandle MakeSolidSurface(int width, int height, std::uint32_t format, Uint8 r, Uint8 g, Uint8 b)
{
    SurfaceHandle surface{SDL_CreateRGBSurfaceWithFormat(0, width, height, SDL_BITSPERPIXEL(format), format)};
    REQUIRE(surface.get() != nullptr);
    REQUIRE(SDL_FillRect(surface.get(), nullptr, SDL_MapRGB(surface->format, r, g, b)) == 0);
    return surface;
}

void CheckSolidBgra(const std::vector<std::uint8_t>& pixels, Uint8 r, Uint8 g, Uint8 b)
{
    for (std::size_t offset = 0; offset < pixels.size(); offset += 4)
    {
        CHECK(pixels[offset] == b);
        CHECK(pixels[offset + 1] == g);
        CHECK(pixels[offset + 2] == r);
        CHECK(pixels[offset + 3] == 255);
    }
}
} // namespace

TEST_CASE("SdlIconBackend converts an in-memory surface")
{
    SdlIconBackend backend;
    auto surface = MakeSolidSurface(32, 32, SDL_PIXELFORMAT_BGRA32, 200, 100, 50);

    const auto image = waypoint::icons::ConvertIcon(backend, surface.get());
    CHECK(image.width() == 32);
    CHECK(image.height() == 32);
    REQUIRE(image.pixels().size() == 4096);
    CheckSolidBgra(image.pixels(), 200, 100, 50);
}

TEST_CASE("SdlIconBackend reads 24-bit surfaces")
{
    SdlIconBackend backend;
    auto surface = MakeSolidSurface(3, 5, SDL_PIXELFORMAT_RGB24, 9, 8, 7);

    const auto image = waypoint::icons::ConvertIcon(backend, surface.get());
    REQUIRE(image.pixels().size() == 3 * 5 * 4);
    CheckSolidBgra(image.pixels(), 9, 8, 7);
}

TEST_CASE("SdlIconBackend expands palette surfaces")
{
    SurfaceHandle surface{SDL_CreateRGBSurfaceWithFormat(0, 4, 2, 8, SDL_PIXELFORMAT_INDEX8)};
    REQUIRE(surface.get() != nullptr);
    const SDL_Color colors[] = {{250, 0, 0, 255}, {0, 0, 240, 255}};
    REQUIRE(SDL_SetPaletteColors(surface->format->palette, colors, 0, 2) == 0);

    SDL_Rect topRow{0, 0, 4, 1};
    SDL_Rect bottomRow{0, 1, 4, 1};
    REQUIRE(SDL_FillRect(surface.get(), &topRow, 0) == 0);
    REQUIRE(SDL_FillRect(surface.get(), &bottomRow, 1) == 0);

    SdlIconBackend backend;
    const auto image = waypoint::icons::ConvertIcon(backend, surface.get());
    REQUIRE(image.pixels().size() == 4 * 2 * 4);

    const std::vector<std::uint8_t> top(image.pixels().begin(), image.pixels().begin() + 16);
    const std::vector<std::uint8_t> bottom(image.pixels().begin() + 16, image.pixels().end());
    CheckSolidBgra(top, 250, 0, 0);
    CheckSolidBgra(bottom, 0, 0, 240);
}

TEST_CASE("SdlIconBackend resolves a bundle icon from a BMP next to the icns file")
{
    TempDirectory temp{"waypoint-sdl-icon"};
    const auto resources = temp.path() / "Resources";
    std::filesystem::create_directories(resources);
    WriteFile(resources / "browser.icns", "icns");

    auto surface = MakeSolidSurface(32, 32, SDL_PIXELFORMAT_BGR24, 30, 20, 10);
    REQUIRE(SDL_SaveBMP(surface.get(), (resources / "browser.bmp").string().c_str()) == 0);

    BrowserCandidate browser;
    browser.iconPath = resources / "browser.icns";
    browser.iconResolved = true;

    CHECK(SdlIconBackend::FindBitmapIcon(browser) == resources / "browser.bmp");

    SdlIconBackend backend;
    const auto image = waypoint::icons::ResolveIcon(browser, backend);
    REQUIRE(image.pixels().size() == 4096);
    CheckSolidBgra(image.pixels(), 30, 20, 10);
}

TEST_CASE("SdlIconBackend reports bundles without a loadable icon")
{
    TempDirectory temp{"waypoint-sdl-missing"};
    SdlIconBackend backend;

    BrowserCandidate browser;
    CHECK_FALSE(SdlIconBackend::FindBitmapIcon(browser).has_value());
    CHECK_THROWS_AS(waypoint::icons::ResolveIcon(browser, backend), IconError);

    browser.iconPath = WriteFile(temp.path() / "broken.bmp", "not a bitmap");
    CHECK(SdlIconBackend::FindBitmapIcon(browser).has_value());
    try
    {
        static_cast<void>(waypoint::icons::ResolveIcon(browser, backend));
        FAIL("expected IconError");
    }
    catch (const IconError& ex)
    {
        CHECK(ex.kind() == IconError::Kind::ResourceUnavailable);
    }
}
