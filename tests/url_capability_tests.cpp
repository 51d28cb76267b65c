#include "doctest/doctest.h"

#include "core/url_capability.hpp"
#include "test_helpers.hpp"

using waypoint::HandlesWebUrls;
using waypoint::ManifestDocument;
using waypoint::SupportedSchemes;
using waypoint::testing::UrlTypes;
using waypoint::testing::XmlPlist;

TEST_CASE("SupportedSchemes collects schemes across URL type entries")
{
    const auto manifest = ManifestDocument::Parse(XmlPlist(R"(
        <key>CFBundleURLTypes</key>
        <array>
            <dict>
                <key>CFBundleURLSchemes</key>
                <array><string>http</string><string>https</string></array>
            </dict>
            <dict>
                <key>CFBundleURLName</key><string>FTP</string>
                <key>CFBundleURLSchemes</key><array><string>ftp</string></array>
            </dict>
            <dict><key>CFBundleURLName</key><string>No schemes</string></dict>
        </array>)"));

    const auto scan = SupportedSchemes(manifest);
    CHECK(scan.errors.empty());
    CHECK(scan.schemes == std::set<std::string>{"ftp", "http", "https"});
    CHECK(HandlesWebUrls(scan.schemes));
}

TEST_CASE("SupportedSchemes treats a manifest without URL types as a non-browser")
{
    const auto scan = SupportedSchemes(ManifestDocument::Parse(XmlPlist("<key>CFBundleName</key><string>Notes</string>")));
    CHECK(scan.schemes.empty());
    CHECK(scan.errors.empty());
    CHECK_FALSE(HandlesWebUrls(scan.schemes));
}

TEST_CASE("SupportedSchemes keeps valid entries next to malformed ones")
{
    const auto manifest = ManifestDocument::Parse(XmlPlist(R"(
        <key>CFBundleURLTypes</key>
        <array>
            <string>not a dictionary</string>
            <dict><key>CFBundleURLSchemes</key><string>https</string></dict>
            <dict>
                <key>CFBundleURLSchemes</key>
                <array><integer>80</integer><string>https</string></array>
            </dict>
        </array>)"));

    const auto scan = SupportedSchemes(manifest);
    CHECK(scan.schemes == std::set<std::string>{"https"});
    CHECK(HandlesWebUrls(scan.schemes));

    REQUIRE(scan.errors.size() == 3);
    CHECK(scan.errors[0].location() == "CFBundleURLTypes[0]");
    CHECK(scan.errors[1].location() == "CFBundleURLTypes[1].CFBundleURLSchemes");
    CHECK(scan.errors[2].location() == "CFBundleURLTypes[2].CFBundleURLSchemes[0]");
}

TEST_CASE("SupportedSchemes reports a URL type list that is not an array")
{
    const auto scan = SupportedSchemes(
        ManifestDocument::Parse(XmlPlist("<key>CFBundleURLTypes</key><dict><key>x</key><string>y</string></dict>")));
    CHECK(scan.schemes.empty());
    REQUIRE(scan.errors.size() == 1);
    CHECK(scan.errors.front().location() == "CFBundleURLTypes");
}

TEST_CASE("HandlesWebUrls matches schemes exactly")
{
    CHECK(HandlesWebUrls({"http"}));
    CHECK(HandlesWebUrls({"mailto", "https"}));
    CHECK_FALSE(HandlesWebUrls({"HTTP", "Https"}));
    CHECK_FALSE(HandlesWebUrls({"ftp", "file"}));
    CHECK_FALSE(HandlesWebUrls(SupportedSchemes(ManifestDocument::Parse(XmlPlist(UrlTypes({"mailto"})))).schemes));
}
