#pragma once

#include "doctest/doctest.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace waypoint::testing
{

//! Removes the directory tree when the test scope ends.
class TempDirectory
{
  public:
    //! Creates a fresh directory named |prefix|-<random> under the system
    //! temp directory.
    explicit TempDirectory(std::string_view prefix)
    {
        static std::mt19937_64 generator{std::random_device{}()};
        const auto base = std::filesystem::temp_directory_path();

        for (int attempt = 0; attempt < 16; ++attempt)
        {
            auto candidate = base / (std::string{prefix} + "-" + std::to_string(generator()));
            std::error_code ec;
            if (std::filesystem::create_directory(candidate, ec))
            {
                path_ = std::move(candidate);
                return;
            }
        }
        throw std::runtime_error("Unable to create a temporary directory for " + std::string{prefix});
    }

    ~TempDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

inline std::filesystem::path WriteFile(const std::filesystem::path& path, std::string_view contents)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output{path, std::ios::binary};
    REQUIRE(output.is_open());
    output << contents;
    return path;
}

inline std::string XmlPlist(std::string_view body)
{
    std::string document = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE plist PUBLIC "-//Apple//DTD PLIST 1.0//EN" "http://www.apple.com/DTDs/PropertyList-1.0.dtd">
<plist version="1.0">
<dict>
)";
    document += body;
    document += "\n</dict>\n</plist>\n";
    return document;
}

inline std::string UrlTypes(const std::vector<std::string>& schemes)
{
    std::string xml = "<key>CFBundleURLTypes</key><array><dict><key>CFBundleURLName</key><string>Web site URL</string>"
                      "<key>CFBundleURLSchemes</key><array>";
    for (const auto& scheme : schemes)
    {
        xml += "<string>" + scheme + "</string>";
    }
    xml += "</array></dict></array>";
    return xml;
}

inline std::string BrowserPlistBody(
    std::string_view name,
    std::string_view executable,
    std::string_view version,
    const std::vector<std::string>& schemes = {"http", "https"})
{
    std::string body;
    body += "<key>CFBundleExecutable</key><string>" + std::string{executable} + "</string>\n";
    body += "<key>CFBundleName</key><string>" + std::string{name} + "</string>\n";
    body += "<key>CFBundleShortVersionString</key><string>" + std::string{version} + "</string>\n";
    body += UrlTypes(schemes);
    return body;
}

//! Lays out <root>/<entry>/Contents/{Info.plist,MacOS/<executable>}.
inline std::filesystem::path MakeBundle(
    const std::filesystem::path& root,
    std::string_view entry,
    std::string_view plistBody,
    std::string_view executable = {})
{
    const auto bundle = root / entry;
    WriteFile(bundle / "Contents" / "Info.plist", XmlPlist(plistBody));
    if (!executable.empty())
    {
        WriteFile(bundle / "Contents" / "MacOS" / executable, "#!/bin/sh\n");
    }
    return bundle;
}

/**
 * @brief Assembles a bplist00 document from pre-encoded objects.
 *
 * Object references and offsets are one byte wide, which is enough for the
 * small documents the tests need.
 */
class BinaryPlistBuilder
{
  public:
    std::size_t Add(std::string encoded)
    {
        objects_.push_back(std::move(encoded));
        return objects_.size() - 1;
    }

    std::size_t AddAscii(std::string_view text)
    {
        std::string encoded;
        AppendMarker(encoded, 0x50, text.size());
        encoded += text;
        return Add(std::move(encoded));
    }

    std::size_t AddUtf16(const std::vector<std::uint16_t>& units)
    {
        std::string encoded;
        AppendMarker(encoded, 0x60, units.size());
        for (std::uint16_t unit : units)
        {
            encoded.push_back(static_cast<char>(unit >> 8));
            encoded.push_back(static_cast<char>(unit & 0xFF));
        }
        return Add(std::move(encoded));
    }

    std::size_t AddData(std::string_view bytes)
    {
        std::string encoded;
        AppendMarker(encoded, 0x40, bytes.size());
        encoded += bytes;
        return Add(std::move(encoded));
    }

    std::size_t AddInteger(std::uint8_t value) { return Add(std::string{'\x10', static_cast<char>(value)}); }

    std::size_t AddBool(bool value) { return Add(std::string(1, value ? '\x09' : '\x08')); }

    std::size_t AddArray(const std::vector<std::size_t>& references)
    {
        std::string encoded;
        AppendMarker(encoded, 0xA0, references.size());
        for (std::size_t reference : references)
        {
            encoded.push_back(static_cast<char>(reference));
        }
        return Add(std::move(encoded));
    }

    std::size_t AddDict(const std::vector<std::pair<std::size_t, std::size_t>>& entries)
    {
        return Add(EncodeDict(entries));
    }

    [[nodiscard]] static std::string EncodeDict(const std::vector<std::pair<std::size_t, std::size_t>>& entries)
    {
        std::string encoded;
        AppendMarker(encoded, 0xD0, entries.size());
        for (const auto& entry : entries)
        {
            encoded.push_back(static_cast<char>(entry.first));
        }
        for (const auto& entry : entries)
        {
            encoded.push_back(static_cast<char>(entry.second));
        }
        return encoded;
    }

    //! Placeholder whose contents are filled in later, for self references.
    std::size_t Reserve() { return Add({}); }
    void Replace(std::size_t reference, std::string encoded) { objects_[reference] = std::move(encoded); }

    [[nodiscard]] std::string Build(std::size_t topObject) const
    {
        std::string data = "bplist00";
        std::vector<std::size_t> offsets;
        for (const auto& object : objects_)
        {
            offsets.push_back(data.size());
            data += object;
        }

        const std::size_t offsetTable = data.size();
        for (std::size_t offset : offsets)
        {
            REQUIRE(offset < 256);
            data.push_back(static_cast<char>(offset));
        }

        data.append(6, '\0');
        data.push_back('\x01');
        data.push_back('\x01');
        AppendBigEndian(data, objects_.size());
        AppendBigEndian(data, topObject);
        AppendBigEndian(data, offsetTable);
        return data;
    }

  private:
    static void AppendMarker(std::string& encoded, std::uint8_t type, std::size_t count)
    {
        if (count < 0x0F)
        {
            encoded.push_back(static_cast<char>(type | count));
            return;
        }
        encoded.push_back(static_cast<char>(type | 0x0F));
        encoded.push_back('\x10');
        encoded.push_back(static_cast<char>(count));
    }

    static void AppendBigEndian(std::string& data, std::uint64_t value)
    {
        for (int shift = 56; shift >= 0; shift -= 8)
        {
            data.push_back(static_cast<char>((value >> shift) & 0xFF));
        }
    }

    std::vector<std::string> objects_;
};

} // namespace waypoint::testing
