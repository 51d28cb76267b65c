#include "core/property_list.hpp"

#include "utils/scoped_handle.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <openssl/evp.h>

#include <array>
#include <charconv>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <vector>

namespace waypoint::plist
{
namespace
{
constexpr std::string_view kBinaryMagic = "bplist00";
constexpr std::size_t kTrailerSize = 32;
constexpr int kMaxDepth = 64;
// Seconds between the Unix epoch and 2001-01-01T00:00:00Z.
constexpr std::int64_t kReferenceDateOffset = 978307200;

using XmlDocument = Handle<xmlDoc, xmlFreeDoc>;

std::string Base64Encode(std::string_view bytes)
{
    if (bytes.size() > static_cast<std::size_t>(INT_MAX / 4 * 3))
    {
        throw ParseError("Binary property list data object is too large.");
    }

    // EVP_EncodeBlock writes a trailing NUL after the padded output.
    std::string encoded(((bytes.size() + 2) / 3) * 4 + 1, '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        reinterpret_cast<const unsigned char*>(bytes.data()),
        static_cast<int>(bytes.size()));
    if (written < 0)
    {
        throw ParseError("Failed to encode binary property list data.");
    }
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

void AppendUtf8(std::string& output, std::uint32_t codePoint)
{
    if (codePoint < 0x80)
    {
        output.push_back(static_cast<char>(codePoint));
    }
    else if (codePoint < 0x800)
    {
        output.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        output.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    else if (codePoint < 0x10000)
    {
        output.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        output.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    else
    {
        output.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        output.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

std::string FormatReferenceDate(double secondsSinceReference)
{
    if (!std::isfinite(secondsSinceReference))
    {
        throw ParseError("Binary property list contains an invalid date.");
    }

    const std::time_t unixTime
        = static_cast<std::time_t>(kReferenceDateOffset + static_cast<std::int64_t>(std::floor(secondsSinceReference)));
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &unixTime);
#else
    gmtime_r(&unixTime, &utc);
#endif

    std::array<char, 32> buffer{};
    const std::size_t written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer.data(), written);
}

std::string_view Trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// ---------------------------------------------------------------------------
// XML

std::string ElementName(const xmlNode* node)
{
    return node->name != nullptr ? std::string(reinterpret_cast<const char*>(node->name)) : std::string{};
}

std::string ElementText(const xmlNode* node)
{
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr)
    {
        return {};
    }
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return text;
}

std::vector<const xmlNode*> ChildElements(const xmlNode* node)
{
    std::vector<const xmlNode*> children;
    for (const xmlNode* child = node->children; child != nullptr; child = child->next)
    {
        if (child->type == XML_ELEMENT_NODE)
        {
            children.push_back(child);
        }
    }
    return children;
}

std::int64_t ParseInteger(std::string_view text)
{
    text = Trim(text);
    if (!text.empty() && text.front() == '+')
    {
        text.remove_prefix(1);
    }

    std::int64_t value = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || error != std::errc{} || end != text.data() + text.size())
    {
        throw ParseError("Property list <integer> is not a valid integer: '" + std::string(text) + "'.");
    }
    return value;
}

double ParseReal(std::string_view text)
{
    const std::string trimmed(Trim(text));
    char* end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (trimmed.empty() || end != trimmed.c_str() + trimmed.size())
    {
        throw ParseError("Property list <real> is not a valid number: '" + trimmed + "'.");
    }
    return value;
}

nlohmann::json ConvertXmlNode(const xmlNode* node, int depth)
{
    if (depth > kMaxDepth)
    {
        throw ParseError("Property list nesting is too deep.");
    }

    const std::string name = ElementName(node);
    if (name == "dict")
    {
        nlohmann::json object = nlohmann::json::object();
        const auto children = ChildElements(node);
        if (children.size() % 2 != 0)
        {
            throw ParseError("Property list <dict> has a key without a value.");
        }

        for (std::size_t index = 0; index < children.size(); index += 2)
        {
            if (ElementName(children[index]) != "key")
            {
                throw ParseError("Property list <dict> expected <key>, found <" + ElementName(children[index]) + ">.");
            }
            object[ElementText(children[index])] = ConvertXmlNode(children[index + 1], depth + 1);
        }
        return object;
    }

    if (name == "array")
    {
        nlohmann::json array = nlohmann::json::array();
        for (const xmlNode* child : ChildElements(node))
        {
            array.push_back(ConvertXmlNode(child, depth + 1));
        }
        return array;
    }

    if (name == "string" || name == "date")
    {
        return ElementText(node);
    }

    if (name == "data")
    {
        std::string encoded;
        for (char ch : ElementText(node))
        {
            if (ch != ' ' && ch != '\t' && ch != '\r' && ch != '\n')
            {
                encoded.push_back(ch);
            }
        }
        return encoded;
    }

    if (name == "integer")
    {
        return ParseInteger(ElementText(node));
    }

    if (name == "real")
    {
        return ParseReal(ElementText(node));
    }

    if (name == "true")
    {
        return true;
    }

    if (name == "false")
    {
        return false;
    }

    throw ParseError("Unsupported property list element <" + name + ">.");
}

// ---------------------------------------------------------------------------
// Binary

class BinaryReader
{
  public:
    explicit BinaryReader(std::string_view data) : data_(data)
    {
        if (data_.size() < kBinaryMagic.size() + kTrailerSize || !IsBinary(data_))
        {
            throw ParseError("Binary property list is truncated.");
        }

        const std::size_t trailer = data_.size() - kTrailerSize;
        offsetSize_ = Byte(trailer + 6);
        refSize_ = Byte(trailer + 7);
        objectCount_ = ReadBigEndian(trailer + 8, 8);
        topObject_ = ReadBigEndian(trailer + 16, 8);
        offsetTableOffset_ = ReadBigEndian(trailer + 24, 8);

        if (offsetSize_ == 0 || offsetSize_ > 8 || refSize_ == 0 || refSize_ > 8)
        {
            throw ParseError("Binary property list trailer has invalid integer sizes.");
        }
        if (objectCount_ == 0 || topObject_ >= objectCount_)
        {
            throw ParseError("Binary property list trailer has an invalid object count.");
        }
        if (offsetTableOffset_ < kBinaryMagic.size() || offsetTableOffset_ > trailer
            || objectCount_ > (trailer - offsetTableOffset_) / offsetSize_)
        {
            throw ParseError("Binary property list offset table is out of range.");
        }

        visiting_.assign(static_cast<std::size_t>(objectCount_), false);
    }

    nlohmann::json Read() { return ReadObject(topObject_, 0); }

  private:
    [[nodiscard]] std::uint8_t Byte(std::size_t offset) const
    {
        return static_cast<std::uint8_t>(data_[offset]);
    }

    void Require(std::uint64_t offset, std::uint64_t length) const
    {
        if (offset > offsetTableOffset_ || length > offsetTableOffset_ - offset)
        {
            throw ParseError("Binary property list object runs past the object table.");
        }
    }

    [[nodiscard]] std::uint64_t ReadBigEndian(std::size_t offset, std::size_t width) const
    {
        std::uint64_t value = 0;
        for (std::size_t index = 0; index < width; ++index)
        {
            value = (value << 8) | Byte(offset + index);
        }
        return value;
    }

    [[nodiscard]] std::uint64_t ObjectOffset(std::uint64_t reference) const
    {
        const std::uint64_t offset
            = ReadBigEndian(static_cast<std::size_t>(offsetTableOffset_ + reference * offsetSize_), offsetSize_);
        if (offset < kBinaryMagic.size() || offset >= offsetTableOffset_)
        {
            throw ParseError("Binary property list object offset is out of range.");
        }
        return offset;
    }

    // Returns the element count of a container/string object and moves
    // |offset| to the first payload byte.
    std::uint64_t ReadCount(std::uint64_t& offset, std::uint8_t lowNibble) const
    {
        offset += 1;
        if (lowNibble != 0x0F)
        {
            return lowNibble;
        }

        Require(offset, 1);
        const std::uint8_t marker = Byte(static_cast<std::size_t>(offset));
        if ((marker >> 4) != 0x1 || (marker & 0x0F) > 3)
        {
            throw ParseError("Binary property list has an invalid length marker.");
        }
        const std::size_t width = std::size_t{1} << (marker & 0x0F);
        Require(offset + 1, width);
        const std::uint64_t count = ReadBigEndian(static_cast<std::size_t>(offset + 1), width);
        offset += 1 + width;
        return count;
    }

    [[nodiscard]] std::uint64_t ReadReference(std::uint64_t offset) const
    {
        return ReadBigEndian(static_cast<std::size_t>(offset), refSize_);
    }

    nlohmann::json ReadObject(std::uint64_t reference, int depth)
    {
        if (depth > kMaxDepth)
        {
            throw ParseError("Binary property list nesting is too deep.");
        }
        if (reference >= objectCount_)
        {
            throw ParseError("Binary property list references a missing object.");
        }
        if (visiting_[static_cast<std::size_t>(reference)])
        {
            throw ParseError("Binary property list contains a reference cycle.");
        }

        std::uint64_t offset = ObjectOffset(reference);
        const std::uint8_t marker = Byte(static_cast<std::size_t>(offset));
        const std::uint8_t type = marker >> 4;
        const std::uint8_t info = marker & 0x0F;

        switch (type)
        {
        case 0x0:
            if (info == 0x8)
            {
                return false;
            }
            if (info == 0x9)
            {
                return true;
            }
            if (info == 0x0)
            {
                return nullptr;
            }
            break;
        case 0x1: {
            if (info > 3)
            {
                throw ParseError("Binary property list integer wider than 64 bits.");
            }
            const std::size_t width = std::size_t{1} << info;
            Require(offset + 1, width);
            const std::uint64_t raw = ReadBigEndian(static_cast<std::size_t>(offset + 1), width);
            if (width == 8)
            {
                return static_cast<std::int64_t>(raw);
            }
            return raw;
        }
        case 0x2:
        case 0x3: {
            if ((type == 0x2 && info != 2 && info != 3) || (type == 0x3 && info != 3))
            {
                break;
            }
            const std::size_t width = std::size_t{1} << info;
            Require(offset + 1, width);
            const std::uint64_t raw = ReadBigEndian(static_cast<std::size_t>(offset + 1), width);
            double value = 0.0;
            if (width == 4)
            {
                const auto narrow = static_cast<std::uint32_t>(raw);
                float single = 0.0f;
                std::memcpy(&single, &narrow, sizeof(single));
                value = single;
            }
            else
            {
                std::memcpy(&value, &raw, sizeof(value));
            }
            if (type == 0x3)
            {
                return FormatReferenceDate(value);
            }
            return value;
        }
        case 0x4: {
            const std::uint64_t length = ReadCount(offset, info);
            Require(offset, length);
            return Base64Encode(data_.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length)));
        }
        case 0x5: {
            const std::uint64_t length = ReadCount(offset, info);
            Require(offset, length);
            return std::string(data_.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length)));
        }
        case 0x6: {
            const std::uint64_t units = ReadCount(offset, info);
            if (units > offsetTableOffset_ / 2)
            {
                throw ParseError("Binary property list string length is out of range.");
            }
            Require(offset, units * 2);
            return DecodeUtf16(static_cast<std::size_t>(offset), static_cast<std::size_t>(units));
        }
        case 0x8: {
            const std::size_t width = static_cast<std::size_t>(info) + 1;
            if (width > 8)
            {
                break;
            }
            Require(offset + 1, width);
            nlohmann::json uid = nlohmann::json::object();
            uid["CF$UID"] = ReadBigEndian(static_cast<std::size_t>(offset + 1), width);
            return uid;
        }
        case 0xA: {
            const std::uint64_t count = ReadCount(offset, info);
            if (count > objectCount_)
            {
                throw ParseError("Binary property list array is larger than the object table.");
            }
            Require(offset, count * refSize_);

            visiting_[static_cast<std::size_t>(reference)] = true;
            nlohmann::json array = nlohmann::json::array();
            for (std::uint64_t index = 0; index < count; ++index)
            {
                array.push_back(ReadObject(ReadReference(offset + index * refSize_), depth + 1));
            }
            visiting_[static_cast<std::size_t>(reference)] = false;
            return array;
        }
        case 0xD: {
            const std::uint64_t count = ReadCount(offset, info);
            if (count > objectCount_)
            {
                throw ParseError("Binary property list dict is larger than the object table.");
            }
            Require(offset, count * refSize_ * 2);

            visiting_[static_cast<std::size_t>(reference)] = true;
            nlohmann::json object = nlohmann::json::object();
            const std::uint64_t valuesOffset = offset + count * refSize_;
            for (std::uint64_t index = 0; index < count; ++index)
            {
                nlohmann::json key = ReadObject(ReadReference(offset + index * refSize_), depth + 1);
                if (!key.is_string())
                {
                    throw ParseError("Binary property list dict has a non-string key.");
                }
                object[key.get<std::string>()] = ReadObject(ReadReference(valuesOffset + index * refSize_), depth + 1);
            }
            visiting_[static_cast<std::size_t>(reference)] = false;
            return object;
        }
        default:
            break;
        }

        throw ParseError("Binary property list has an unsupported object marker.");
    }

    std::string DecodeUtf16(std::size_t offset, std::size_t units) const
    {
        std::string output;
        output.reserve(units);
        for (std::size_t index = 0; index < units; ++index)
        {
            std::uint32_t unit = static_cast<std::uint32_t>(ReadBigEndian(offset + index * 2, 2));
            if (unit >= 0xD800 && unit <= 0xDBFF && index + 1 < units)
            {
                const auto low = static_cast<std::uint32_t>(ReadBigEndian(offset + (index + 1) * 2, 2));
                if (low >= 0xDC00 && low <= 0xDFFF)
                {
                    unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                    ++index;
                }
            }
            AppendUtf8(output, unit);
        }
        return output;
    }

    std::string_view data_;
    std::size_t offsetSize_ = 0;
    std::size_t refSize_ = 0;
    std::uint64_t objectCount_ = 0;
    std::uint64_t topObject_ = 0;
    std::uint64_t offsetTableOffset_ = 0;
    std::vector<bool> visiting_;
};

} // namespace

bool IsBinary(std::string_view data) noexcept
{
    return data.substr(0, kBinaryMagic.size()) == kBinaryMagic;
}

nlohmann::json ParseXml(std::string_view data)
{
    if (data.size() > static_cast<std::size_t>(INT_MAX))
    {
        throw ParseError("Property list is too large.");
    }

    // libxml2 must be initialised once before documents are parsed from
    // several scanner threads.
    static const bool parserReady = (xmlInitParser(), true);
    static_cast<void>(parserReady);

    XmlDocument document{xmlReadMemory(
        data.data(),
        static_cast<int>(data.size()),
        nullptr,
        nullptr,
        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING)};
    if (!document)
    {
        const xmlError* error = xmlGetLastError();
        std::string message = "Property list is not well-formed XML";
        if (error != nullptr && error->message != nullptr)
        {
            message += ": ";
            message += Trim(error->message);
        }
        throw ParseError(message);
    }

    const xmlNode* root = xmlDocGetRootElement(document.get());
    if (root == nullptr || ElementName(root) != "plist")
    {
        throw ParseError("Document root is not a <plist> element.");
    }

    const auto children = ChildElements(root);
    if (children.size() != 1)
    {
        throw ParseError("A <plist> element must contain exactly one value.");
    }

    return ConvertXmlNode(children.front(), 0);
}

nlohmann::json ParseBinary(std::string_view data)
{
    BinaryReader reader{data};
    return reader.Read();
}

nlohmann::json Parse(std::string_view data)
{
    if (IsBinary(data))
    {
        return ParseBinary(data);
    }
    return ParseXml(data);
}

} // namespace waypoint::plist
