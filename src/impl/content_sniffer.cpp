#include "content_sniffer.hpp"

namespace
{
    // byte signature with a mask; a 0xFF mask byte compares exactly, 0x00 skips
    struct MaskedSignature
    {
        std::string_view mask;
        std::string_view pattern;
        const char *contentType;
    };

    struct PrefixSignature
    {
        std::string_view prefix;
        const char *contentType;
    };

    using namespace std::string_view_literals;

    const std::array<PrefixSignature, 26> PREFIX_SIGNATURES = {{
        {"%PDF-"sv, "application/pdf"},
        {"%!PS-Adobe-"sv, "application/postscript"},
        {"\xFE\xFF"sv, "text/plain; charset=utf-16be"},
        {"\xFF\xFE"sv, "text/plain; charset=utf-16le"},
        {"\xEF\xBB\xBF"sv, "text/plain; charset=utf-8"},
        {"\x00\x00\x01\x00"sv, "image/x-icon"},
        {"\x00\x00\x02\x00"sv, "image/x-icon"},
        {"BM"sv, "image/bmp"},
        {"GIF87a"sv, "image/gif"},
        {"GIF89a"sv, "image/gif"},
        {"\x89PNG\x0D\x0A\x1A\x0A"sv, "image/png"},
        {"\xFF\xD8\xFF"sv, "image/jpeg"},
        {"ID3"sv, "audio/mpeg"},
        {"OggS\x00"sv, "application/ogg"},
        {"MThd\x00\x00\x00\x06"sv, "audio/midi"},
        {"\x1A\x45\xDF\xA3"sv, "video/webm"},
        {"\x00\x01\x00\x00"sv, "font/ttf"},
        {"OTTO"sv, "font/otf"},
        {"ttcf"sv, "font/collection"},
        {"wOFF"sv, "font/woff"},
        {"wOF2"sv, "font/woff2"},
        {"\x1F\x8B\x08"sv, "application/x-gzip"},
        {"PK\x03\x04"sv, "application/zip"},
        {"Rar!\x1A\x07\x00"sv, "application/x-rar-compressed"},
        {"Rar!\x1A\x07\x01\x00"sv, "application/x-rar-compressed"},
        {"\x00\x61\x73\x6D"sv, "application/wasm"},
    }};

    // RIFF and FORM containers carry the format four bytes after the size
    const std::array<MaskedSignature, 4> MASKED_SIGNATURES = {{
        {"\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF\xFF\xFF"sv,
         "RIFF\x00\x00\x00\x00WEBPVP"sv, "image/webp"},
        {"\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF"sv,
         "FORM\x00\x00\x00\x00" "AIFF"sv, "audio/aiff"},
        {"\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF"sv,
         "RIFF\x00\x00\x00\x00" "AVI "sv, "video/avi"},
        {"\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF"sv,
         "RIFF\x00\x00\x00\x00WAVE"sv, "audio/wave"},
    }};

    // tags that open an HTML document, matched case-insensitively
    const std::array<std::string_view, 17> HTML_TAGS = {
        "<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT", "<IFRAME", "<H1", "<DIV",
        "<FONT", "<TABLE", "<A", "<STYLE", "<TITLE", "<B", "<BODY", "<BR", "<P", "<!--"};

    bool isWhitespace(unsigned char c)
    {
        return c == '\t' || c == '\n' || c == '\x0C' || c == '\r' || c == ' ';
    }

    std::string_view skipWhitespace(std::string_view data)
    {
        size_t i = 0;
        while (i < data.size() && isWhitespace(static_cast<unsigned char>(data[i])))
            ++i;
        return data.substr(i);
    }

    bool matchesMasked(std::string_view data, const MaskedSignature &sig)
    {
        if (data.size() < sig.pattern.size())
            return false;
        for (size_t i = 0; i < sig.pattern.size(); ++i)
        {
            if ((data[i] & sig.mask[i]) != sig.pattern[i])
                return false;
        }
        return true;
    }
}

bool ContentTypeSniffer::isHtml(std::string_view data)
{
    std::string_view rest = skipWhitespace(data);
    for (std::string_view tag : HTML_TAGS)
    {
        if (rest.size() <= tag.size())
            continue;

        bool matches = true;
        for (size_t i = 0; i < tag.size(); ++i)
        {
            char c = rest[i];
            if (std::isalpha(static_cast<unsigned char>(tag[i])))
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (c != tag[i])
            {
                matches = false;
                break;
            }
        }

        // the tag name must end right there
        char terminator = rest[tag.size()];
        if (matches && (terminator == ' ' || terminator == '>'))
            return true;
    }
    return false;
}

bool ContentTypeSniffer::isMp4(std::string_view data)
{
    if (data.size() < 12)
        return false;

    uint32_t boxSize = (static_cast<uint32_t>(static_cast<unsigned char>(data[0])) << 24) |
                       (static_cast<uint32_t>(static_cast<unsigned char>(data[1])) << 16) |
                       (static_cast<uint32_t>(static_cast<unsigned char>(data[2])) << 8) |
                       static_cast<uint32_t>(static_cast<unsigned char>(data[3]));
    if (data.size() < boxSize || boxSize % 4 != 0 || data.substr(4, 4) != "ftyp")
        return false;

    // major brand at 8, compatible brands from 16; 12 holds the minor version
    for (size_t at = 8; at + 3 <= boxSize; at += 4)
    {
        if (at == 12)
            continue;
        if (data.substr(at, 3) == "mp4")
            return true;
    }
    return false;
}

bool ContentTypeSniffer::isText(std::string_view data)
{
    return std::none_of(data.begin(), data.end(), [](char ch)
                        {
                            auto c = static_cast<unsigned char>(ch);
                            return c <= 0x08 || c == 0x0B || (c >= 0x0E && c <= 0x1A) ||
                                   (c >= 0x1C && c <= 0x1F); });
}

std::string ContentTypeSniffer::detect(std::string_view data)
{
    if (data.size() > SNIFF_LEN)
        data = data.substr(0, SNIFF_LEN);

    if (isHtml(data))
        return "text/html; charset=utf-8";
    if (skipWhitespace(data).starts_with("<?xml"))
        return "text/xml; charset=utf-8";

    for (const auto &sig : PREFIX_SIGNATURES)
    {
        if (data.starts_with(sig.prefix))
            return sig.contentType;
    }
    for (const auto &sig : MASKED_SIGNATURES)
    {
        if (matchesMasked(data, sig))
            return sig.contentType;
    }
    if (isMp4(data))
        return "video/mp4";

    if (isText(data))
        return "text/plain; charset=utf-8";
    return "application/octet-stream";
}

ContentTypeSniffer::Result ContentTypeSniffer::sniff(File &file)
{
    Result result;
    result.prefix.resize(SNIFF_LEN);

    size_t filled = 0;
    while (filled < SNIFF_LEN)
    {
        size_t n = file.read(result.prefix.data() + filled, SNIFF_LEN - filled);
        if (n == 0)
            break;
        filled += n;
    }
    result.prefix.resize(filled);

    result.contentType = detect(result.prefix);
    return result;
}
