#ifndef ARBOR_CONTENT_SNIFFER_HPP
#define ARBOR_CONTENT_SNIFFER_HPP

#include "common.hpp"
#include "filesystem.hpp"

// Guesses the MIME type of a file from its first bytes, following the
// WHATWG MIME sniffing signatures.
class ContentTypeSniffer
{
public:
    static constexpr size_t SNIFF_LEN = 512;

    struct Result
    {
        std::string contentType;
        std::string prefix; // bytes consumed from the file, to be sent first
    };

    // reads up to SNIFF_LEN bytes; IoError from the file propagates
    [[nodiscard]] static Result sniff(File &file);

    // never fails, falls back to "application/octet-stream"
    [[nodiscard]] static std::string detect(std::string_view data);

private:
    [[nodiscard]] static bool isHtml(std::string_view data);
    [[nodiscard]] static bool isMp4(std::string_view data);
    [[nodiscard]] static bool isText(std::string_view data);
};

#endif // ARBOR_CONTENT_SNIFFER_HPP
