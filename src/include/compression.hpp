#ifndef ARBOR_COMPRESSION_HPP
#define ARBOR_COMPRESSION_HPP

#include "middleware.hpp"
#include "logger.hpp"

// Middleware gzip-encoding response bodies
class Compression : public Middleware
{
public:
    // Check if content should be compressed based on MIME type and length
    [[nodiscard]]
    static bool shouldCompress(std::string_view mimeType, size_t contentLength);

    // Process and compress the input data
    [[nodiscard]]
    std::string process(const std::string &data) override;

    [[nodiscard]]
    std::string_view encoding() const noexcept override { return "gzip"; }

    // Inverse of process(), used to check round trips
    [[nodiscard]]
    static std::string decompressData(const std::string &data);

    // Minimum size for compression (1KB)
    static constexpr size_t MIN_COMPRESSION_SIZE = 1024;

private:
    // Compress data using zlib
    [[nodiscard]]
    static std::string compressData(const std::string &data);

    // Compressible MIME type prefixes, parameters are ignored
    static constexpr std::array<std::string_view, 7> COMPRESSIBLE_TYPES = {
        "text/",
        "application/javascript",
        "application/json",
        "application/xml",
        "application/wasm",
        "image/svg+xml",
        "application/x-www-form-urlencoded"};

    // Buffer size for compression (32KB)
    static constexpr size_t COMPRESSION_BUFFER_SIZE = 32768;
};

#endif // ARBOR_COMPRESSION_HPP
