#include "compression.hpp"

bool Compression::shouldCompress(std::string_view mimeType, size_t contentLength)
{
    if (contentLength < MIN_COMPRESSION_SIZE)
    {
        return false;
    }

    // check if MIME type is compressible
    return std::any_of(COMPRESSIBLE_TYPES.begin(), COMPRESSIBLE_TYPES.end(),
                       [&](std::string_view type)
                       {
                           return mimeType.starts_with(type); // Check for prefix match
                       });
}

std::string Compression::process(const std::string &data)
{
    std::string compressed = compressData(data);
    Logger::getInstance()->debug(
        "Compressed data: " + std::to_string(data.size()) + " -> " +
        std::to_string(compressed.size()));
    return compressed;
}

std::string Compression::compressData(const std::string &data)
{
    z_stream zs;                // create a z_stream object for compression
    memset(&zs, 0, sizeof(zs)); // zero-initialize z_stream structure

    // initialize the zlib compression
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, // set compression level
                     Z_DEFLATED,                 // use deflate compression method
                     15 | 16,                    // 15 | 16 for gzip encoding
                     8,                          // memory level
                     Z_DEFAULT_STRATEGY) !=      // use default compression strategy
        Z_OK)
    {
        throw std::runtime_error("Failed to initialize zlib");
    }

    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int ret;
    char outbuffer[COMPRESSION_BUFFER_SIZE];
    std::string compressed;

    // compress data in a loop until all data is processed
    do
    {
        zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
        zs.avail_out = COMPRESSION_BUFFER_SIZE;

        ret = deflate(&zs, Z_FINISH);

        if (compressed.size() < zs.total_out)
        {
            compressed.append(outbuffer, zs.total_out - compressed.size());
        }
    } while (ret == Z_OK);

    deflateEnd(&zs);
    if (ret != Z_STREAM_END)
    {
        throw std::runtime_error("Failed to compress data");
    }
    return compressed;
}

std::string Compression::decompressData(const std::string &data)
{
    z_stream zs;
    memset(&zs, 0, sizeof(zs));

    // 15 | 16 accepts the gzip wrapper only
    if (inflateInit2(&zs, 15 | 16) != Z_OK)
    {
        throw std::runtime_error("Failed to initialize zlib");
    }

    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int ret;
    char outbuffer[COMPRESSION_BUFFER_SIZE];
    std::string decompressed;

    do
    {
        zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
        zs.avail_out = COMPRESSION_BUFFER_SIZE;

        ret = inflate(&zs, Z_NO_FLUSH);

        if (decompressed.size() < zs.total_out)
        {
            decompressed.append(outbuffer, zs.total_out - decompressed.size());
        }
    } while (ret == Z_OK);

    inflateEnd(&zs);
    if (ret != Z_STREAM_END)
    {
        throw std::runtime_error("Failed to decompress data");
    }
    return decompressed;
}
