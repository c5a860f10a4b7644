#ifndef ARBOR_HTTP_HPP
#define ARBOR_HTTP_HPP

#include "common.hpp"
#include "logger.hpp"
#include "middleware.hpp"

struct HttpRequest
{
    std::string method;
    std::string target; // request target as received
    std::string path;   // percent-decoded, query removed
    std::map<std::string, std::string> query;
    std::unordered_map<std::string, std::string> headers; // lower-cased names
    std::string version;
    size_t contentLength{0};

    // "" when absent; name must be lower case
    [[nodiscard]] std::string header(const std::string &name) const;
    [[nodiscard]] bool keepAlive() const;
    [[nodiscard]] bool acceptsGzip() const;
};

struct HttpResponse
{
    int status{200};
    std::string contentType;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers; // extra headers
};

class Http
{
public:
    // request heads larger than this are rejected with 431
    static constexpr size_t MAX_HEADER_SIZE = 16384;
    static constexpr std::string_view HEADER_TERMINATOR = "\r\n\r\n";

    // parse a request head (everything before the blank line);
    // nullopt for anything that is not a well-formed HTTP/1.x request
    [[nodiscard]] static std::optional<HttpRequest> parseRequest(std::string_view head);

    // decode %XX escapes; nullopt on a malformed escape
    [[nodiscard]] static std::optional<std::string> percentDecode(std::string_view text,
                                                                  bool plusAsSpace = false);

    [[nodiscard]] static std::string_view statusText(int status) noexcept;

    // plain-text response carrying the reason phrase
    [[nodiscard]] static HttpResponse errorResponse(int status);

    [[nodiscard]] static std::string generateHeaders(const HttpResponse &response,
                                                     size_t contentLength,
                                                     std::string_view contentEncoding,
                                                     bool keepAlive);

    // send headers and body, encoded through middleware when the client allows it;
    // returns the number of bytes written
    static size_t sendResponse(int client_socket, const HttpResponse &response,
                               const std::string &clientIp, bool keepAlive,
                               Middleware *middleware = nullptr, bool acceptsGzip = false);

    // TCP keep-alive probing for accepted connections
    [[nodiscard]] static bool setupSocketOptions(int client_socket, const std::string &clientIp);

private:
    // Socket option settings
    struct SocketSettings
    {
        static constexpr int keepAlive = 1;
        static constexpr int keepIdle = 60;
        static constexpr int keepInterval = 10;
        static constexpr int keepCount = 3;
        static constexpr int noDelay = 1;
    };

    [[nodiscard]] static size_t sendWithWritev(int client_socket, const std::string &headerStr,
                                               std::string_view content,
                                               const std::string &clientIp);
};

#endif // ARBOR_HTTP_HPP
