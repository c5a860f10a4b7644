#include "http.hpp"
#include "compression.hpp"

namespace
{
    std::string toLower(std::string_view text)
    {
        std::string lower(text);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    std::string_view trim(std::string_view text)
    {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
            text.remove_prefix(1);
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
            text.remove_suffix(1);
        return text;
    }

    bool isToken(std::string_view text)
    {
        static constexpr std::string_view SEPARATORS = "()<>@,;:\\\"/[]?={} \t";
        return !text.empty() &&
               std::all_of(text.begin(), text.end(), [](unsigned char c)
                           { return c > 0x20 && c < 0x7F && SEPARATORS.find(static_cast<char>(c)) ==
                                                                 std::string_view::npos; });
    }

    int hexValue(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }
}

std::string HttpRequest::header(const std::string &name) const
{
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

bool HttpRequest::keepAlive() const
{
    // bodies are never read, so a request carrying one ends the connection
    if (contentLength > 0 || headers.contains("transfer-encoding"))
    {
        return false;
    }

    std::string connection = toLower(header("connection"));
    if (version == "HTTP/1.0")
    {
        return connection.find("keep-alive") != std::string::npos;
    }
    return connection.find("close") == std::string::npos;
}

bool HttpRequest::acceptsGzip() const
{
    std::string encodings = toLower(header("accept-encoding"));
    std::string_view rest(encodings);
    while (!rest.empty())
    {
        size_t comma = rest.find(',');
        std::string_view item = trim(rest.substr(0, comma));
        rest = comma == std::string_view::npos ? std::string_view() : rest.substr(comma + 1);

        size_t semicolon = item.find(';');
        std::string_view coding = trim(item.substr(0, semicolon));
        if (coding != "gzip" && coding != "*")
        {
            continue;
        }

        // "gzip;q=0" explicitly refuses the coding
        if (semicolon != std::string_view::npos)
        {
            std::string_view params = trim(item.substr(semicolon + 1));
            if (params.starts_with("q=") && std::all_of(params.begin() + 2, params.end(), [](char c)
                                                        { return c == '0' || c == '.'; }))
            {
                continue;
            }
        }
        return true;
    }
    return false;
}

std::optional<std::string> Http::percentDecode(std::string_view text, bool plusAsSpace)
{
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '%')
        {
            if (i + 2 >= text.size())
                return std::nullopt;
            int high = hexValue(text[i + 1]);
            int low = hexValue(text[i + 2]);
            if (high < 0 || low < 0)
                return std::nullopt;
            decoded += static_cast<char>((high << 4) | low);
            i += 2;
        }
        else if (c == '+' && plusAsSpace)
        {
            decoded += ' ';
        }
        else
        {
            decoded += c;
        }
    }
    return decoded;
}

std::optional<HttpRequest> Http::parseRequest(std::string_view head)
{
    HttpRequest request;

    size_t lineEnd = head.find("\r\n");
    std::string_view requestLine = head.substr(0, lineEnd);
    std::string_view headerBlock = lineEnd == std::string_view::npos ? std::string_view()
                                                                     : head.substr(lineEnd + 2);

    // METHOD SP target SP version
    size_t firstSpace = requestLine.find(' ');
    size_t lastSpace = requestLine.rfind(' ');
    if (firstSpace == std::string_view::npos || firstSpace == lastSpace)
    {
        return std::nullopt;
    }

    std::string_view method = requestLine.substr(0, firstSpace);
    std::string_view target = requestLine.substr(firstSpace + 1, lastSpace - firstSpace - 1);
    std::string_view version = requestLine.substr(lastSpace + 1);

    if (!isToken(method) || target.empty() || target.front() != '/' ||
        target.find(' ') != std::string_view::npos ||
        (version != "HTTP/1.0" && version != "HTTP/1.1"))
    {
        return std::nullopt;
    }

    request.method = std::string(method);
    request.target = std::string(target);
    request.version = std::string(version);

    size_t questionMark = target.find('?');
    auto path = percentDecode(target.substr(0, questionMark));
    if (!path)
    {
        return std::nullopt;
    }
    request.path = std::move(*path);

    if (questionMark != std::string_view::npos)
    {
        std::string_view query = target.substr(questionMark + 1);
        while (!query.empty())
        {
            size_t amp = query.find('&');
            std::string_view pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);
            if (pair.empty())
                continue;

            size_t equals = pair.find('=');
            auto key = percentDecode(pair.substr(0, equals), true);
            auto value = percentDecode(equals == std::string_view::npos ? std::string_view()
                                                                        : pair.substr(equals + 1),
                                       true);
            // malformed pairs are dropped, first occurrence wins
            if (key && value)
                request.query.emplace(std::move(*key), std::move(*value));
        }
    }

    while (!headerBlock.empty())
    {
        size_t end = headerBlock.find("\r\n");
        std::string_view line = headerBlock.substr(0, end);
        headerBlock = end == std::string_view::npos ? std::string_view() : headerBlock.substr(end + 2);
        if (line.empty())
            continue;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || !isToken(line.substr(0, colon)))
        {
            return std::nullopt;
        }

        std::string name = toLower(line.substr(0, colon));
        std::string value(trim(line.substr(colon + 1)));

        auto [it, inserted] = request.headers.emplace(name, value);
        if (!inserted)
        {
            it->second += ", " + value;
        }
    }

    if (auto it = request.headers.find("content-length"); it != request.headers.end())
    {
        const std::string &value = it->second;
        if (value.empty() || value.size() > 18 ||
            !std::all_of(value.begin(), value.end(), [](unsigned char c)
                         { return std::isdigit(c); }))
        {
            return std::nullopt;
        }
        request.contentLength = std::stoull(value);
    }

    return request;
}

std::string_view Http::statusText(int status) noexcept
{
    switch (status)
    {
    case 200:
        return "OK";
    case 304:
        return "Not Modified";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 408:
        return "Request Timeout";
    case 431:
        return "Request Header Fields Too Large";
    case 500:
        return "Internal Server Error";
    case 503:
        return "Service Unavailable";
    case 505:
        return "HTTP Version Not Supported";
    default:
        return "Unknown Status";
    }
}

HttpResponse Http::errorResponse(int status)
{
    HttpResponse response;
    response.status = status;
    response.contentType = "text/plain; charset=utf-8";
    response.body = std::string(statusText(status));
    return response;
}

std::string Http::generateHeaders(const HttpResponse &response, size_t contentLength,
                                  std::string_view contentEncoding, bool keepAlive)
{
    std::string headerStr;
    headerStr.reserve(512);

    char timeBuffer[128];
    time_t now = time(nullptr);
    struct tm tmBuf;
    const struct tm *tm_info = gmtime_r(&now, &tmBuf); // thread-safe version
    strftime(timeBuffer, sizeof(timeBuffer), "%a, %d %b %Y %H:%M:%S GMT", tm_info);

    headerStr = "HTTP/1.1 " + std::to_string(response.status) + " " +
                std::string(statusText(response.status)) +
                "\r\n"
                "Server: Arbor/1.0\r\n"
                "Date: " +
                std::string(timeBuffer) + "\r\n";

    if (!response.contentType.empty())
    {
        headerStr += "Content-Type: " + response.contentType + "\r\n";
    }
    headerStr += "Content-Length: " + std::to_string(contentLength) + "\r\n";

    if (keepAlive)
    {
        headerStr += "Connection: keep-alive\r\n"
                     "Keep-Alive: timeout=60, max=1000\r\n";
    }
    else
    {
        headerStr += "Connection: close\r\n";
    }
    headerStr += "X-Content-Type-Options: nosniff\r\n";

    for (const auto &[name, value] : response.headers)
    {
        headerStr += name + ": " + value + "\r\n";
    }

    if (!contentEncoding.empty())
    {
        headerStr += "Content-Encoding: " + std::string(contentEncoding) +
                     "\r\n"
                     "Vary: Accept-Encoding\r\n";
    }
    headerStr += "\r\n";

    return headerStr;
}

size_t Http::sendResponse(int client_socket, const HttpResponse &response,
                          const std::string &clientIp, bool keepAlive,
                          Middleware *middleware, bool acceptsGzip)
{
    auto startTime = std::chrono::steady_clock::now();

    std::string compressed;
    bool isCompressed = false;
    if (middleware && acceptsGzip &&
        Compression::shouldCompress(response.contentType, response.body.size()))
    {
        try
        {
            compressed = middleware->process(response.body);
            isCompressed = true;
        }
        catch (const std::runtime_error &e)
        {
            Logger::getInstance()->warning(std::string("Compression failed, sending identity: ") +
                                               e.what(),
                                           clientIp);
        }
    }

    std::string_view content = isCompressed ? std::string_view(compressed)
                                            : std::string_view(response.body);
    std::string headerStr = generateHeaders(response, content.size(),
                                            isCompressed ? middleware->encoding() : std::string_view(),
                                            keepAlive);
    size_t totalBytesSent = sendWithWritev(client_socket, headerStr, content, clientIp);

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::getInstance()->debug(
        "Response sent: status=" + std::to_string(response.status) +
            ", type=" + response.contentType +
            ", size=" + std::to_string(content.size()) +
            (isCompressed ? ", encoding=" + std::string(middleware->encoding()) : std::string()) +
            ", time=" + std::to_string(duration.count()) + "µs" +
            ", bytes=" + std::to_string(totalBytesSent),
        clientIp);

    return totalBytesSent;
}

size_t Http::sendWithWritev(int client_socket, const std::string &headerStr,
                            std::string_view content, const std::string &clientIp)
{
    // use writev for headers + content in memory
    std::array<struct iovec, 2> iov;
    iov[0].iov_base = const_cast<char *>(headerStr.data());
    iov[0].iov_len = headerStr.size();
    iov[1].iov_base = const_cast<char *>(content.data());
    iov[1].iov_len = content.size();

    size_t totalSize = headerStr.size() + content.size();
    size_t totalSent = 0;
    int iovcnt = content.empty() ? 1 : 2;

    while (totalSent < totalSize && iovcnt > 0)
    {
        ssize_t sent = writev(client_socket, iov.data(), iovcnt);
        if (sent < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                std::this_thread::sleep_for(std::chrono::microseconds(1000));
                continue;
            }
            Logger::getInstance()->error(
                "Failed to send response: " + std::string(strerror(errno)), clientIp);
            break;
        }
        totalSent += static_cast<size_t>(sent);

        // update iovec structures
        while (sent > 0 && iovcnt > 0)
        {
            if (static_cast<size_t>(sent) >= iov[0].iov_len)
            {
                sent -= static_cast<ssize_t>(iov[0].iov_len);
                iovcnt--;
                if (iovcnt > 0)
                {
                    iov[0] = iov[1];
                }
            }
            else
            {
                iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + sent;
                iov[0].iov_len -= static_cast<size_t>(sent);
                break;
            }
        }
    }
    return totalSent;
}

bool Http::setupSocketOptions(int client_socket, const std::string &clientIp)
{
    auto setSocketOption = [&](int level, int optname, const void *optval,
                               socklen_t optlen)
    {
        if (setsockopt(client_socket, level, optname, optval, optlen) < 0)
        {
            Logger::getInstance()->error("Failed to set socket option: " +
                                             std::string(strerror(errno)),
                                         clientIp);
            return false;
        }
        return true;
    };

    return setSocketOption(SOL_SOCKET, SO_KEEPALIVE, &SocketSettings::keepAlive,
                           sizeof(SocketSettings::keepAlive)) &&
           setSocketOption(IPPROTO_TCP, TCP_KEEPIDLE, &SocketSettings::keepIdle,
                           sizeof(SocketSettings::keepIdle)) &&
           setSocketOption(IPPROTO_TCP, TCP_KEEPINTVL, &SocketSettings::keepInterval,
                           sizeof(SocketSettings::keepInterval)) &&
           setSocketOption(IPPROTO_TCP, TCP_KEEPCNT, &SocketSettings::keepCount,
                           sizeof(SocketSettings::keepCount)) &&
           setSocketOption(IPPROTO_TCP, TCP_NODELAY, &SocketSettings::noDelay,
                           sizeof(SocketSettings::noDelay));
}
