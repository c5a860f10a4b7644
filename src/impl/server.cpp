#include "server.hpp"
#include "compression.hpp"

Server::Server(int port, int threadCount, Router router, bool compression)
    : socket(port), router(std::move(router)),
      pool(static_cast<size_t>(threadCount)), epoll(), compression(compression)
{
    Logger::getInstance()->step(
        1, "Initializing server components...");
    std::ostringstream oss;
    oss << "Creating dual-stack server on port: " << port
        << "\n   thread count: " << threadCount
        << "\n   compression: " << (compression ? "enabled" : "disabled");

    Logger::getInstance()->info(oss.str());
    Logger::getInstance()->step(2, "Binding socket...");
    socket.bind();
    Logger::getInstance()->step(3, "Listening on socket...");
    socket.listen();
}

void Server::start()
{
    try
    {
        static constexpr size_t MAX_EVENTS = 4096;
        std::vector<struct epoll_event> events(MAX_EVENTS);
        auto lastTimeoutCheck = std::chrono::steady_clock::now();

        {
            std::lock_guard<std::mutex> lock(connectionsMutex);
            if (!epoll.add(socket.getSocketFd(), EPOLLIN | EPOLLET))
            {
                Logger::getInstance()->error("Failed to add server socket to epoll");
                return;
            }
        }

        Logger::getInstance()->success("Server listening on port " +
                                       std::to_string(socket.getPort()));

        while (!shouldStop)
        {
            int nfds = epoll.wait(events.data(), static_cast<int>(MAX_EVENTS), 50);

            auto now = std::chrono::steady_clock::now();
            if (now - lastTimeoutCheck > TIMEOUT_CHECK_INTERVAL)
            {
                closeIdleConnections();
                lastTimeoutCheck = now;
            }

            if (nfds == -1)
            {
                if (errno == EINTR)
                    continue;
                Logger::getInstance()->error("Epoll wait failed: " +
                                             std::string(strerror(errno)));
                break;
            }

            for (int i = 0; i < nfds && !shouldStop; ++i)
            {
                if (events[i].data.fd == socket.getSocketFd())
                {
                    acceptConnections();
                }
                else
                {
                    dispatch(events[i].data.fd);
                }
            }
        }
    }
    catch (const std::exception &e)
    {
        Logger::getInstance()->error("Server error: " + std::string(e.what()));
    }

    Logger::getInstance()->info("Server is shutting down...");
}

void Server::acceptConnections()
{
    // edge triggered, so drain the backlog
    while (!shouldStop)
    {
        std::string clientIp;
        int client_socket = socket.acceptConnection(clientIp);
        if (client_socket < 0)
        {
            break;
        }

        if (!Http::setupSocketOptions(client_socket, clientIp))
        {
            close(client_socket);
            continue;
        }

        std::lock_guard<std::mutex> lock(connectionsMutex);
        if (!epoll.add(client_socket, CLIENT_EVENTS))
        {
            Logger::getInstance()->error("Failed to add client socket to epoll", clientIp);
            close(client_socket);
            continue;
        }
        connections.insert_or_assign(
            client_socket, ConnectionInfo{std::chrono::steady_clock::now(), clientIp});
        Logger::getInstance()->debug("Connection accepted", clientIp);
    }
}

void Server::dispatch(int client_socket)
{
    std::string clientIp;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        auto it = connections.find(client_socket);
        if (it == connections.end())
        {
            return;
        }
        it->second.busy = true;
        clientIp = it->second.ip;
    }

    try
    {
        // the oneshot registration stays disarmed until handleClient re-arms it
        pool.enqueue([this, client_socket]
                     { handleClient(client_socket); });
    }
    catch (const std::runtime_error &e)
    {
        Logger::getInstance()->warning("Request refused: " + std::string(e.what()), clientIp);
        Http::sendResponse(client_socket, Http::errorResponse(503), clientIp, false);
        closeConnection(client_socket);
    }
}

void Server::handleClient(int client_socket)
{
    static constexpr size_t BUFFER_SIZE = 16384;
    // use thread local to avoid repeated allocation
    static thread_local std::vector<char> buffer(BUFFER_SIZE);
    // reuse compression middleware instance per thread
    static thread_local Compression compressionMiddleware;

    std::string request;
    std::string clientIp;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        auto it = connections.find(client_socket);
        if (it == connections.end())
        {
            return;
        }
        request = std::move(it->second.pending);
        it->second.pending.clear();
        clientIp = it->second.ip;
    }

    // read until the socket would block
    ssize_t valread;
    size_t totalBytesReceived = 0;
    while (true)
    {
        valread = recv(client_socket, buffer.data(), buffer.size(), MSG_DONTWAIT);
        if (valread > 0)
        {
            request.append(buffer.data(), static_cast<size_t>(valread));
            totalBytesReceived += static_cast<size_t>(valread);
            continue;
        }
        if (valread < 0 && errno == EINTR)
        {
            continue;
        }
        break;
    }

    if (valread == 0 ||
        (valread < 0 && errno != EAGAIN && errno != EWOULDBLOCK))
    {
        // closed by the client, or a real socket error
        closeConnection(client_socket);
        return;
    }

    bool keepOpen = true;
    size_t totalBytesSent = 0;
    uint64_t served = 0;

    // answer every complete request head in the buffer
    while (keepOpen && !shouldStop)
    {
        size_t end = request.find(Http::HEADER_TERMINATOR);
        if (end == std::string::npos)
        {
            if (request.size() > Http::MAX_HEADER_SIZE)
            {
                Logger::getInstance()->warning("Request head too large", clientIp);
                totalBytesSent += Http::sendResponse(client_socket, Http::errorResponse(431),
                                                     clientIp, false);
                keepOpen = false;
            }
            break;
        }
        if (end > Http::MAX_HEADER_SIZE)
        {
            Logger::getInstance()->warning("Request head too large", clientIp);
            totalBytesSent += Http::sendResponse(client_socket, Http::errorResponse(431),
                                                 clientIp, false);
            keepOpen = false;
            break;
        }

        std::optional<HttpRequest> parsed =
            Http::parseRequest(std::string_view(request.data(), end));
        request.erase(0, end + Http::HEADER_TERMINATOR.size());

        if (!parsed)
        {
            Logger::getInstance()->warning("Malformed request", clientIp);
            totalBytesSent += Http::sendResponse(client_socket, Http::errorResponse(400),
                                                 clientIp, false);
            keepOpen = false;
            break;
        }

        bool keepAlive = parsed->keepAlive();
        HttpResponse response = router.route(*parsed, clientIp);
        totalBytesSent += Http::sendResponse(client_socket, response, clientIp, keepAlive,
                                             compression ? &compressionMiddleware : nullptr,
                                             parsed->acceptsGzip());
        ++served;
        keepOpen = keepAlive;
    }

    std::string logInfo;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        auto it = connections.find(client_socket);
        if (it == connections.end())
        {
            // closed by stop() while the request was in flight
            return;
        }

        it->second.bytesReceived += totalBytesReceived;
        it->second.bytesSent += totalBytesSent;
        it->second.requestsServed += served;

        if (!keepOpen || shouldStop)
        {
            logInfo = closeConnectionLocked(it);
        }
        else
        {
            it->second.pending = std::move(request);
            it->second.busy = false;
            it->second.lastActivity = std::chrono::steady_clock::now();
            if (!epoll.modify(client_socket, CLIENT_EVENTS))
            {
                logInfo = closeConnectionLocked(it);
            }
        }
    }

    if (!logInfo.empty())
    {
        Logger::getInstance()->info(logInfo, clientIp);
    }
}

void Server::closeIdleConnections()
{
    auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<std::string, std::string>> closed;

    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        auto it = connections.begin();
        while (it != connections.end())
        {
            auto current = it++;
            if (!current->second.busy && now - current->second.lastActivity > IDLE_TIMEOUT)
            {
                std::string ip = current->second.ip;
                closed.emplace_back(std::move(ip), closeConnectionLocked(current));
            }
        }
    }

    for (const auto &[ip, logInfo] : closed)
    {
        Logger::getInstance()->info("Idle timeout: " + logInfo, ip);
    }
}

void Server::closeConnection(int client_socket)
{
    std::string logInfo;
    std::string clientIp;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        auto it = connections.find(client_socket);
        if (it == connections.end())
        {
            return;
        }
        clientIp = it->second.ip;
        logInfo = closeConnectionLocked(it);
    }

    // log outside the lock
    Logger::getInstance()->info(logInfo, clientIp);
}

std::string Server::closeConnectionLocked(std::map<int, ConnectionInfo>::iterator it)
{
    int client_socket = it->first;
    auto duration = std::chrono::steady_clock::now() - it->second.startTime;
    std::string logInfo = "Connection closed - Duration: " + Socket::durationToString(duration) +
                          ", Requests: " + std::to_string(it->second.requestsServed) +
                          ", Bytes received: " + std::to_string(it->second.bytesReceived) +
                          ", Bytes sent: " + std::to_string(it->second.bytesSent);
    connections.erase(it);

    // the descriptor is released under the lock so accept cannot reuse it early
    epoll.remove(client_socket);
    close(client_socket);
    return logInfo;
}

void Server::stop()
{
    if (shouldStop.exchange(true))
    {
        return;
    }
    Logger::getInstance()->warning("Initiating server shutdown...");

    // stop accepting new connections first
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        epoll.remove(socket.getSocketFd());
        socket.closeSocket();
    }

    // finish in-flight requests, then join the workers
    pool.stop();

    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        count = connections.size();
        while (!connections.empty())
        {
            static_cast<void>(closeConnectionLocked(connections.begin()));
        }
    }

    Logger::getInstance()->info("All connections closed (" + std::to_string(count) + ")");
}
