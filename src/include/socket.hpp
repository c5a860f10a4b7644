#ifndef ARBOR_SOCKET_HPP
#define ARBOR_SOCKET_HPP

#include "common.hpp"
#include "logger.hpp"

// Non-blocking dual-stack listening socket
class Socket
{
public:
    // port 0 binds an ephemeral port, see getPort()
    explicit Socket(int port);
    ~Socket();

    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    void bind();
    void listen();
    void closeSocket();
    [[nodiscard]] int acceptConnection(std::string &clientIp);
    [[nodiscard]] int getSocketFd() const;

    // port actually bound, valid after bind()
    [[nodiscard]] int getPort() const;

    static std::string durationToString(const std::chrono::steady_clock::duration &duration);

private:
    int server_fd; // Server socket file descriptor
    int port;      // Port number
};

#endif // ARBOR_SOCKET_HPP
