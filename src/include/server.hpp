#ifndef ARBOR_SERVER_HPP
#define ARBOR_SERVER_HPP

#include "common.hpp"
#include "socket.hpp"
#include "router.hpp"
#include "thread_pool.hpp"
#include "epoll_wrapper.hpp"
#include "logger.hpp"
#include "connection_info.hpp"

class Server
{
public:
    // port 0 binds an ephemeral port
    Server(int port, int threadCount, Router router, bool compression);

    // runs the event loop until stop()
    void start();
    void stop();

    [[nodiscard]] int getPort() const { return socket.getPort(); }

private:
    Socket socket;                             // server socket
    Router router;                             // resolves requests into responses
    ThreadPool pool;                           // server thread pool
    EpollWrapper epoll;                        // server epoll instance
    bool compression;                          // gzip responses when allowed
    std::mutex connectionsMutex;               // guards connections and epoll registrations
    std::map<int, ConnectionInfo> connections; // map to store connection info
    std::atomic<bool> shouldStop{false};       // atomic flag to stop server

    static constexpr uint32_t CLIENT_EVENTS = EPOLLIN | EPOLLET | EPOLLONESHOT | EPOLLRDHUP;
    static constexpr auto IDLE_TIMEOUT = std::chrono::seconds(60);
    static constexpr auto TIMEOUT_CHECK_INTERVAL = std::chrono::seconds(5);

    void acceptConnections();
    void dispatch(int client_socket);
    void handleClient(int client_socket);
    void closeIdleConnections();
    void closeConnection(int client_socket);
    // must be called with connectionsMutex held; returns the closing log line
    std::string closeConnectionLocked(std::map<int, ConnectionInfo>::iterator it);
};

#endif // ARBOR_SERVER_HPP
