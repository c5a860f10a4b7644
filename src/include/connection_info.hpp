#ifndef ARBOR_CONNECTION_INFO_HPP
#define ARBOR_CONNECTION_INFO_HPP

#include "common.hpp"

// Connection information structure
struct ConnectionInfo
{
  std::chrono::steady_clock::time_point startTime;    // connection start time
  std::chrono::steady_clock::time_point lastActivity; // last read or write
  std::string ip;                                     // client IP address
  std::string pending;                                // bytes of an incomplete request
  bool busy;                                          // a worker owns the socket
  uint64_t requestsServed;                            // responses written
  uint64_t bytesReceived;                             // bytes received from client
  uint64_t bytesSent;                                 // bytes sent to client

  ConnectionInfo(const std::chrono::steady_clock::time_point &time,
                 const std::string &ipAddr)
      : startTime(time), lastActivity(time), ip(ipAddr), busy(false),
        requestsServed(0), bytesReceived(0), bytesSent(0) {}
};

#endif // ARBOR_CONNECTION_INFO_HPP
