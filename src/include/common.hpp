#ifndef ARBOR_COMMON_HPP
#define ARBOR_COMMON_HPP

// Standard C++ headers
#include <algorithm>          // efficient algorithms
#include <array>              // fixed-size arrays
#include <atomic>             // atomic operations
#include <bitset>             // fixed-size bit sets
#include <chrono>             // measuring time
#include <condition_variable> // blocking thread synchronization
#include <cstdlib>            // std::getenv, EXIT_SUCCESS
#include <deque>              // double-ended queue
#include <filesystem>         // filesystem operations
#include <fstream>            // file reading operations
#include <functional>         // function objects
#include <future>             // asynchronous tasks
#include <iomanip>            // stream formatting
#include <iostream>           // std::cout, std::cerr - for console output
#include <limits>             // numeric limits
#include <map>                // ordered associative container (Red-Black Tree)
#include <memory>             // smart pointers
#include <memory_resource>    // memory resource management
#include <mutex>              // thread synchronization
#include <optional>           // optional type
#include <regex>              // pattern directory matching
#include <set>                // ordered unique elements (Red-Black Tree)
#include <shared_mutex>       // shared mutexes
#include <span>               // non-owning views over segment lists
#include <sstream>            // string stream manipulations
#include <stdexcept>          // standard exceptions like std::runtime_error
#include <string>             // owning strings
#include <string_view>        // efficient string handling without ownership
#include <system_error>       // std::system_error for syscall failures
#include <thread>             // multithreading support
#include <unordered_map>      // unordered associative container (Hash Table)
#include <unordered_set>      // unordered unique elements (Hash Table)
#include <vector>             // dynamic array

// System headers
#include <arpa/inet.h>   // inet_ntop - for converting IP addresses
#include <csignal>       // signal handling
#include <cstring>       // strerror() - for error messages
#include <ctime>         // handling timestamps
#include <fcntl.h>       // file control options
#include <netinet/in.h>  // sockaddr_in6 - structure for IPv6 addresses
#include <netinet/tcp.h> // TCP_NODELAY
#include <pthread.h>     // POSIX threads
#include <sys/epoll.h>   // epoll - for scalable I/O event notification
#include <sys/socket.h>  // socket(), bind(), listen(), accept() - for socket operations
#include <sys/stat.h>    // stat - to get file status
#include <sys/time.h>    // timeval for socket timeouts
#include <sys/uio.h>     // writev - to write to multiple buffers
#include <unistd.h>      // close(), read() - file descriptor operations

// Third-party headers
#include <nlohmann/json.hpp> // JSON configuration and render contexts
#include <zlib.h>            // zlib compression

namespace fs = std::filesystem; // Alias for filesystem namespace
using json = nlohmann::json;    // Alias for JSON namespace

#endif // ARBOR_COMMON_HPP
