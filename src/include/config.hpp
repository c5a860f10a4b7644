#ifndef ARBOR_CONFIG_HPP
#define ARBOR_CONFIG_HPP

#include "common.hpp"
#include "logger.hpp"

struct Config
{
    int port;                 // port for server
    std::string templateRoot; // root of the template tree
    int threadCount;          // thread count of worker threads
    LogLevel logLevel;        // minimum level written to the log
    std::string logFile;      // path of the log file
    bool compression;         // gzip compressible responses
    bool htmxFragments;       // render only the body for HX-Request
};

#endif // ARBOR_CONFIG_HPP
