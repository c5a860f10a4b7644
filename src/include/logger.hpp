#ifndef ARBOR_LOGGER_HPP
#define ARBOR_LOGGER_HPP

#include "common.hpp"

// Define log levels using enum class for type safety and better semantics
enum class LogLevel
{
    DEBUG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

class Logger
{
private:
    // ANSI escape codes for colors
    static constexpr std::array<const char *, 9> COLORS = {
        "\033[0m",  // RESET
        "\033[30m", // BLACK
        "\033[31m", // RED
        "\033[32m", // GREEN
        "\033[33m", // YELLOW
        "\033[34m", // BLUE
        "\033[35m", // MAGENTA
        "\033[36m", // CYAN
        "\033[37m", // WHITE
    };

    // Special symbols
    static constexpr const char *CHECK_MARK = "✅";
    static constexpr const char *CROSS_MARK = "❌";
    static constexpr const char *INFO_MARK = "🔵";
    static constexpr const char *WARN_MARK = "⚠️";
    static constexpr const char *DEBUG_MARK = "·";

    // Constant string views for log levels, indexed by LogLevel
    static constexpr std::string_view LOG_LEVELS[] = {
        "DEBUG",
        "INFO",
        "SUCCESS",
        "WARNING",
        "ERROR"};

    static constexpr const char *DEFAULT_LOG_FILE = "arbor.log";

    struct LogMessage
    {
        std::string message;
        LogLevel level;
        std::string ip;
        std::chrono::system_clock::time_point timestamp;

        LogMessage(std::string msg, LogLevel lvl, std::string clientIp)
            : message(std::move(msg)), level(lvl), ip(std::move(clientIp)),
              timestamp(std::chrono::system_clock::now()) {}
    };

    // Memory management and synchronization members
    std::pmr::synchronized_pool_resource pool;
    std::pmr::deque<LogMessage> messageQueue{&pool};

    std::mutex mutex;      // guards messageQueue
    std::mutex fileMutex;  // guards logFile
    std::ofstream logFile;
    std::condition_variable_any queueCV;
    std::atomic<LogLevel> minLevel{LogLevel::INFO};
    std::jthread loggerThread;

    static inline std::unique_ptr<Logger> instance;
    static inline std::once_flag initFlag;

    // Private helper functions
    [[nodiscard]] static std::string formatSuccess(const std::string &msg);
    [[nodiscard]] static std::string formatError(const std::string &msg);
    [[nodiscard]] static std::string formatInfo(const std::string &msg);
    [[nodiscard]] static std::string formatWarning(const std::string &msg);
    [[nodiscard]] static std::string formatDebug(const std::string &msg);
    [[nodiscard]] static std::string formatStep(int num, const std::string &msg);
    [[nodiscard]] static std::string formatLogMessage(const LogMessage &msg);

    Logger();
    void processLogs(std::stop_token st);
    void drainQueue();
    void writeLogMessage(const LogMessage &msg);

public:
    static Logger *getInstance();
    static void destroyInstance();

    // parse "debug", "info", "warning"/"warn", "error" (case-insensitive)
    [[nodiscard]] static std::optional<LogLevel> parseLevel(std::string_view name);

    void setLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    // reopen output at a different path; keeps the old file on failure
    [[nodiscard]] bool setLogFile(const std::string &path);

    void log(std::string_view message, LogLevel level = LogLevel::INFO,
             std::string_view ip = "-");
    void error(std::string_view message, std::string_view ip = "-");
    void warning(std::string_view message, std::string_view ip = "-");
    void success(std::string_view message, std::string_view ip = "-");
    void info(std::string_view message, std::string_view ip = "-");
    void debug(std::string_view message, std::string_view ip = "-");
    void step(int num, std::string_view message, std::string_view ip = "-");

    ~Logger();

    // Delete copy and move operations
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;
};

#endif // ARBOR_LOGGER_HPP
