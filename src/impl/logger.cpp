#include "logger.hpp"

// Helper functions for formatting with colors
std::string Logger::formatSuccess(const std::string &msg)
{
    return std::string(COLORS[3]) + CHECK_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatError(const std::string &msg)
{
    return std::string(COLORS[2]) + CROSS_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatInfo(const std::string &msg)
{
    return std::string(COLORS[5]) + INFO_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatWarning(const std::string &msg)
{
    return std::string(COLORS[4]) + WARN_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatDebug(const std::string &msg)
{
    return std::string(COLORS[8]) + DEBUG_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatStep(int num, const std::string &msg)
{
    return std::string(COLORS[6]) + "[Step " + std::to_string(num) + "] " + msg + COLORS[0];
}

Logger::Logger()
{
    logFile.open(DEFAULT_LOG_FILE, std::ios::app);
    writeLogMessage({{"Logger initialized"}, LogLevel::SUCCESS, "-"});
    loggerThread = std::jthread([this](std::stop_token st)
                                { processLogs(st); });
}

void Logger::processLogs(std::stop_token st)
{
    while (!st.stop_requested())
    {
        std::vector<LogMessage> messages;
        messages.reserve(100);

        {
            std::unique_lock lock(mutex);
            // wakes on new messages or when the stop token fires
            queueCV.wait_for(lock, st, std::chrono::seconds(1),
                             [this]
                             { return !messageQueue.empty(); });

            while (!messageQueue.empty() && messages.size() < 100)
            {
                messages.push_back(std::move(messageQueue.front())); // move message to vector
                messageQueue.pop_front();                            // remove message from queue
            }
        }

        if (!messages.empty())
        {
            std::lock_guard lock(fileMutex);
            for (const auto &msg : messages)
            {
                writeLogMessage(msg);
            }
            logFile.flush();
        }
    }
}

void Logger::drainQueue()
{
    std::deque<LogMessage> remaining;
    {
        std::lock_guard lock(mutex);
        while (!messageQueue.empty())
        {
            remaining.push_back(std::move(messageQueue.front()));
            messageQueue.pop_front();
        }
    }

    std::lock_guard lock(fileMutex);
    for (const auto &msg : remaining)
    {
        writeLogMessage(msg);
    }
    logFile.flush();
}

void Logger::writeLogMessage(const LogMessage &msg)
{
    std::string fileMessage = formatLogMessage(msg);
    if (logFile.is_open())
    {
        logFile << fileMessage << '\n';
    }

    std::string consoleMessage;
    switch (msg.level)
    {
    case LogLevel::ERROR:
        consoleMessage = formatError(fileMessage);
        break;
    case LogLevel::WARNING:
        consoleMessage = formatWarning(fileMessage);
        break;
    case LogLevel::SUCCESS:
        consoleMessage = formatSuccess(fileMessage);
        break;
    case LogLevel::DEBUG:
        consoleMessage = formatDebug(fileMessage);
        break;
    default:
        consoleMessage = formatInfo(fileMessage);
        break;
    }
    std::cout << consoleMessage << std::endl;
}

std::string Logger::formatLogMessage(const LogMessage &msg)
{
    auto time = std::chrono::system_clock::to_time_t(msg.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  msg.timestamp.time_since_epoch()) %
              1000;

    struct tm localTime;
    localtime_r(&time, &localTime);

    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "[%Y-%m-%d %H:%M:%S", &localTime);

    std::ostringstream oss;
    oss << timestamp << "."
        << std::setfill('0') << std::setw(3) << ms.count() << "]"
        << " [" << LOG_LEVELS[static_cast<int>(msg.level)] << "] "
        << "[" << msg.ip << "] "
        << msg.message;

    return oss.str();
}

Logger *Logger::getInstance()
{
    std::call_once(initFlag, []()
                   { instance = std::unique_ptr<Logger>(new Logger()); });
    return instance.get();
}

std::optional<LogLevel> Logger::parseLevel(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
        return LogLevel::DEBUG;
    if (lower == "info")
        return LogLevel::INFO;
    if (lower == "warning" || lower == "warn")
        return LogLevel::WARNING;
    if (lower == "error")
        return LogLevel::ERROR;
    return std::nullopt;
}

void Logger::setLevel(LogLevel level) noexcept
{
    minLevel.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept
{
    return minLevel.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level) const noexcept
{
    // SUCCESS is reported at INFO verbosity
    auto rank = [](LogLevel l)
    {
        switch (l)
        {
        case LogLevel::DEBUG:
            return 0;
        case LogLevel::INFO:
        case LogLevel::SUCCESS:
            return 1;
        case LogLevel::WARNING:
            return 2;
        case LogLevel::ERROR:
            return 3;
        }
        return 1;
    };
    return rank(level) >= rank(minLevel.load(std::memory_order_relaxed));
}

bool Logger::setLogFile(const std::string &path)
{
    std::ofstream next(path, std::ios::app);
    if (!next.is_open())
    {
        return false;
    }

    std::lock_guard lock(fileMutex);
    logFile.flush();
    logFile = std::move(next);
    return true;
}

void Logger::log(std::string_view message, LogLevel level, std::string_view ip)
{
    if (!enabled(level))
    {
        return;
    }

    {
        std::lock_guard lock(mutex);
        messageQueue.emplace_back(std::string(message), level, std::string(ip));
    }
    queueCV.notify_one();
}

void Logger::error(std::string_view message, std::string_view ip)
{
    log(message, LogLevel::ERROR, ip);
}

void Logger::warning(std::string_view message, std::string_view ip)
{
    log(message, LogLevel::WARNING, ip);
}

void Logger::success(std::string_view message, std::string_view ip)
{
    log(message, LogLevel::SUCCESS, ip);
}

void Logger::info(std::string_view message, std::string_view ip)
{
    log(message, LogLevel::INFO, ip);
}

void Logger::debug(std::string_view message, std::string_view ip)
{
    log(message, LogLevel::DEBUG, ip);
}

void Logger::step(int num, std::string_view message, std::string_view ip)
{
    log(formatStep(num, std::string(message)), LogLevel::INFO, ip);
}

void Logger::destroyInstance()
{
    instance.reset();
}

Logger::~Logger()
{
    loggerThread.request_stop();
    queueCV.notify_all();
    if (loggerThread.joinable())
    {
        loggerThread.join();
    }

    // flush whatever arrived after the worker's last batch
    drainQueue();

    if (logFile.is_open())
    {
        logFile.close();
    }
}
