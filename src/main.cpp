#include "common.hpp"
#include "server.hpp"
#include "parser.hpp"
#include "logger.hpp"
#include "config.hpp"
#include "disk_filesystem.hpp"
#include "request_data.hpp"

std::atomic<bool> running(true); // flag to control main loop

void signalHandler([[maybe_unused]] int signal)
{
    running = false; // set running flag to false
}

// render context: request path and query plus the path captures
static std::unique_ptr<RequestData> makeRequestData(const HttpRequest &request)
{
    auto data = std::make_unique<RequestDataMap>();
    data->set("path", request.path);
    data->set("query", json(request.query));
    return data;
}

auto main(int argc, char *argv[]) -> int
{
    // set up signal handlers with SA_RESTART flag
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // a client hanging up mid-response must not kill the process
    struct sigaction ignore;
    ignore.sa_handler = SIG_IGN;
    ignore.sa_flags = 0;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);

    const std::string configPath = argc > 1 ? argv[1] : "arbor_conf.json";

    try
    {
        Config config = Parser::getInstance()->parseConfig(configPath);

        Logger *logger = Logger::getInstance();
        logger->setLevel(config.logLevel);
        if (const char *envLevel = std::getenv("ARBOR_LOGLEVEL"))
        {
            if (std::optional<LogLevel> level = Logger::parseLevel(envLevel))
            {
                logger->setLevel(*level);
            }
            else
            {
                logger->warning("Ignoring unknown ARBOR_LOGLEVEL: " + std::string(envLevel));
            }
        }
        if (!logger->setLogFile(config.logFile))
        {
            logger->warning("Could not open log file " + config.logFile +
                            ", keeping the default");
        }

        Router router(DiskFileSystem::create(config.templateRoot));
        router.withData(makeRequestData).withFragments(config.htmxFragments);

        // create server instance
        std::unique_ptr<Server> server = std::make_unique<Server>(
            config.port,
            config.threadCount,
            std::move(router),
            config.compression);

        std::thread serverThread([&]()
                                 { server->start(); });

        // main loop with shorter sleep time for more responsive shutdown
        while (running)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        server->stop();

        if (serverThread.joinable())
            serverThread.join();

        // explicitly reset server to ensure proper cleanup
        server.reset();
    }
    catch (const std::exception &e)
    {
        Logger::getInstance()->error("Fatal error: " + std::string(e.what()));
        Logger::destroyInstance();
        return EXIT_FAILURE;
    }

    Logger::getInstance()->info("Server shut down successfully");
    Logger::destroyInstance();
    return EXIT_SUCCESS;
}
