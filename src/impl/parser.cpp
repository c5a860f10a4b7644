#include "parser.hpp"

Config Parser::parseConfig(const std::string &configFilePath)
{
    // log start of configuration reading process
    Logger::getInstance()->info("Reading configuration from: " + configFilePath);

    // open configuration file
    std::ifstream file(configFilePath);
    if (!file.is_open())
    {
        Logger::getInstance()->error("Could not open config file: " + configFilePath);
        throw std::runtime_error("Could not open config file!");
    }

    // parse JSON configuration
    json configJson;
    try
    {
        file >> configJson;
    }
    catch (const json::parse_error &e)
    {
        Logger::getInstance()->error("JSON parsing error: " + std::string(e.what()));
        throw std::runtime_error("Failed to parse configuration file");
    }

    return parseConfigJson(configJson);
}

Config Parser::parseConfigJson(const json &configJson)
{
    if (!configJson.is_object())
    {
        Logger::getInstance()->error("Configuration must be a JSON object");
        throw std::runtime_error("Invalid configuration file");
    }

    // check if all required fields exist and are not null
    const std::array<std::string, 3> requiredFields = {"port", "template_root", "thread_count"};
    for (const auto &field : requiredFields)
    {
        if (!configJson.contains(field) || configJson[field].is_null())
        {
            Logger::getInstance()->error("Missing or null field: " + field);
            throw std::runtime_error("Incomplete configuration file");
        }
    }

    // create a Config object and populate it with values from JSON
    Config config;
    std::string levelName;
    try
    {
        config.port = configJson.at("port").get<int>();
        config.templateRoot = configJson.at("template_root").get<std::string>();
        config.threadCount = configJson.at("thread_count").get<int>();
        levelName = configJson.value("log_level", std::string("info"));
        config.logFile = configJson.value("log_file", std::string(DEFAULT_LOG_FILE));
        config.compression = configJson.value("compression", true);
        config.htmxFragments = configJson.value("htmx_fragments", false);
    }
    catch (const json::exception &e)
    {
        Logger::getInstance()->error("Invalid field type: " + std::string(e.what()));
        throw std::runtime_error("Invalid configuration file");
    }

    // validate configuration values
    const auto validateConfig = [&levelName](Config &cfg)
    {
        // validate port number
        if (cfg.port <= 0 || cfg.port > 65535)
        {
            throw std::runtime_error("Invalid port number: " + std::to_string(cfg.port));
        }

        // validate template root path
        if (!fs::is_directory(cfg.templateRoot))
        {
            throw std::runtime_error("Template root is not a directory: " + cfg.templateRoot);
        }

        // validate thread count
        if (cfg.threadCount <= 0 || cfg.threadCount > 1000)
        {
            throw std::runtime_error("Invalid thread count: " + std::to_string(cfg.threadCount));
        }

        std::optional<LogLevel> level = Logger::parseLevel(levelName);
        if (!level)
        {
            throw std::runtime_error("Invalid log level: " + levelName);
        }
        cfg.logLevel = *level;

        if (cfg.logFile.empty())
        {
            throw std::runtime_error("Log file path is empty");
        }
    };

    try
    {
        validateConfig(config);
    }
    catch (const std::runtime_error &e)
    {
        Logger::getInstance()->error(e.what());
        throw;
    }

    // log successful configuration loading
    Logger::getInstance()->success("Configuration loaded successfully");

    return config;
}
