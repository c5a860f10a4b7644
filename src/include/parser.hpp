#ifndef ARBOR_PARSER_HPP
#define ARBOR_PARSER_HPP

#include "common.hpp"
#include "config.hpp"
#include "logger.hpp"

class Parser
{
public:
    // delete copy constructor and assignment operator
    Parser(const Parser &) = delete;
    Parser &operator=(const Parser &) = delete;

    // get singleton instance
    static Parser *getInstance()
    {
        static Parser instance;
        return &instance;
    }

    // parse configuration file
    [[nodiscard]] Config parseConfig(const std::string &configFilePath);

    // validate an already parsed configuration document
    [[nodiscard]] Config parseConfigJson(const json &configJson);

private:
    // private constructor for singleton
    Parser() = default;

    static constexpr const char *DEFAULT_LOG_FILE = "arbor.log";
};

#endif // ARBOR_PARSER_HPP
