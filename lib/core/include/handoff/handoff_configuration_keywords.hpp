#ifndef HANDOFF_CONFIGURATION_KEYWORDS_HPP
#define HANDOFF_CONFIGURATION_KEYWORDS_HPP

#include <string>

namespace handoff
{
    /// @brief environment variable naming the json configuration file
    extern const std::string KW_CFG_CONFIG_FILE;

    /// @brief receive timeout in milliseconds for every request/reply exchange
    extern const std::string KW_CFG_HANDOFF_TIMEOUT;

    /// @brief interval in seconds between progress reports
    extern const std::string KW_CFG_HANDOFF_STATUS_INTERVAL;

    /// @brief connect timeout in milliseconds
    extern const std::string KW_CFG_HANDOFF_CONNECT_TIMEOUT;

    /// @brief object holding the TLS material used for outbound handoff connections
    extern const std::string KW_CFG_HANDOFF_SSL_OPTIONS;
    extern const std::string KW_CFG_SSL_CERTFILE;
    extern const std::string KW_CFG_SSL_KEYFILE;
    extern const std::string KW_CFG_SSL_CACERTFILE;
    extern const std::string KW_CFG_SSL_DHFILE;
    extern const std::string KW_CFG_SSL_VERIFY_PEER;

    /// @brief object mapping log categories to log levels
    extern const std::string KW_CFG_LOG_LEVEL;
    extern const std::string KW_CFG_LOG_LEVEL_CATEGORY_SENDER;
    extern const std::string KW_CFG_LOG_LEVEL_CATEGORY_NETWORK;
    extern const std::string KW_CFG_LOG_LEVEL_CATEGORY_CONFIGURATION;

    /// @brief returns the environment variable name for a configuration keyword
    auto to_env(const std::string& _kw) -> std::string;
} // namespace handoff

#endif // HANDOFF_CONFIGURATION_KEYWORDS_HPP
