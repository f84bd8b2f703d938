#include "handoff/handoff_configuration_keywords.hpp"

#include <boost/algorithm/string.hpp>

namespace handoff
{
    const std::string KW_CFG_CONFIG_FILE("handoff_config_file");

    const std::string KW_CFG_HANDOFF_TIMEOUT("handoff_timeout");
    const std::string KW_CFG_HANDOFF_STATUS_INTERVAL("handoff_status_interval");
    const std::string KW_CFG_HANDOFF_CONNECT_TIMEOUT("handoff_connect_timeout");

    const std::string KW_CFG_HANDOFF_SSL_OPTIONS("handoff_ssl_options");
    const std::string KW_CFG_SSL_CERTFILE("certfile");
    const std::string KW_CFG_SSL_KEYFILE("keyfile");
    const std::string KW_CFG_SSL_CACERTFILE("cacertfile");
    const std::string KW_CFG_SSL_DHFILE("dhfile");
    const std::string KW_CFG_SSL_VERIFY_PEER("verify_peer");

    const std::string KW_CFG_LOG_LEVEL("log_level");
    const std::string KW_CFG_LOG_LEVEL_CATEGORY_SENDER("sender");
    const std::string KW_CFG_LOG_LEVEL_CATEGORY_NETWORK("network");
    const std::string KW_CFG_LOG_LEVEL_CATEGORY_CONFIGURATION("configuration");

    auto to_env(const std::string& _kw) -> std::string
    {
        return boost::algorithm::to_upper_copy(_kw);
    } // to_env
} // namespace handoff
