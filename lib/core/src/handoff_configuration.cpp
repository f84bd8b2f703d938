#include "handoff/handoff_configuration.hpp"

#include "handoff/handoff_logger.hpp"

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace fs = boost::filesystem;

namespace
{
    using log_cfg = handoff::log::configuration;

    // Settings that may be replaced by an environment variable of the same (upper-cased) name.
    auto overridable_keywords() -> const std::vector<std::string>&
    {
        static const std::vector<std::string> keywords{
            handoff::KW_CFG_HANDOFF_TIMEOUT,
            handoff::KW_CFG_HANDOFF_STATUS_INTERVAL,
            handoff::KW_CFG_HANDOFF_CONNECT_TIMEOUT
        };

        return keywords;
    } // overridable_keywords
} // anonymous namespace

namespace handoff
{
    auto configuration::instance() -> configuration&
    {
        static configuration instance;
        return instance;
    } // instance

    configuration::configuration(nlohmann::json _props)
        : props_(std::move(_props)) // parentheses: braces would wrap the json in an array
    {
        if (!props_.is_object()) {
            THROW(SYS_INVALID_INPUT_PARAM, "configuration must be a json object");
        }
    } // ctor

    auto configuration::capture() -> void
    {
        const auto env_var = to_env(KW_CFG_CONFIG_FILE);

        if (const auto* path = std::getenv(env_var.c_str()); path && *path != '\0') {
            load(path);
        }
        else {
            log_cfg::debug("[{}] is not set. Using default handoff settings.", env_var);
        }

        apply_environment_overrides();
    } // capture

    auto configuration::load(const std::string& _path) -> void
    {
        if (!fs::exists(_path)) {
            THROW(SYS_CONFIG_FILE_ERR, fmt::format("configuration file [{}] does not exist", _path));
        }

        std::ifstream in{_path};

        if (!in) {
            THROW(SYS_CONFIG_FILE_ERR, fmt::format("cannot open configuration file [{}]", _path));
        }

        nlohmann::json props;

        try {
            props = nlohmann::json::parse(in);
        }
        catch (const nlohmann::json::exception& e) {
            THROW(SYS_CONFIG_FILE_ERR, fmt::format("cannot parse configuration file [{}]: {}", _path, e.what()));
        }

        if (!props.is_object()) {
            THROW(SYS_CONFIG_FILE_ERR, fmt::format("configuration file [{}] must hold a json object", _path));
        }

        props_ = std::move(props);

        log_cfg::debug("Loaded handoff configuration from [{}].", _path);
    } // load

    auto configuration::apply_environment_overrides() -> void
    {
        for (const auto& kw : overridable_keywords()) {
            const auto env_var = to_env(kw);
            const auto* value = std::getenv(env_var.c_str());

            if (!value) {
                continue;
            }

            try {
                props_[kw] = boost::lexical_cast<std::int64_t>(value);
                log_cfg::debug("Setting [{}] from environment variable [{}].", kw, env_var);
            }
            catch (const boost::bad_lexical_cast&) {
                log_cfg::warn({{"log_message", "Ignoring non-numeric environment override."},
                               {"environment_variable", env_var},
                               {"value", value}});
            }
        }
    } // apply_environment_overrides

    auto configure_log_levels(const configuration& _config) -> void
    {
        const auto log_level = _config.get_property_or<nlohmann::json>(KW_CFG_LOG_LEVEL, nlohmann::json::object());

        // clang-format off
        log::sender::set_level(log::get_level_from_config(log_level, KW_CFG_LOG_LEVEL_CATEGORY_SENDER));
        log::network::set_level(log::get_level_from_config(log_level, KW_CFG_LOG_LEVEL_CATEGORY_NETWORK));
        log::configuration::set_level(log::get_level_from_config(log_level, KW_CFG_LOG_LEVEL_CATEGORY_CONFIGURATION));
        // clang-format on
    } // configure_log_levels
} // namespace handoff
