#include "handoff/sender_options.hpp"

#include "handoff/handoff_configuration.hpp"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_logger.hpp"

#include <cstdint>

namespace
{
    using log_cfg = handoff::log::configuration;
    using log_net = handoff::log::network;

    // Non-positive values fall back to the default.
    auto positive_or_default(const handoff::configuration& _config, const std::string& _key, std::int64_t _default)
        -> std::int64_t
    {
        const auto value = _config.get_property_or<std::int64_t>(_key, _default);

        if (value <= 0) {
            log_cfg::warn("[{}] must be positive, got [{}]. Using [{}].", _key, value, _default);
            return _default;
        }

        return value;
    } // positive_or_default
} // anonymous namespace

namespace handoff
{
    auto make_sender_options(const configuration& _config) -> sender_options
    {
        sender_options opts;

        opts.receive_timeout = std::chrono::milliseconds{
            positive_or_default(_config, KW_CFG_HANDOFF_TIMEOUT, opts.receive_timeout.count())};

        opts.status_interval = std::chrono::seconds{
            positive_or_default(_config, KW_CFG_HANDOFF_STATUS_INTERVAL, opts.status_interval.count())};

        opts.connect_timeout = std::chrono::milliseconds{
            positive_or_default(_config, KW_CFG_HANDOFF_CONNECT_TIMEOUT, opts.connect_timeout.count())};

        if (_config.contains(KW_CFG_HANDOFF_SSL_OPTIONS)) {
            try {
                const auto ssl_config = _config.get_property<nlohmann::json>(KW_CFG_HANDOFF_SSL_OPTIONS);

                if (const auto ssl = ssl_options_from_json(ssl_config); ssl) {
                    opts.ssl = validate_ssl_options(*ssl);
                }
            }
            catch (const handoff::exception& e) {
                log_net::error({{"log_message", "SSL handoff config error. TLS is disabled."},
                                {"property", KW_CFG_HANDOFF_SSL_OPTIONS},
                                {"reason", e.client_display_what()}});
                opts.ssl.reset();
            }
        }

        log_cfg::debug({{"log_message", "Sender options."},
                        {"receive_timeout_ms", std::to_string(opts.receive_timeout.count())},
                        {"status_interval_s", std::to_string(opts.status_interval.count())},
                        {"connect_timeout_ms", std::to_string(opts.connect_timeout.count())},
                        {"tls", opts.ssl ? "true" : "false"}});

        return opts;
    } // make_sender_options
} // namespace handoff
