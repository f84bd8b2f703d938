#include "handoff/handoff_logger.hpp"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#include <cstdio>
#include <mutex>
#include <vector>

namespace
{
    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
    std::shared_ptr<spdlog::logger> g_log;
    std::mutex g_log_mutex;
    std::string g_server_host;
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)
} // anonymous namespace

namespace handoff::log
{
    auto init(bool _write_to_stdout, spdlog::sink_ptr _test_mode_sink) noexcept -> void
    {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            if (_write_to_stdout) {
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
            }
            else {
                std::string id;
                const bool enable_formatting = false;
                // NOLINTNEXTLINE(hicpp-signed-bitwise)
                sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(id, LOG_PID, LOG_LOCAL0, enable_formatting));
            }

            if (_test_mode_sink) {
                sinks.push_back(std::move(_test_mode_sink));
            }

            auto logger = std::make_shared<spdlog::logger>("composite_logger", std::begin(sinks), std::end(sinks));
            logger->set_level(spdlog::level::trace); // Log everything! Filtering happens per category.
            logger->set_pattern("%v");

            std::lock_guard lock{g_log_mutex};
            g_log = std::move(logger);
        }
        catch (const std::exception& e) {
            std::fprintf(stderr, "ERROR: could not initialize logger: %s\n", e.what());
        }
    } // init

    auto deinit() noexcept -> void
    {
        std::lock_guard lock{g_log_mutex};
        g_log.reset();
    } // deinit

    auto to_level(const std::string_view _level) noexcept -> level
    {
        // clang-format off
        static const std::unordered_map<std::string_view, level> conv_table{
            {"trace",    level::trace},
            {"debug",    level::debug},
            {"info",     level::info},
            {"warn",     level::warn},
            {"error",    level::error},
            {"critical", level::critical}
        };
        // clang-format on

        if (auto iter = conv_table.find(_level); std::end(conv_table) != iter) {
            return iter->second;
        }

        return level::info;
    } // to_level

    auto get_level_from_config(const nlohmann::json& _log_level, const std::string_view _category) noexcept -> level
    {
        try {
            return to_level(_log_level.at(std::string{_category}).get_ref<const std::string&>());
        }
        catch (const std::exception&) {
            configuration::trace("Cannot get log level for log category [{}]. Defaulting to [info].", _category);
        }

        return level::info;
    } // get_level_from_config

    auto set_server_host(std::string _host) noexcept -> void
    {
        g_server_host = std::move(_host);
    } // set_server_host

    auto get_server_host() noexcept -> std::string_view
    {
        return g_server_host;
    } // get_server_host

    namespace detail
    {
        auto get_logger() noexcept -> std::shared_ptr<spdlog::logger>
        {
            std::lock_guard lock{g_log_mutex};
            return g_log;
        } // get_logger
    } // namespace detail
} // namespace handoff::log
