#ifndef HANDOFF_LOGGER_HPP
#define HANDOFF_LOGGER_HPP

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace handoff::log
{
    using key_value = std::pair<const std::string, std::string>;

    enum class level : std::uint8_t
    {
        trace,
        debug,
        info,
        warn,
        error,
        critical
    };

    struct category
    {
        struct sender;
        struct network;
        struct configuration;
    };

    template <typename Category>
    class logger_config;

    template <typename Category>
    class logger;

    // clang-format off
    using sender        = logger<category::sender>;
    using network       = logger<category::network>;
    using configuration = logger<category::configuration>;
    // clang-format on

    /// Installs the sinks used by every logger category.
    ///
    /// Records produced before this function is called are dropped.
    ///
    /// \param[in] _write_to_stdout If true, records are written to stdout. Otherwise they
    ///                             are written to syslog.
    /// \param[in] _test_mode_sink  An optional additional sink which receives a copy of
    ///                             every record.
    auto init(bool _write_to_stdout, spdlog::sink_ptr _test_mode_sink = nullptr) noexcept -> void;

    /// Removes all sinks. Records are dropped until init() is called again.
    auto deinit() noexcept -> void;

    auto to_level(const std::string_view _level) noexcept -> level;

    /// Reads the level of \p _category from a "log_level" configuration object.
    ///
    /// \returns level::info if the category is not present or holds an invalid value.
    auto get_level_from_config(const nlohmann::json& _log_level, const std::string_view _category) noexcept -> level;

    auto set_server_host(std::string _host) noexcept -> void;
    auto get_server_host() noexcept -> std::string_view;

    namespace detail
    {
        auto get_logger() noexcept -> std::shared_ptr<spdlog::logger>;
    } // namespace detail

#include "handoff/handoff_logger.tpp"
} // namespace handoff::log

#endif // HANDOFF_LOGGER_HPP
