//
// Logger Configuration
//

template <>
class logger_config<category::sender>
{
    static constexpr const char* name = "sender";
    inline static handoff::log::level current_level = handoff::log::level::info;

    friend class logger<category::sender>;
};

template <>
class logger_config<category::network>
{
    static constexpr const char* name = "network";
    inline static handoff::log::level current_level = handoff::log::level::info;

    friend class logger<category::network>;
};

template <>
class logger_config<category::configuration>
{
    static constexpr const char* name = "configuration";
    inline static handoff::log::level current_level = handoff::log::level::info;

    friend class logger<category::configuration>;
};

//
// Logger
//

template <typename Category>
class logger
{
public:
    template <handoff::log::level>
    class impl;

    logger() = delete;

    logger(const logger&) = delete;
    auto operator=(const logger&) -> logger& = delete;

    static auto name() noexcept -> const char*
    {
        return logger_config<Category>::name;
    }

    static auto set_level(handoff::log::level _level) noexcept -> void
    {
        logger_config<Category>::current_level = _level;
    }

    static auto get_level() noexcept -> handoff::log::level
    {
        return logger_config<Category>::current_level;
    }

    // clang-format off
    inline static const impl<handoff::log::level::trace>    trace{};
    inline static const impl<handoff::log::level::debug>    debug{};
    inline static const impl<handoff::log::level::info>     info{};
    inline static const impl<handoff::log::level::warn>     warn{};
    inline static const impl<handoff::log::level::error>    error{};
    inline static const impl<handoff::log::level::critical> critical{};
    // clang-format on
};

template <typename Category>
template <handoff::log::level Level>
class logger<Category>::impl
{
public:
    impl() = default;

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    template <typename... Args>
    void operator()(fmt::format_string<Args...> _format, Args&&... _args) const
    {
        if (!should_log()) {
            return;
        }

        try {
            const auto msg = fmt::format(_format, std::forward<Args>(_args)...);
            (*this)({{tag::message, msg}});
        }
        catch (const std::exception&) {
            // A record that cannot be formatted is dropped.
        }
    }

    void operator()(std::initializer_list<key_value> _list) const noexcept
    {
        (*this)(std::begin(_list), std::end(_list));
    }

    template <typename ForwardIt>
    void operator()(ForwardIt _first, ForwardIt _last) const noexcept
    {
        if (!should_log()) {
            return;
        }

        auto sink = detail::get_logger();

        if (!sink) {
            return;
        }

        try {
            const auto msg = to_json_string(_first, _last);

            if constexpr (Level == handoff::log::level::trace) {
                sink->trace(msg);
            }
            else if constexpr (Level == handoff::log::level::debug) {
                sink->debug(msg);
            }
            else if constexpr (Level == handoff::log::level::info) {
                sink->info(msg);
            }
            else if constexpr (Level == handoff::log::level::warn) {
                sink->warn(msg);
            }
            else if constexpr (Level == handoff::log::level::error) {
                sink->error(msg);
            }
            else if constexpr (Level == handoff::log::level::critical) {
                sink->critical(msg);
            }
        }
        catch (const std::exception&) {
            // Logging must never take down the caller.
        }
    }

private:
    struct tag
    {
        // clang-format off
        inline static const char* category  = "log_category";
        inline static const char* facility  = "log_facility";
        inline static const char* message   = "log_message";
        inline static const char* level     = "log_level";
        inline static const char* host      = "server_host";
        inline static const char* pid       = "server_pid";
        inline static const char* timestamp = "server_timestamp";
        // clang-format on
    };

    auto should_log() const noexcept -> bool
    {
        return Level >= logger_config<Category>::current_level;
    }

    static auto utc_timestamp() -> std::string
    {
        // clang-format off
        using clock      = std::chrono::system_clock;
        using time_point = std::chrono::time_point<clock>;
        // clang-format on

        timeval tv{};

        if (const auto ec = gettimeofday(&tv, nullptr); ec != 0) {
            const auto now = clock::to_time_t(clock::now());

            std::tm tm{};
            gmtime_r(&now, &tm);

            std::stringstream ss;
            ss << std::put_time(&tm, "%FT%T.0Z");

            return ss.str();
        }

        const auto now = clock::to_time_t(time_point{std::chrono::seconds{tv.tv_sec}});

        std::tm tm{};
        gmtime_r(&now, &tm);

        std::stringstream ss;
        ss << std::put_time(&tm, "%FT%T.") << std::setw(6) << std::setfill('0') << tv.tv_usec << 'Z';

        return ss.str();
    }

    static constexpr auto log_level_as_string() noexcept -> const char*
    {
        // clang-format off
        if constexpr (Level == handoff::log::level::trace)    { return "trace"; }
        if constexpr (Level == handoff::log::level::debug)    { return "debug"; }
        if constexpr (Level == handoff::log::level::info)     { return "info"; }
        if constexpr (Level == handoff::log::level::warn)     { return "warn"; }
        if constexpr (Level == handoff::log::level::error)    { return "error"; }
        if constexpr (Level == handoff::log::level::critical) { return "critical"; }
        // clang-format on

        return "?";
    }

    template <typename ForwardIt>
    static auto to_json_string(ForwardIt _first, ForwardIt _last) -> std::string
    {
        using json = nlohmann::json;
        using container = std::unordered_map<std::string, std::string>;

        json object = container(_first, _last);

        object[tag::category] = logger_config<Category>::name;
        object[tag::level] = log_level_as_string();
        object[tag::facility] = "local0";
        object[tag::host] = std::string{get_server_host()};
        object[tag::pid] = getpid();
        object[tag::timestamp] = utc_timestamp();

        return object.dump();
    }
};
