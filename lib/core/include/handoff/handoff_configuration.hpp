#ifndef HANDOFF_CONFIGURATION_HPP
#define HANDOFF_CONFIGURATION_HPP

/// \file

#include "handoff/handoff_configuration_keywords.hpp"
#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace handoff
{
    /// A json document holding the handoff settings of the process.
    ///
    /// Values are captured from the file named by the HANDOFF_CONFIG_FILE environment
    /// variable. Scalar settings may be overridden by an environment variable whose name
    /// is the upper-cased keyword (e.g. HANDOFF_TIMEOUT).
    class configuration
    {
    public:
        /// The process-wide configuration.
        static auto instance() -> configuration&;

        configuration() = default;

        explicit configuration(nlohmann::json _props);

        /// Reads the configuration file named by HANDOFF_CONFIG_FILE (if set) and applies
        /// environment overrides.
        ///
        /// \throws handoff::exception If the file cannot be read or parsed.
        auto capture() -> void;

        /// Replaces the current settings with the contents of \p _path.
        ///
        /// \throws handoff::exception If the file cannot be read or parsed.
        auto load(const std::string& _path) -> void;

        /// Overwrites scalar settings with values found in the environment.
        auto apply_environment_overrides() -> void;

        auto contains(const std::string_view _key) const -> bool
        {
            return props_.find(std::string{_key}) != props_.end();
        }

        template <typename T>
        auto get_property(const std::string& _key) const -> T
        {
            const auto prop = props_.find(_key);

            if (prop == props_.end()) {
                THROW(KEY_NOT_FOUND, fmt::format("configuration does not contain key [{}]", _key));
            }

            try {
                return prop->template get<T>();
            }
            catch (const nlohmann::json::exception& e) {
                THROW(KEY_TYPE_MISMATCH, fmt::format("configuration key [{}] has wrong type: {}", _key, e.what()));
            }
        }

        template <typename T>
        auto get_property_or(const std::string& _key, T _default) const -> T
        {
            if (!contains(_key)) {
                return _default;
            }

            return get_property<T>(_key);
        }

        template <typename T>
        auto set_property(const std::string& _key, const T& _val) -> void
        {
            props_[_key] = _val;
        }

        auto remove(const std::string& _key) -> void
        {
            props_.erase(_key);
        }

        auto map() const noexcept -> const nlohmann::json&
        {
            return props_;
        }

    private:
        nlohmann::json props_ = nlohmann::json::object();
    }; // class configuration

    template <typename T>
    auto get_configuration_property(const std::string& _prop) -> T
    {
        return configuration::instance().get_property<T>(_prop);
    }

    /// Applies the levels found in the "log_level" object of \p _config to every
    /// logger category. Categories which are not listed are set to info.
    auto configure_log_levels(const configuration& _config) -> void;
} // namespace handoff

#endif // HANDOFF_CONFIGURATION_HPP
