#ifndef HANDOFF_SSL_OPTIONS_HPP
#define HANDOFF_SSL_OPTIONS_HPP

/// \file

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace handoff
{
    /// TLS material for outbound handoff connections.
    struct ssl_options
    {
        std::optional<std::string> certfile;
        std::optional<std::string> keyfile;
        std::optional<std::string> cacertfile;
        std::optional<std::string> dhfile;

        // Ignored unless a CA file is configured.
        bool verify_peer = true;
    };

    /// Reads the handoff_ssl_options object.
    ///
    /// Returns an empty optional if \p _options is null or holds no file properties.
    ///
    /// \throws handoff::exception If \p _options is neither null nor an object, or if a
    ///                            property has the wrong type.
    auto ssl_options_from_json(const nlohmann::json& _options) -> std::optional<ssl_options>;

    /// Checks that every configured file exists and is readable.
    ///
    /// A single bad file disables TLS altogether. The offending property and the cause
    /// are logged and an empty optional is returned.
    auto validate_ssl_options(const ssl_options& _options) -> std::optional<ssl_options>;
} // namespace handoff

#endif // HANDOFF_SSL_OPTIONS_HPP
