#include "handoff/ssl_options.hpp"

#include "handoff/handoff_configuration_keywords.hpp"
#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_logger.hpp"

#include <boost/filesystem.hpp>

#include <fmt/format.h>

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

namespace fs = boost::filesystem;

namespace
{
    using log_net = handoff::log::network;

    auto read_path(const nlohmann::json& _options, const std::string& _key) -> std::optional<std::string>
    {
        const auto iter = _options.find(_key);

        if (iter == _options.end() || iter->is_null()) {
            return std::nullopt;
        }

        if (!iter->is_string()) {
            THROW(KEY_TYPE_MISMATCH, fmt::format("ssl option [{}] must be a string", _key));
        }

        return iter->get<std::string>();
    } // read_path

    // Returns an empty string if the file is usable, otherwise the reason it is not.
    auto check_readable(const std::string& _path) -> std::string
    {
        boost::system::error_code ec;
        const auto status = fs::status(_path, ec);

        if (ec || !fs::exists(status)) {
            return "file does not exist";
        }

        if (!fs::is_regular_file(status)) {
            return "not a regular file";
        }

        if (::access(_path.c_str(), R_OK) != 0) {
            return fmt::format("file is not readable: {}", std::strerror(errno));
        }

        return {};
    } // check_readable
} // anonymous namespace

namespace handoff
{
    auto ssl_options_from_json(const nlohmann::json& _options) -> std::optional<ssl_options>
    {
        if (_options.is_null()) {
            return std::nullopt;
        }

        if (!_options.is_object()) {
            THROW(KEY_TYPE_MISMATCH, fmt::format("[{}] must be a json object", KW_CFG_HANDOFF_SSL_OPTIONS));
        }

        ssl_options opts;
        opts.certfile = read_path(_options, KW_CFG_SSL_CERTFILE);
        opts.keyfile = read_path(_options, KW_CFG_SSL_KEYFILE);
        opts.cacertfile = read_path(_options, KW_CFG_SSL_CACERTFILE);
        opts.dhfile = read_path(_options, KW_CFG_SSL_DHFILE);

        if (const auto iter = _options.find(KW_CFG_SSL_VERIFY_PEER); iter != _options.end()) {
            if (!iter->is_boolean()) {
                THROW(KEY_TYPE_MISMATCH, fmt::format("ssl option [{}] must be a boolean", KW_CFG_SSL_VERIFY_PEER));
            }

            opts.verify_peer = iter->get<bool>();
        }

        if (!opts.certfile && !opts.keyfile && !opts.cacertfile && !opts.dhfile) {
            return std::nullopt;
        }

        return opts;
    } // ssl_options_from_json

    auto validate_ssl_options(const ssl_options& _options) -> std::optional<ssl_options>
    {
        const std::vector<std::pair<const std::string&, const std::optional<std::string>&>> files{
            {KW_CFG_SSL_CERTFILE, _options.certfile},
            {KW_CFG_SSL_KEYFILE, _options.keyfile},
            {KW_CFG_SSL_CACERTFILE, _options.cacertfile},
            {KW_CFG_SSL_DHFILE, _options.dhfile}
        };

        for (const auto& [property, path] : files) {
            if (!path) {
                continue;
            }

            if (const auto reason = check_readable(*path); !reason.empty()) {
                log_net::error({{"log_message", "SSL handoff config error. TLS is disabled."},
                                {"property", property},
                                {"path", *path},
                                {"reason", reason}});
                return std::nullopt;
            }
        }

        return _options;
    } // validate_ssl_options
} // namespace handoff
