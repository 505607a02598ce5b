#ifndef SHARED_CONFIG_H
#define SHARED_CONFIG_H

#include "shared_common_crypto.h"
#include "shared_common_util.h"
#include "shared_net_frame_io.h"
#include "shared_net_username_util.h"

#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/FileStream.h>
#include <Poco/NumberParser.h>

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

inline constexpr int         DEFAULT_PORT            = 5555;
inline constexpr int         DEFAULT_MAX_CONNECTIONS = 10;
inline constexpr const char *DEFAULT_RELAY_HOST      = "0.0.0.0";
inline constexpr const char *DEFAULT_CLIENT_HOST     = "127.0.0.1";

struct RelayConfig
{
    std::string host               = DEFAULT_RELAY_HOST;
    int         port               = DEFAULT_PORT;
    int         max_connections    = DEFAULT_MAX_CONNECTIONS;
    size_t      read_buffer_size   = DEFAULT_READ_BUFFER_SIZE;
    size_t      max_envelope_bytes = DEFAULT_MAX_ENVELOPE_BYTES;
    bool        debug              = false;
};

struct ClientConfig
{
    std::string host               = DEFAULT_CLIENT_HOST;
    int         port               = DEFAULT_PORT;
    std::string username{};
    int         rsa_key_bits       = DEFAULT_RSA_BITS;
    size_t      read_buffer_size   = DEFAULT_READ_BUFFER_SIZE;
    size_t      max_envelope_bytes = DEFAULT_MAX_ENVELOPE_BYTES;
    bool        debug              = false;
};

enum class ConfigError : uint8_t
{
    FileNotFound,
    ReadFailed,
    UnknownKey,
    BadValue
};

[[nodiscard]] inline constexpr std::string_view
config_error_str(ConfigError e) noexcept
{
    constexpr std::array<std::string_view, 4> msgs = {
        "file not found", "read failed", "unknown key", "bad value"};
    return msgs[static_cast<size_t>(e)];
}

template <typename T> using ConfigResult = std::variant<T, ConfigError>;

namespace config_detail
{

using Setter = std::function<bool(const std::string &)>;

inline bool parse_int(const std::string &v, int min, int max, int &out)
{
    int parsed = 0;
    if (!Poco::NumberParser::tryParse(v, parsed) || parsed < min ||
        parsed > max)
        return false;
    out = parsed;
    return true;
}

inline bool parse_size(const std::string &v, size_t min, size_t &out)
{
    Poco::UInt64 parsed = 0;
    if (!Poco::NumberParser::tryParseUnsigned64(v, parsed) || parsed < min)
        return false;
    out = static_cast<size_t>(parsed);
    return true;
}

inline bool parse_flag(const std::string &v, bool &out)
{
    return Poco::NumberParser::tryParseBool(v, out);
}

// Reads "key = value" lines; '#' starts a comment. Blank lines are skipped.
inline std::variant<std::monostate, ConfigError>
apply_file(const std::string                             &path,
           const std::unordered_map<std::string, Setter> &setters)
{
    try
    {
        Poco::File cfg_file(path);
        if (!cfg_file.exists() || !cfg_file.isFile())
            return ConfigError::FileNotFound;

        Poco::FileInputStream fis(path);
        if (!fis.good())
            return ConfigError::ReadFailed;

        std::string line;
        size_t      lineno = 0;
        while (std::getline(fis, line))
        {
            ++lineno;
            if (const auto hash = line.find('#'); hash != std::string::npos)
                line.erase(hash);
            line = trim(std::move(line));
            if (line.empty())
                continue;

            const auto eq = line.find('=');
            if (eq == std::string::npos)
            {
                std::cerr << "[" << get_current_timestamp_ms() << "] config "
                          << path << ":" << lineno << ": missing '='\n";
                return ConfigError::BadValue;
            }
            const std::string key   = trim(line.substr(0, eq));
            const std::string value = trim(line.substr(eq + 1));

            auto it = setters.find(key);
            if (it == setters.end())
            {
                std::cerr << "[" << get_current_timestamp_ms() << "] config "
                          << path << ":" << lineno << ": unknown key '" << key
                          << "'\n";
                return ConfigError::UnknownKey;
            }
            if (!it->second(value))
            {
                std::cerr << "[" << get_current_timestamp_ms() << "] config "
                          << path << ":" << lineno << ": bad value for '"
                          << key << "'\n";
                return ConfigError::BadValue;
            }
        }
        if (fis.bad())
            return ConfigError::ReadFailed;
    }
    catch (const Poco::Exception &e)
    {
        std::cerr << "[" << get_current_timestamp_ms() << "] config " << path
                  << ": " << e.displayText() << "\n";
        return ConfigError::ReadFailed;
    }
    return std::monostate{};
}

} // namespace config_detail

inline ConfigResult<RelayConfig> load_relay_config(const std::string &path)
{
    RelayConfig cfg;

    const std::unordered_map<std::string, config_detail::Setter> setters = {
        {"host",
         [&cfg](const std::string &v)
         {
             cfg.host = v;
             return !v.empty();
         }},
        {"port", [&cfg](const std::string &v)
         { return config_detail::parse_int(v, 1, 65535, cfg.port); }},
        {"max_connections",
         [&cfg](const std::string &v) {
             return config_detail::parse_int(v, 1, 4096, cfg.max_connections);
         }},
        {"read_buffer_size",
         [&cfg](const std::string &v)
         { return config_detail::parse_size(v, 64, cfg.read_buffer_size); }},
        {"max_envelope_bytes",
         [&cfg](const std::string &v) {
             return config_detail::parse_size(v, 1024, cfg.max_envelope_bytes);
         }},
        {"debug", [&cfg](const std::string &v)
         { return config_detail::parse_flag(v, cfg.debug); }},
    };

    auto res = config_detail::apply_file(path, setters);
    if (auto *err = std::get_if<ConfigError>(&res))
        return *err;
    return cfg;
}

inline ConfigResult<ClientConfig> load_client_config(const std::string &path)
{
    ClientConfig cfg;

    const std::unordered_map<std::string, config_detail::Setter> setters = {
        {"host",
         [&cfg](const std::string &v)
         {
             cfg.host = v;
             return !v.empty();
         }},
        {"port", [&cfg](const std::string &v)
         { return config_detail::parse_int(v, 1, 65535, cfg.port); }},
        {"username",
         [&cfg](const std::string &v)
         {
             cfg.username = v;
             return is_valid_username(v);
         }},
        {"rsa_key_bits",
         [&cfg](const std::string &v) {
             return config_detail::parse_int(v, DEFAULT_RSA_BITS, 16384,
                                             cfg.rsa_key_bits);
         }},
        {"read_buffer_size",
         [&cfg](const std::string &v)
         { return config_detail::parse_size(v, 64, cfg.read_buffer_size); }},
        {"max_envelope_bytes",
         [&cfg](const std::string &v) {
             return config_detail::parse_size(v, 1024, cfg.max_envelope_bytes);
         }},
        {"debug", [&cfg](const std::string &v)
         { return config_detail::parse_flag(v, cfg.debug); }},
    };

    auto res = config_detail::apply_file(path, setters);
    if (auto *err = std::get_if<ConfigError>(&res))
        return *err;
    return cfg;
}

#endif
