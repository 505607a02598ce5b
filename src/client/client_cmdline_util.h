#ifndef CLIENT_CMDLINE_H
#define CLIENT_CMDLINE_H

#include "shared_common_util.h"
#include "shared_config.h"
#include "shared_net_username_util.h"

#include <Poco/NumberParser.h>

#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

inline void print_client_usage()
{
    std::cout << "Usage: cryptex_client [<host> <port>] <username> "
                 "[--config <file>] [--debug]\n\n"
                 "Runtime commands:\n"
                 "help                      show commands\n"
                 "q                         quit\n"
                 "list                      list connected users\n"
                 "keys                      list known peer fingerprints\n"
                 "@<username> <message>     send message to one peer\n"
                 "<message>                 send message to everyone\n";
}

// Positional arguments override the config file; --debug overrides both.
inline std::optional<ClientConfig> parse_command_line_args(std::span<char *> args)
{
    ClientConfig cfg;
    std::vector<std::string> positional;

    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string_view arg = args[i];
        if (arg == "--config" && i + 1 < args.size())
        {
            auto loaded = load_client_config(args[++i]);
            if (auto *err = std::get_if<ConfigError>(&loaded))
            {
                std::cout << "config " << args[i] << ": "
                          << config_error_str(*err) << "\n";
                return std::nullopt;
            }
            const bool debug = cfg.debug;
            cfg              = std::get<ClientConfig>(std::move(loaded));
            cfg.debug        = cfg.debug || debug;
        }
        else if (arg == "--debug")
        {
            cfg.debug = true;
        }
        else if (arg == "--help" || arg.starts_with("--"))
        {
            print_client_usage();
            return std::nullopt;
        }
        else
        {
            positional.emplace_back(arg);
        }
    }

    if (positional.size() == 3)
    {
        cfg.host = positional[0];
        int port = 0;
        if (!Poco::NumberParser::tryParse(positional[1], port) ||
            !is_valid_port(port))
        {
            std::cout << "Invalid port number\n";
            return std::nullopt;
        }
        cfg.port     = port;
        cfg.username = trim(positional[2]);
    }
    else if (positional.size() == 1)
    {
        cfg.username = trim(positional[0]);
    }
    else if (!positional.empty() || cfg.username.empty())
    {
        print_client_usage();
        return std::nullopt;
    }

    if (!is_valid_username(cfg.username))
    {
        std::cout << "Invalid username. Use 3-20 letters, digits or "
                     "underscore\n";
        return std::nullopt;
    }

    return cfg;
}

#endif
