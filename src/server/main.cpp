#include "server_connection.h"
#include "shared_audit_sink.h"
#include "shared_common_crypto.h"
#include "shared_common_util.h"
#include "shared_config.h"
#include "shared_net_username_util.h"

#include <Poco/NumberParser.h>

#include <csignal>
#include <iostream>
#include <pthread.h>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

static void print_usage()
{
    std::cout << "Usage: cryptex_relay [--config <file>] [--host <addr>] "
                 "[--port <port>] [--debug]\n";
}

int main(int argc, char **argv)
{
    const std::span<char *> args(argv, static_cast<size_t>(argc));

    RelayConfig cfg;
    for (size_t i = 1; i < args.size(); ++i)
    {
        if (std::string_view(args[i]) == "--config" && i + 1 < args.size())
        {
            auto loaded = load_relay_config(args[i + 1]);
            if (auto *err = std::get_if<ConfigError>(&loaded))
            {
                std::cerr << "config " << args[i + 1] << ": "
                          << config_error_str(*err) << "\n";
                return 1;
            }
            cfg = std::get<RelayConfig>(std::move(loaded));
        }
    }

    for (size_t i = 1; i < args.size(); ++i)
    {
        const std::string_view arg = args[i];
        const bool             has_value = i + 1 < args.size();
        if (arg == "--config" && has_value)
            ++i;
        else if (arg == "--host" && has_value)
            cfg.host = args[++i];
        else if (arg == "--port" && has_value)
        {
            int port = 0;
            if (!Poco::NumberParser::tryParse(args[++i], port) ||
                !is_valid_port(port))
            {
                std::cerr << "invalid port: " << args[i] << "\n";
                return 1;
            }
            cfg.port = port;
        }
        else if (arg == "--debug")
            cfg.debug = true;
        else
        {
            print_usage();
            return arg == "--help" ? 0 : 1;
        }
    }

    debug_mode = cfg.debug;
    crypto_init();

    // Worker threads inherit the mask so only sigwait() sees these.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    LogAuditSink audit;
    RelayServer  server(cfg, audit);
    try
    {
        server.start();
    }
    catch (const std::system_error &e)
    {
        std::cerr << "[" << get_current_timestamp_ms()
                  << "] relay failed to start: " << e.what() << "\n";
        return 1;
    }

    int sig = 0;
    sigwait(&stop_signals, &sig);
    std::cerr << "[" << get_current_timestamp_ms() << "] signal " << sig
              << ", shutting down\n";
    server.stop();
    return 0;
}
