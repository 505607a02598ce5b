#include "client_cmdline_util.h"
#include "client_runtime.h"
#include "client_session.h"
#include "shared_common_crypto.h"
#include "shared_common_util.h"

#include <csignal>
#include <iostream>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace
{

class ConsoleObserver final : public SessionObserver
{
  public:
    void on_message(const std::string &sender,
                    const std::string &plaintext) override
    {
        std::lock_guard<std::mutex> lk(out_mtx_);
        std::cout << "[" << format_hhmmss(get_current_timestamp_ms()) << "] "
                  << sender << ": " << plaintext << "\n"
                  << std::flush;
    }

    void on_directory_changed(const std::vector<std::string> &ids) override
    {
        std::lock_guard<std::mutex> lk(out_mtx_);
        std::cout << "[" << format_hhmmss(get_current_timestamp_ms())
                  << "] online: " << join(ids, ", ") << "\n"
                  << std::flush;
    }

    void on_connection_state(bool               is_connected,
                             const std::string &reason) override
    {
        std::lock_guard<std::mutex> lk(out_mtx_);
        std::cout << "[" << format_hhmmss(get_current_timestamp_ms()) << "] "
                  << (is_connected ? "connected: " : "disconnected: ")
                  << reason << "\n"
                  << std::flush;
    }

    void on_error(const std::string &message) override
    {
        std::lock_guard<std::mutex> lk(out_mtx_);
        std::cout << "[" << format_hhmmss(get_current_timestamp_ms())
                  << "] error: " << message << "\n"
                  << std::flush;
    }

  private:
    std::mutex out_mtx_;
};

void run_console(PeerSession &session)
{
    std::string line;
    while (session.state() == SessionState::Active &&
           std::getline(std::cin, line))
    {
        line = trim(std::move(line));
        if (line.empty())
            continue;

        if (line == "q")
            break;
        if (line == "help")
        {
            print_client_usage();
            continue;
        }
        if (line == "list")
        {
            std::cout << "online: " << join(session.directory(), ", ") << "\n";
            continue;
        }
        if (line == "keys")
        {
            for (const auto &name : session.known_peers())
            {
                if (auto p = session.peer(name))
                    std::cout << name << " " << p->peer_fp_hex << "\n";
            }
            continue;
        }

        std::string recipient(BROADCAST_TARGET);
        std::string text = line;
        if (line.front() == '@')
        {
            const auto space = line.find(' ');
            if (space == std::string::npos)
            {
                std::cout << "usage: @<username> <message>\n";
                continue;
            }
            recipient = line.substr(1, space - 1);
            text      = trim(line.substr(space + 1));
        }

        const SendResult r = session.send(recipient, text);
        if (r != SendResult::Sent)
            std::cout << "not sent: " << send_result_str(r) << "\n";
    }
}

} // namespace

int main(int argc, char **argv)
{
    const std::span<char *> args(argv, static_cast<std::size_t>(argc));

    const auto cfg = parse_command_line_args(args);
    if (!cfg)
        return 1;

    debug_mode = cfg->debug;
    std::signal(SIGPIPE, SIG_IGN);
    crypto_init();

    ConsoleObserver    observer;
    PeerSessionOptions opts;
    opts.rsa_key_bits       = cfg->rsa_key_bits;
    opts.read_buffer_size   = cfg->read_buffer_size;
    opts.max_envelope_bytes = cfg->max_envelope_bytes;

    try
    {
        PeerSession session(cfg->username, observer, opts);
        const std::string err = session.connect(cfg->host, cfg->port);
        if (!err.empty())
        {
            std::cout << "Could not connect: " << err << "\n";
            return 1;
        }
        std::cout << "Your key fingerprint: " << session.fingerprint() << "\n"
                  << "Type 'help' for commands.\n";

        run_console(session);
        dev_println("leaving console, session " +
                    std::string(session_state_str(session.state())));
        session.disconnect();
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "[" << get_current_timestamp_ms() << "] fatal: "
                  << e.what() << "\n";
        return 1;
    }
    return 0;
}
