#ifndef SHARED_NET_FRAME_IO_H
#define SHARED_NET_FRAME_IO_H

#include "shared_common_util.h"
#include "shared_net_common_protocol.h"
#include "shared_net_socket_util.h"

#include <asio.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

inline constexpr size_t DEFAULT_READ_BUFFER_SIZE   = 4096;
inline constexpr size_t DEFAULT_MAX_ENVELOPE_BYTES = 1048576;

// Ordered reliable byte stream. shutdown() may be called from another thread
// to unblock a pending read_some().
class Transport
{
  public:
    virtual ~Transport() = default;

    virtual size_t read_some(std::span<char> buf, std::error_code &ec) = 0;
    virtual std::error_code write_all(std::string_view data)          = 0;
    virtual void            shutdown() noexcept                       = 0;
    [[nodiscard]] virtual std::string remote_address() const          = 0;
};

class AsioTransport final : public Transport
{
  public:
    AsioTransport(std::shared_ptr<asio::io_context>      io,
                  std::unique_ptr<asio::ip::tcp::socket> sock)
        : io_(std::move(io)), sock_(std::move(sock))
    {
        std::error_code ec;
        const auto      ep = sock_->remote_endpoint(ec);
        if (!ec)
            remote_ = ep.address().to_string() + ":" + std::to_string(ep.port());
        else
            remote_ = "unknown";
    }

    ~AsioTransport() override
    {
        std::error_code ec;
        sock_->close(ec);
    }

    AsioTransport(const AsioTransport &)            = delete;
    AsioTransport &operator=(const AsioTransport &) = delete;

    size_t read_some(std::span<char> buf, std::error_code &ec) override
    {
        return sock_->read_some(asio::buffer(buf.data(), buf.size()), ec);
    }

    std::error_code write_all(std::string_view data) override
    {
        std::error_code ec;
        asio::write(*sock_, asio::buffer(data.data(), data.size()), ec);
        return ec;
    }

    void shutdown() noexcept override
    {
        std::error_code ec;
        sock_->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    }

    [[nodiscard]] std::string remote_address() const override
    {
        return remote_;
    }

  private:
    std::shared_ptr<asio::io_context>      io_;
    std::unique_ptr<asio::ip::tcp::socket> sock_;
    std::string                            remote_;
};

[[nodiscard]] inline std::unique_ptr<Transport>
connect_transport(const std::string &host, int port, std::error_code &ec)
{
    auto io   = std::make_shared<asio::io_context>();
    auto sock = connect_to_host_asio(*io, host, port, ec);
    if (!sock)
        return nullptr;
    return std::make_unique<AsioTransport>(std::move(io), std::move(sock));
}

// Rebuilds delimiter-terminated envelopes from arbitrary read boundaries.
class StreamFramer
{
  public:
    explicit StreamFramer(size_t max_pending = DEFAULT_MAX_ENVELOPE_BYTES)
        : max_pending_(max_pending)
    {
    }

    // Appends bytes and decodes every completed span in order. Returns false
    // once the pending partial span exceeds the configured bound.
    [[nodiscard]] bool feed(std::string_view bytes, std::vector<DecodeResult> &out)
    {
        const size_t resume = buf_.size() >= MSG_DELIMITER.size()
                                  ? buf_.size() - (MSG_DELIMITER.size() - 1)
                                  : 0;
        buf_.append(bytes);

        size_t start = 0;
        size_t scan  = resume;
        for (;;)
        {
            const size_t pos = buf_.find(MSG_DELIMITER, scan);
            if (pos == std::string::npos)
                break;

            const std::string_view span =
                trim_view(std::string_view(buf_).substr(start, pos - start));
            if (span.size() > max_pending_)
            {
                buf_.clear();
                return false;
            }
            if (!span.empty())
                out.push_back(decode_envelope(span));

            start = pos + MSG_DELIMITER.size();
            scan  = start;
        }
        buf_.erase(0, start);

        if (buf_.size() > max_pending_)
        {
            buf_.clear();
            return false;
        }
        return true;
    }

    [[nodiscard]] size_t pending() const noexcept { return buf_.size(); }

  private:
    std::string buf_;
    size_t      max_pending_;
};

// One blocking read fed through the framer. Overflow maps to
// errc::message_size; end of stream to asio::error::eof.
inline std::error_code read_envelopes(Transport &t, StreamFramer &framer,
                                      std::vector<char>         &scratch,
                                      std::vector<DecodeResult> &out)
{
    std::error_code ec;
    const size_t    n = t.read_some(std::span<char>(scratch), ec);
    if (n > 0 && !framer.feed(std::string_view(scratch.data(), n), out))
        return std::make_error_code(std::errc::message_size);
    if (ec)
        return ec;
    if (n == 0)
        return asio::error::eof;
    return {};
}

inline std::error_code write_envelope(Transport &t, const Envelope &env)
{
    return t.write_all(frame_envelope(env));
}

#endif
