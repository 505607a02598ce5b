#ifndef SHARED_NET_SOCKET_UTIL_H
#define SHARED_NET_SOCKET_UTIL_H

#include <asio.hpp>

#include <fcntl.h>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <system_error>

inline void set_cloexec(int fd) noexcept
{
    int fd_flags = ::fcntl(fd, F_GETFD);
    if (fd_flags >= 0)
        ::fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);
}

[[nodiscard]] inline std::shared_ptr<asio::ip::tcp::acceptor>
make_listen_socket_asio(asio::io_context &io, const std::string &host, int port,
                        int backlog = 16, std::error_code *out_ec = nullptr)
{
  try {
    const auto address = host.empty() ? asio::ip::address_v4::any()
                                      : asio::ip::make_address(host);
    const asio::ip::tcp::endpoint ep(address,
                                     static_cast<unsigned short>(port));

    auto acceptor = std::make_shared<asio::ip::tcp::acceptor>(io);
    acceptor->open(ep.protocol());
    acceptor->set_option(asio::ip::tcp::acceptor::reuse_address(true));
    set_cloexec(acceptor->native_handle());
    acceptor->bind(ep);
    acceptor->listen(backlog);
    if (out_ec)
      *out_ec = std::error_code();
    return acceptor;
  } catch (const std::system_error &e) {
    if (out_ec)
      *out_ec = e.code();
    return nullptr;
  }
}

[[nodiscard]] inline std::unique_ptr<asio::ip::tcp::socket>
connect_to_host_asio(asio::io_context &io, const std::string &host, int port,
                     std::error_code &ec)
{
  asio::ip::tcp::resolver resolver(io);
  const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec)
    return nullptr;

  auto sock = std::make_unique<asio::ip::tcp::socket>(io);
  asio::connect(*sock, endpoints, ec);
  if (ec)
    return nullptr;

  set_cloexec(static_cast<int>(sock->native_handle()));
  sock->set_option(asio::ip::tcp::no_delay(true), ec);
  ec.clear();
  return sock;
}

#endif
