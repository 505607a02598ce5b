#ifndef SHARED_NET_USERNAME_UTIL_H
#define SHARED_NET_USERNAME_UTIL_H

#include "shared_net_common_protocol.h"

#include <algorithm>
#include <cctype>
#include <string_view>

constexpr size_t MAX_USERNAME_LENGTH = 20;
constexpr size_t MIN_USERNAME_LENGTH = 3;

[[nodiscard]] inline bool is_valid_username_char(unsigned char c) noexcept
{
    return (std::isalnum(c) != 0) || c == '_';
}

// "ALL" is reserved as the broadcast target.
[[nodiscard]] inline bool is_valid_username(std::string_view name) noexcept
{
    return name.size() >= MIN_USERNAME_LENGTH &&
           name.size() <= MAX_USERNAME_LENGTH &&
           std::ranges::all_of(name, is_valid_username_char) &&
           name != BROADCAST_TARGET;
}

[[nodiscard]] inline bool is_valid_port(long port) noexcept
{
    return port >= 1 && port <= 65535;
}

#endif
