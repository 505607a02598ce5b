#ifndef SHARED_COMMON_UTIL_H
#define SHARED_COMMON_UTIL_H

#include <Poco/Timestamp.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <ranges>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

inline std::atomic_bool debug_mode{false};

inline void dev_println(std::string_view s)
{
    if (debug_mode.load())
        std::cerr << s << "\n";
}

[[nodiscard]] inline uint64_t get_current_timestamp_ms() noexcept
{
    return static_cast<uint64_t>(Poco::Timestamp().epochMicroseconds() / 1000);
}

inline std::string format_hhmmss(uint64_t ms)
{
    const auto t = static_cast<std::time_t>(ms / 1000);
    std::tm    tm{};
    localtime_r(&t, &tm);

    std::ostringstream os;
    os << std::setfill('0') << std::setw(2) << tm.tm_hour << ':'
       << std::setw(2) << tm.tm_min << ':' << std::setw(2) << tm.tm_sec;
    return os.str();
}

inline std::string to_hex(std::span<const unsigned char> data)
{
    constexpr std::array<char, 16> hex = {'0', '1', '2', '3', '4', '5',
                                          '6', '7', '8', '9', 'a', 'b',
                                          'c', 'd', 'e', 'f'};
    std::string                    s;
    s.reserve(data.size() * 2);
    for (const auto c : data)
    {
        const size_t hi = static_cast<size_t>(c) >> 4;
        const size_t lo = static_cast<size_t>(c) & 0xF;
        s.push_back(hex.at(hi));
        s.push_back(hex.at(lo));
    }
    return s;
}

inline std::string to_hex(const unsigned char *b, size_t n)
{
    return to_hex(std::span<const unsigned char>(b, n));
}

constexpr unsigned char hexval_local(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    throw std::invalid_argument("bad hex");
}

inline std::vector<unsigned char> from_hex(std::string_view hex)
{
    if (hex.size() % 2 != 0U)
        throw std::invalid_argument("hex length");
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        const unsigned char hi = hexval_local(hex[i]);
        const unsigned char lo = hexval_local(hex[i + 1]);
        out.push_back((hi << 4) | lo);
    }
    return out;
}

[[nodiscard]] constexpr bool is_trim_space(unsigned char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

inline std::string trim(std::string s)
{
    s.erase(s.begin(), std::ranges::find_if(s, [](unsigned char c)
                                            { return !is_trim_space(c); }));

    s.erase(std::ranges::find_if(s | std::views::reverse,
                                 [](unsigned char c)
                                 { return !is_trim_space(c); })
                .base(),
            s.end());

    return s;
}

[[nodiscard]] inline std::string_view trim_view(std::string_view s) noexcept
{
    while (!s.empty() && is_trim_space(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && is_trim_space(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

// Splits on every occurrence of sep; keeps empty pieces.
inline std::vector<std::string> split_all(std::string_view s,
                                          std::string_view sep)
{
    std::vector<std::string> out;
    if (sep.empty())
    {
        out.emplace_back(s);
        return out;
    }
    size_t start = 0;
    for (;;)
    {
        const size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos)
        {
            out.emplace_back(s.substr(start));
            return out;
        }
        out.emplace_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
}

inline std::string join(const std::vector<std::string> &parts,
                        std::string_view                sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i != 0)
            out.append(sep);
        out.append(parts[i]);
    }
    return out;
}

#endif
