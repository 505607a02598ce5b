#ifndef SHARED_NET_COMMON_PROTOCOL_H
#define SHARED_NET_COMMON_PROTOCOL_H

#include "shared_common_util.h"

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

inline constexpr std::string_view MSG_SEPARATOR = "||";
inline constexpr std::string_view MSG_DELIMITER = "\n###MSG###\n";
inline constexpr std::string_view BROADCAST_TARGET = "ALL";
inline constexpr std::string_view AUTH_SUCCESS     = "SUCCESS";
inline constexpr std::string_view AUTH_REJECTED    = "REJECTED";

enum class MsgType : uint8_t
{
    Auth,
    KeyExchange,
    Message,
    Broadcast,
    UserList,
    Disconnect
};

struct FieldBounds
{
    size_t min{};
    size_t max{};
};

struct MsgTypeInfo
{
    MsgType          type;
    std::string_view tag;
    FieldBounds      bounds;
};

inline constexpr std::array<MsgTypeInfo, 6> MSG_TYPES = {{
    {MsgType::Auth, "AUTH", {1, 2}},
    {MsgType::KeyExchange, "KEY_EXCHANGE", {2, 2}},
    {MsgType::Message, "MESSAGE", {2, 2}},
    {MsgType::Broadcast, "BROADCAST", {1, 2}},
    {MsgType::UserList, "USER_LIST", {1, 1}},
    {MsgType::Disconnect, "DISCONNECT", {0, 1}},
}};

[[nodiscard]] inline constexpr std::string_view
msg_type_str(MsgType t) noexcept
{
    return MSG_TYPES[static_cast<size_t>(t)].tag;
}

[[nodiscard]] inline constexpr FieldBounds
msg_type_bounds(MsgType t) noexcept
{
    return MSG_TYPES[static_cast<size_t>(t)].bounds;
}

[[nodiscard]] inline std::optional<MsgType>
msg_type_from_str(std::string_view tag) noexcept
{
    for (const auto &info : MSG_TYPES)
    {
        if (info.tag == tag)
            return info.type;
    }
    return std::nullopt;
}

struct Envelope
{
    MsgType                  type = MsgType::Disconnect;
    std::vector<std::string> fields;

    [[nodiscard]] const std::string &field(size_t i) const
    {
        return fields.at(i);
    }
};

enum class ParseError : uint8_t
{
    Empty,
    UnknownType,
    FieldCount
};

[[nodiscard]] inline constexpr std::string_view
parse_error_str(ParseError e) noexcept
{
    constexpr std::array<std::string_view, 3> msgs = {
        "empty envelope", "unknown message type", "bad field count"};
    return msgs[static_cast<size_t>(e)];
}

using DecodeResult = std::variant<Envelope, ParseError>;

namespace proto_detail
{

inline void check_field(std::string_view field, bool last)
{
    if (!last && field.find(MSG_SEPARATOR) != std::string_view::npos)
        throw std::runtime_error("bad field: separator inside non-final field");
    if (field.find(MSG_DELIMITER) != std::string_view::npos)
        throw std::runtime_error("bad field: contains envelope delimiter");
}

} // namespace proto_detail

inline std::string encode_envelope(const Envelope &env)
{
    const FieldBounds b = msg_type_bounds(env.type);
    if (env.fields.size() < b.min || env.fields.size() > b.max)
        throw std::runtime_error(std::string("bad field count for ") +
                                 std::string(msg_type_str(env.type)));

    std::string out(msg_type_str(env.type));
    for (size_t i = 0; i < env.fields.size(); ++i)
    {
        proto_detail::check_field(env.fields[i], i + 1 == env.fields.size());
        out.append(MSG_SEPARATOR);
        out.append(env.fields[i]);
    }
    return out;
}

inline std::string frame_envelope(const Envelope &env)
{
    std::string out = encode_envelope(env);
    out.append(MSG_DELIMITER);
    return out;
}

// The splitter stops after max-1 cuts so the last field keeps any separator
// bytes it carries.
inline DecodeResult decode_envelope(std::string_view text)
{
    text = trim_view(text);
    if (text.empty())
        return ParseError::Empty;

    const size_t     first = text.find(MSG_SEPARATOR);
    const std::string_view tag =
        first == std::string_view::npos ? text : text.substr(0, first);

    const auto type = msg_type_from_str(tag);
    if (!type)
        return ParseError::UnknownType;

    Envelope env;
    env.type = *type;

    const FieldBounds b = msg_type_bounds(*type);
    if (first != std::string_view::npos)
    {
        std::string_view rest = text.substr(first + MSG_SEPARATOR.size());
        for (;;)
        {
            const size_t pos = rest.find(MSG_SEPARATOR);
            if (pos == std::string_view::npos || env.fields.size() + 1 >= b.max)
            {
                env.fields.emplace_back(rest);
                break;
            }
            env.fields.emplace_back(rest.substr(0, pos));
            rest.remove_prefix(pos + MSG_SEPARATOR.size());
        }
    }

    if (env.fields.size() < b.min || env.fields.size() > b.max)
        return ParseError::FieldCount;

    return env;
}

inline Envelope build_auth(std::string_view identity,
                           std::string_view public_key_pem)
{
    return {MsgType::Auth,
            {std::string(identity), std::string(public_key_pem)}};
}

inline Envelope build_auth_success()
{
    return {MsgType::Auth, {std::string(AUTH_SUCCESS)}};
}

inline Envelope build_auth_rejected(std::string_view reason)
{
    return {MsgType::Auth, {std::string(AUTH_REJECTED), std::string(reason)}};
}

inline Envelope build_key_exchange(std::string_view identity,
                                   std::string_view public_key_pem)
{
    return {MsgType::KeyExchange,
            {std::string(identity), std::string(public_key_pem)}};
}

inline Envelope build_message(std::string_view peer, std::string_view payload)
{
    return {MsgType::Message, {std::string(peer), std::string(payload)}};
}

inline Envelope build_broadcast(std::string_view payload)
{
    return {MsgType::Broadcast, {std::string(payload)}};
}

inline Envelope build_broadcast_from(std::string_view sender,
                                     std::string_view payload)
{
    return {MsgType::Broadcast, {std::string(sender), std::string(payload)}};
}

inline Envelope build_user_list(const std::vector<std::string> &identities)
{
    return {MsgType::UserList, {join(identities, ",")}};
}

inline Envelope build_disconnect(std::string_view reason = {})
{
    Envelope env{MsgType::Disconnect, {}};
    if (!reason.empty())
        env.fields.emplace_back(reason);
    return env;
}

inline std::vector<std::string> parse_user_list(std::string_view field)
{
    std::vector<std::string> out;
    for (auto &name : split_all(field, ","))
    {
        std::string t = trim(std::move(name));
        if (!t.empty())
            out.push_back(std::move(t));
    }
    return out;
}

#endif
