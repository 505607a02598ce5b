#ifndef SERVER_SESSION_H
#define SERVER_SESSION_H

#include "server_client_state.h"
#include "shared_common_crypto.h"
#include "shared_common_util.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct DirectoryEntry
{
    std::string                  identity{};
    std::shared_ptr<ClientState> handle{};
    PublicKey                    public_key{};
    std::string                  remote_address{};
};

enum class RegisterResult : uint8_t
{
    Registered,
    AlreadyTaken
};

// Registry of authenticated sessions, kept in registration order. All access
// goes through one mutex; exclusive() runs compound sequences atomically.
class SessionDirectory
{
  public:
    class Locked
    {
      public:
        RegisterResult try_register(std::string_view             identity,
                                    std::shared_ptr<ClientState> handle,
                                    PublicKey                    public_key,
                                    std::string_view             address)
        {
            if (find(identity) != nullptr)
                return RegisterResult::AlreadyTaken;

            entries_->push_back(DirectoryEntry{std::string(identity),
                                               std::move(handle),
                                               std::move(public_key),
                                               std::string(address)});
            return RegisterResult::Registered;
        }

        bool remove(std::string_view identity)
        {
            auto it = std::ranges::find_if(*entries_, [&](const auto &e)
                                           { return e.identity == identity; });
            if (it == entries_->end())
                return false;
            entries_->erase(it);
            return true;
        }

        // Removes the entry only while it still belongs to handle.
        bool remove_session(std::string_view identity, const ClientState *handle)
        {
            auto it = std::ranges::find_if(
                *entries_, [&](const auto &e)
                { return e.identity == identity && e.handle.get() == handle; });
            if (it == entries_->end())
                return false;
            entries_->erase(it);
            return true;
        }

        [[nodiscard]] const DirectoryEntry *find(std::string_view identity) const
        {
            auto it = std::ranges::find_if(*entries_, [&](const auto &e)
                                           { return e.identity == identity; });
            return it == entries_->end() ? nullptr : &*it;
        }

        [[nodiscard]] const std::vector<DirectoryEntry> &entries() const noexcept
        {
            return *entries_;
        }

        [[nodiscard]] std::vector<std::string> identities() const
        {
            std::vector<std::string> out;
            out.reserve(entries_->size());
            for (const auto &e : *entries_)
                out.push_back(e.identity);
            return out;
        }

        [[nodiscard]] std::vector<std::pair<std::string, std::string>>
        public_keys_excluding(std::string_view identity) const
        {
            std::vector<std::pair<std::string, std::string>> out;
            for (const auto &e : *entries_)
            {
                if (e.identity != identity)
                    out.emplace_back(e.identity, e.public_key.pem);
            }
            return out;
        }

        [[nodiscard]] size_t size() const noexcept { return entries_->size(); }

      private:
        friend class SessionDirectory;
        explicit Locked(std::vector<DirectoryEntry> &e) noexcept : entries_(&e)
        {
        }

        std::vector<DirectoryEntry> *entries_;
    };

    template <typename Fn> decltype(auto) exclusive(Fn &&fn)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Locked                      view(entries_);
        return std::forward<Fn>(fn)(view);
    }

    RegisterResult try_register(std::string_view             identity,
                                std::shared_ptr<ClientState> handle,
                                PublicKey                    public_key,
                                std::string_view             address)
    {
        return exclusive(
            [&](Locked &l)
            {
                return l.try_register(identity, std::move(handle),
                                      std::move(public_key), address);
            });
    }

    bool remove(std::string_view identity)
    {
        return exclusive([&](Locked &l) { return l.remove(identity); });
    }

    bool remove_session(std::string_view identity, const ClientState *handle)
    {
        return exclusive([&](Locked &l)
                         { return l.remove_session(identity, handle); });
    }

    [[nodiscard]] std::vector<DirectoryEntry> snapshot()
    {
        return exclusive([](Locked &l) { return l.entries(); });
    }

    [[nodiscard]] std::vector<std::string> identities()
    {
        return exclusive([](Locked &l) { return l.identities(); });
    }

    [[nodiscard]] std::vector<std::pair<std::string, std::string>>
    public_keys_excluding(std::string_view identity)
    {
        return exclusive([&](Locked &l)
                         { return l.public_keys_excluding(identity); });
    }

    [[nodiscard]] std::optional<DirectoryEntry> find(std::string_view identity)
    {
        return exclusive(
            [&](Locked &l) -> std::optional<DirectoryEntry>
            {
                const auto *e = l.find(identity);
                if (e == nullptr)
                    return std::nullopt;
                return *e;
            });
    }

    [[nodiscard]] size_t size()
    {
        return exclusive([](Locked &l) { return l.size(); });
    }

  private:
    std::mutex                  mtx_;
    std::vector<DirectoryEntry> entries_;
};

#endif
