#ifndef SHARED_AUDIT_SINK_H
#define SHARED_AUDIT_SINK_H

#include "shared_common_util.h"
#include "shared_net_common_protocol.h"

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

// Security event sink. Implementations must be callable from any thread.
class AuditSink
{
  public:
    virtual ~AuditSink() = default;

    virtual void auth_success(std::string_view identity,
                              std::string_view address)          = 0;
    virtual void auth_failure(std::string_view identity, std::string_view address,
                              std::string_view reason)           = 0;
    virtual void key_exchange(std::string_view a, std::string_view b) = 0;
    // recipient is an identity or BROADCAST_TARGET.
    virtual void message_routed(std::string_view sender,
                                std::string_view recipient)      = 0;
    virtual void suspicious(std::string_view identity,
                            std::string_view activity)           = 0;
};

// One line per event in the AUTH_SUCCESS | User: x | IP: y form.
class LogAuditSink final : public AuditSink
{
  public:
    explicit LogAuditSink(std::ostream &os = std::cerr) : os_(os) {}

    void auth_success(std::string_view identity,
                      std::string_view address) override
    {
        emit("INFO", std::string("AUTH_SUCCESS | User: ") +
                         std::string(identity) + " | IP: " +
                         std::string(address));
    }

    void auth_failure(std::string_view identity, std::string_view address,
                      std::string_view reason) override
    {
        emit("WARNING", std::string("AUTH_FAILED | User: ") +
                            std::string(identity) + " | IP: " +
                            std::string(address) +
                            " | Reason: " + std::string(reason));
    }

    void key_exchange(std::string_view a, std::string_view b) override
    {
        emit("INFO", std::string("KEY_EXCHANGE | ") + std::string(a) +
                         " <-> " + std::string(b));
    }

    void message_routed(std::string_view sender,
                        std::string_view recipient) override
    {
        std::string to(recipient);
        if (recipient == BROADCAST_TARGET)
            to += " (broadcast)";
        emit("INFO", std::string("MESSAGE_SENT | From: ") +
                         std::string(sender) + " | To: " + to);
    }

    void suspicious(std::string_view identity,
                    std::string_view activity) override
    {
        emit("WARNING", std::string("SUSPICIOUS_ACTIVITY | User: ") +
                            std::string(identity) + " | Activity: " +
                            std::string(activity));
    }

  private:
    void emit(std::string_view level, const std::string &line)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        os_ << "[" << get_current_timestamp_ms() << "] audit " << level
            << " - " << line << "\n";
    }

    std::ostream &os_;
    std::mutex    mtx_;
};

#endif
