#pragma once

#include <any>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conduit/bridge/response.hpp"

namespace conduit::bridge {

/// @brief Terminal state of a waiter
struct Resolution {
    enum class Kind { REPLY, ACK, FAILURE, TIMEOUT };

    Kind kind;
    std::any value;               // REPLY only
    std::exception_ptr error;     // FAILURE and TIMEOUT

    bool succeeded() const { return kind == Kind::REPLY || kind == Kind::ACK; }
};

const char* to_string(Resolution::Kind kind);

/// @brief Per-exchange slot accepting exactly one resolution.
///
/// The first of reply/ack/fail/expire wins; later calls return false and
/// change nothing. Continuations run once, on the resolving thread, or
/// immediately when registered after resolution.
class ExchangeWaiter {
public:
    using Clock = std::chrono::steady_clock;
    using Continuation = std::function<void(const Resolution&)>;

    ExchangeWaiter(std::uint64_t token, ResponseProtocol protocol,
                   std::chrono::milliseconds timeout, std::string actor_name);

    ExchangeWaiter(const ExchangeWaiter&) = delete;
    ExchangeWaiter& operator=(const ExchangeWaiter&) = delete;

    std::uint64_t token() const { return token_; }
    ResponseProtocol protocol() const { return protocol_; }
    Clock::time_point deadline() const { return deadline_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    const std::string& actor_name() const { return actor_name_; }

    /// @brief Plain data reply; a MANUAL_ACK waiter turns it into a
    /// ProtocolError failure
    bool reply(std::any value);
    bool ack();
    bool fail(std::exception_ptr cause);

    /// @brief Resolves with a TimeoutError whose text names the protocol
    bool expire();

    bool resolved() const;
    std::optional<Resolution> resolution() const;

    /// @brief Blocks until resolved
    Resolution wait() const;

    /// @brief Blocks until resolved or the deadline passes, expiring the
    /// waiter in the latter case
    Resolution wait_until_deadline();

    void on_resolved(Continuation continuation);

private:
    bool resolve(Resolution resolution);

    const std::uint64_t token_;
    const ResponseProtocol protocol_;
    const std::chrono::milliseconds timeout_;
    const Clock::time_point deadline_;
    const std::string actor_name_;

    mutable std::mutex mutex_;
    mutable std::condition_variable resolved_cv_;
    std::optional<Resolution> resolution_;
    std::vector<Continuation> continuations_;
};

}  // namespace conduit::bridge
