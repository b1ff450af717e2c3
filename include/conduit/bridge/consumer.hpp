#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "conduit/bridge/exchange_waiter.hpp"
#include "conduit/bridge/response.hpp"
#include "conduit/message/message.hpp"
#include "conduit/routing/route_definition.hpp"

namespace conduit::bridge {

/// @brief Reply channel of one delivered message.
///
/// Copies share the same waiter, so a consumer may keep a Sender and answer
/// later. A Sender for a message that did not come through an endpoint is
/// detached: its replies go nowhere.
class Sender {
public:
    Sender() = default;
    explicit Sender(std::shared_ptr<ExchangeWaiter> waiter);

    /// @brief Answers with `value`; Ack and Failure values are recognised as
    /// sentinels
    void reply(std::any value);
    void ack();
    void fail(std::exception_ptr cause);

    template <typename E>
    void fail(E error) {
        fail(std::make_exception_ptr(std::move(error)));
    }

    bool attached() const { return static_cast<bool>(waiter_); }

    /// @brief Correlation token of the exchange, 0 when detached
    std::uint64_t token() const { return waiter_ ? waiter_->token() : 0; }

private:
    void discarded(const char* what) const;

    std::shared_ptr<ExchangeWaiter> waiter_;
};

enum class SupervisionDirective {
    RESTART,  // replace the consumer instance, keep the actor and its route
    STOP      // terminate the actor, which deactivates its route
};

/// @brief Message handler exposed as an endpoint.
///
/// An instance lives inside a ConsumerActor. When receive() throws, the
/// actor asks on_failure() what to do; on RESTART the instance is replaced
/// by a fresh one while the actor, its address and its route stay.
class Consumer {
public:
    virtual ~Consumer() = default;

    virtual std::string endpoint_uri() const = 0;

    virtual void receive(const Message& message, Sender& sender) = 0;

    /// @brief Reply timeout; empty means the bridge default
    virtual std::optional<std::chrono::milliseconds> reply_timeout() const {
        return std::nullopt;
    }

    /// @brief When true the endpoint thread blocks until the actor answers
    virtual bool blocking() const { return false; }

    virtual ResponseProtocol protocol() const {
        return ResponseProtocol::AUTO_REPLY;
    }

    /// @brief Error handling for this consumer's route; read once, when the
    /// route is built
    virtual routing::ErrorPolicy route_policy() const { return {}; }

    virtual SupervisionDirective on_failure(const std::exception_ptr&) {
        return SupervisionDirective::RESTART;
    }

    /// @brief Called on the failed instance before it is replaced
    virtual void pre_restart(const std::exception_ptr& /*reason*/,
                             Sender& /*sender*/) {}

    /// @brief Called on the fresh instance after a restart
    virtual void post_restart(const std::exception_ptr& /*reason*/) {}
};

/// @brief Consumer that completes exchanges only with Ack or Failure
class ManualAckConsumer : public Consumer {
public:
    ResponseProtocol protocol() const override {
        return ResponseProtocol::MANUAL_ACK;
    }
};

/// @brief Consumer whose failures are returned to the sender, so the
/// route's error policy can handle or redeliver them
class ErrorPassingConsumer : public Consumer {
public:
    void pre_restart(const std::exception_ptr& reason,
                     Sender& sender) override {
        sender.fail(reason);
    }
};

}  // namespace conduit::bridge
