#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "caf/event_based_actor.hpp"
#include "conduit/bridge/consumer.hpp"
#include "conduit/bridge/exchange_waiter.hpp"
#include "conduit/message/message.hpp"

namespace conduit::bridge {

using ConsumerFactory = std::function<std::unique_ptr<Consumer>()>;

/// @brief A message dispatched from an endpoint, with its reply slot
struct Delivery {
    Message message;
    std::shared_ptr<ExchangeWaiter> waiter;
};

/// @brief CAF actor hosting a Consumer.
///
/// The actor is the stable identity routes are bound to. The Consumer
/// instance inside it is replaced on restart, using the factory the actor
/// was spawned with.
class ConsumerActor : public caf::event_based_actor {
public:
    ConsumerActor(caf::actor_config& cfg, ConsumerFactory factory,
                  std::shared_ptr<Consumer> initial);

    caf::behavior make_behavior() override;

    const char* name() const override { return "conduit.consumer"; }

private:
    void dispatch(const Message& message, Sender sender);
    void supervise(const std::exception_ptr& reason, Sender& sender);

    ConsumerFactory factory_;
    std::shared_ptr<Consumer> consumer_;
    std::size_t restarts_ = 0;
};

}  // namespace conduit::bridge
