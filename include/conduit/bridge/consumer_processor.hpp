#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "caf/actor_addr.hpp"
#include "conduit/bridge/exchange_waiter.hpp"
#include "conduit/bridge/reply_coordinator.hpp"
#include "conduit/bridge/response.hpp"
#include "conduit/routing/exchange.hpp"

namespace conduit::bridge {

/// @brief Per-consumer settings snapshotted when its route is built
struct ConsumerSettings {
    std::string endpoint_uri;
    std::chrono::milliseconds reply_timeout{60000};
    bool blocking = false;
    ResponseProtocol protocol = ResponseProtocol::AUTO_REPLY;
};

/// @brief Route processor forwarding exchanges to a consumer actor.
///
/// Holds only the actor's address, so a route never keeps its actor alive.
/// Each exchange gets its own waiter from the coordinator; the exchange
/// completes when the waiter resolves, blocking the endpoint thread or not
/// depending on the consumer's settings.
class ConsumerProcessor : public routing::Processor {
public:
    ConsumerProcessor(caf::actor_addr actor, std::string actor_name,
                      ConsumerSettings settings,
                      std::shared_ptr<ReplyCoordinator> coordinator);

    void process(const std::shared_ptr<routing::Exchange>& exchange,
                 routing::AsyncCallback done) override;

    const ConsumerSettings& settings() const { return settings_; }

private:
    static void apply(routing::Exchange& exchange, const Resolution& resolution);

    caf::actor_addr actor_;
    std::string actor_name_;
    ConsumerSettings settings_;
    std::shared_ptr<ReplyCoordinator> coordinator_;
};

}  // namespace conduit::bridge
