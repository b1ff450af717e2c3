#include "conduit/bridge/consumer_processor.hpp"

#include "caf/actor.hpp"
#include "caf/actor_cast.hpp"
#include "caf/send.hpp"
#include "conduit/bridge/consumer_actor.hpp"
#include "conduit/caf_type_ids.hpp"
#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"

namespace conduit::bridge {

ConsumerProcessor::ConsumerProcessor(
    caf::actor_addr actor, std::string actor_name, ConsumerSettings settings,
    std::shared_ptr<ReplyCoordinator> coordinator)
    : actor_(std::move(actor)),
      actor_name_(std::move(actor_name)),
      settings_(std::move(settings)),
      coordinator_(std::move(coordinator)) {}

void ConsumerProcessor::process(
    const std::shared_ptr<routing::Exchange>& exchange,
    routing::AsyncCallback done) {
    auto target = caf::actor_cast<caf::actor>(actor_);
    if (!target) {
        exchange->set_exception(std::make_exception_ptr(DeliveryError(
            "Actor " + actor_name_ + " for endpoint " +
            settings_.endpoint_uri + " is no longer running")));
        done();
        return;
    }

    auto waiter = coordinator_->open(settings_.protocol,
                                     settings_.reply_timeout, actor_name_);
    CONDUIT_LOG_TRACE << "Exchange " << exchange->id() << " -> " << actor_name_
                      << " (token " << waiter->token() << ", "
                      << to_string(settings_.protocol) << ")";

    caf::anon_send(target, Delivery{exchange->in(), waiter});

    if (settings_.blocking) {
        apply(*exchange, waiter->wait());
        done();
        return;
    }

    waiter->on_resolved([exchange, done](const Resolution& resolution) {
        apply(*exchange, resolution);
        done();
    });
}

void ConsumerProcessor::apply(routing::Exchange& exchange,
                              const Resolution& resolution) {
    switch (resolution.kind) {
        case Resolution::Kind::REPLY:
            exchange.set_result(resolution.value);
            break;
        case Resolution::Kind::ACK:
            exchange.set_result(std::any());
            break;
        case Resolution::Kind::FAILURE:
        case Resolution::Kind::TIMEOUT:
            exchange.set_exception(resolution.error);
            break;
    }
}

}  // namespace conduit::bridge
