#include "conduit/bridge/consumer_actor.hpp"

#include "caf/error.hpp"
#include "caf/sec.hpp"
#include "conduit/caf_type_ids.hpp"
#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"

namespace conduit::bridge {

ConsumerActor::ConsumerActor(caf::actor_config& cfg, ConsumerFactory factory,
                             std::shared_ptr<Consumer> initial)
    : caf::event_based_actor(cfg),
      factory_(std::move(factory)),
      consumer_(std::move(initial)) {}

caf::behavior ConsumerActor::make_behavior() {
    return {
        [this](const Delivery& delivery) {
            dispatch(delivery.message, Sender(delivery.waiter));
        },
        [this](const Message& message) { dispatch(message, Sender()); },
    };
}

void ConsumerActor::dispatch(const Message& message, Sender sender) {
    try {
        consumer_->receive(message, sender);
    } catch (const std::exception& e) {
        CONDUIT_LOG_WARN << "Consumer actor #" << id() << " ("
                         << consumer_->endpoint_uri()
                         << ") failed: " << e.what();
        supervise(std::current_exception(), sender);
    } catch (...) {
        CONDUIT_LOG_WARN << "Consumer actor #" << id() << " ("
                         << consumer_->endpoint_uri()
                         << ") failed with a non-standard exception";
        supervise(std::current_exception(), sender);
    }
}

void ConsumerActor::supervise(const std::exception_ptr& reason,
                              Sender& sender) {
    if (consumer_->on_failure(reason) == SupervisionDirective::STOP) {
        CONDUIT_LOG_ERROR << "Stopping consumer actor #" << id()
                          << " after failure: " << describe(reason);
        quit(caf::make_error(caf::sec::runtime_error, describe(reason)));
        return;
    }

    try {
        consumer_->pre_restart(reason, sender);
    } catch (const std::exception& e) {
        CONDUIT_LOG_ERROR << "pre_restart of consumer actor #" << id()
                          << " threw: " << e.what();
    } catch (...) {
        CONDUIT_LOG_ERROR << "pre_restart of consumer actor #" << id()
                          << " threw: "
                          << describe(std::current_exception());
    }

    std::unique_ptr<Consumer> fresh;
    try {
        fresh = factory_();
    } catch (const std::exception& e) {
        CONDUIT_LOG_ERROR << "Cannot recreate consumer for actor #" << id()
                          << ", stopping: " << e.what();
        quit(caf::make_error(caf::sec::runtime_error, e.what()));
        return;
    }
    consumer_ = std::move(fresh);
    ++restarts_;

    CONDUIT_LOG_INFO << "Consumer actor #" << id() << " restarted ("
                     << restarts_ << " restart(s)) after: " << describe(reason);
    try {
        consumer_->post_restart(reason);
    } catch (...) {
        CONDUIT_LOG_ERROR << "post_restart of consumer actor #" << id()
                          << " threw: "
                          << describe(std::current_exception());
    }
}

}  // namespace conduit::bridge
