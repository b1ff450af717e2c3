#include "conduit/bridge/consumer.hpp"

#include "conduit/log/logger.hpp"

namespace conduit::bridge {

Sender::Sender(std::shared_ptr<ExchangeWaiter> waiter)
    : waiter_(std::move(waiter)) {}

void Sender::reply(std::any value) {
    if (const auto* failure = std::any_cast<Failure>(&value)) {
        fail(failure->cause);
        return;
    }
    if (std::any_cast<Ack>(&value) != nullptr) {
        ack();
        return;
    }
    if (!waiter_) {
        discarded("reply");
        return;
    }
    waiter_->reply(std::move(value));
}

void Sender::ack() {
    if (!waiter_) {
        discarded("ack");
        return;
    }
    waiter_->ack();
}

void Sender::fail(std::exception_ptr cause) {
    if (!waiter_) {
        discarded("failure");
        return;
    }
    waiter_->fail(std::move(cause));
}

void Sender::discarded(const char* what) const {
    CONDUIT_LOG_DEBUG << "Dropping " << what
                      << " to a message that has no exchange";
}

}  // namespace conduit::bridge
