#include "conduit/bridge/exchange_waiter.hpp"

#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"

namespace conduit::bridge {

const char* to_string(ResponseProtocol protocol) {
    switch (protocol) {
        case ResponseProtocol::AUTO_REPLY:
            return "auto-reply";
        case ResponseProtocol::MANUAL_ACK:
            return "manual-ack";
    }
    return "unknown";
}

const char* to_string(Resolution::Kind kind) {
    switch (kind) {
        case Resolution::Kind::REPLY:
            return "reply";
        case Resolution::Kind::ACK:
            return "ack";
        case Resolution::Kind::FAILURE:
            return "failure";
        case Resolution::Kind::TIMEOUT:
            return "timeout";
    }
    return "unknown";
}

ExchangeWaiter::ExchangeWaiter(std::uint64_t token, ResponseProtocol protocol,
                               std::chrono::milliseconds timeout,
                               std::string actor_name)
    : token_(token),
      protocol_(protocol),
      timeout_(timeout),
      deadline_(Clock::now() + timeout),
      actor_name_(std::move(actor_name)) {}

bool ExchangeWaiter::reply(std::any value) {
    if (protocol_ == ResponseProtocol::MANUAL_ACK) {
        return fail(std::make_exception_ptr(ProtocolError(
            "Actor [" + actor_name_ +
            "] replied with data but its consumer expects an Ack or Failure")));
    }
    return resolve(Resolution{Resolution::Kind::REPLY, std::move(value), {}});
}

bool ExchangeWaiter::ack() {
    return resolve(Resolution{Resolution::Kind::ACK, {}, {}});
}

bool ExchangeWaiter::fail(std::exception_ptr cause) {
    return resolve(Resolution{Resolution::Kind::FAILURE, {}, std::move(cause)});
}

bool ExchangeWaiter::expire() {
    std::string text;
    if (protocol_ == ResponseProtocol::MANUAL_ACK) {
        text = "Failed to get Ack or Failure response from the actor [" +
               actor_name_ + "] within timeout [" + format_duration(timeout_) +
               "]";
    } else {
        text = "Failed to get a reply from the actor [" + actor_name_ +
               "] within timeout [" + format_duration(timeout_) + "]";
    }
    return resolve(Resolution{Resolution::Kind::TIMEOUT, {},
                              std::make_exception_ptr(TimeoutError(text))});
}

bool ExchangeWaiter::resolve(Resolution resolution) {
    std::vector<Continuation> continuations;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resolution_) {
            CONDUIT_LOG_DEBUG << "Discarding late " << to_string(resolution.kind)
                              << " for exchange #" << token_ << " of actor ["
                              << actor_name_ << "], already resolved as "
                              << to_string(resolution_->kind);
            return false;
        }
        resolution_ = std::move(resolution);
        continuations.swap(continuations_);
    }
    resolved_cv_.notify_all();

    // resolution_ never changes once set, so reading it unlocked is safe.
    for (auto& continuation : continuations) {
        continuation(*resolution_);
    }
    return true;
}

bool ExchangeWaiter::resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolution_.has_value();
}

std::optional<Resolution> ExchangeWaiter::resolution() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolution_;
}

Resolution ExchangeWaiter::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    resolved_cv_.wait(lock, [this]() { return resolution_.has_value(); });
    return *resolution_;
}

Resolution ExchangeWaiter::wait_until_deadline() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (resolved_cv_.wait_until(lock, deadline_, [this]() {
                return resolution_.has_value();
            })) {
            return *resolution_;
        }
    }
    expire();
    return wait();
}

void ExchangeWaiter::on_resolved(Continuation continuation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!resolution_) {
            continuations_.push_back(std::move(continuation));
            return;
        }
    }
    continuation(*resolution_);
}

}  // namespace conduit::bridge
