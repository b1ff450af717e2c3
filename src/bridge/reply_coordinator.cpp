#include "conduit/bridge/reply_coordinator.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"

namespace conduit::bridge {

ReplyCoordinator::ReplyCoordinator(std::size_t threads)
    : work_guard_(boost::asio::make_work_guard(io_context_)) {
    const std::size_t count = threads > 0 ? threads : 1;
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { io_context_.run(); });
    }
    CONDUIT_LOG_DEBUG << "ReplyCoordinator running " << count << " thread(s)";
}

ReplyCoordinator::~ReplyCoordinator() { stop(); }

std::shared_ptr<ExchangeWaiter> ReplyCoordinator::open(
    ResponseProtocol protocol, std::chrono::milliseconds timeout,
    const std::string& actor_name) {
    const std::uint64_t token = ++next_token_;
    auto waiter =
        std::make_shared<ExchangeWaiter>(token, protocol, timeout, actor_name);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopped_) {
            open_[token] = waiter;
        }
    }
    if (stopped_) {
        waiter->expire();
        return waiter;
    }
    arm(waiter);
    return waiter;
}

void ReplyCoordinator::arm(const std::shared_ptr<ExchangeWaiter>& waiter) {
    auto timer = std::make_shared<boost::asio::steady_timer>(
        io_context_, waiter->deadline());

    // The pending handler owns the waiter: an actor may drop its Sender
    // without answering, and the exchange must still time out.
    timer->async_wait([waiter](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (waiter->expire()) {
            CONDUIT_LOG_WARN << "Exchange #" << waiter->token() << " to actor ["
                             << waiter->actor_name() << "] timed out after "
                             << format_duration(waiter->timeout()) << " ("
                             << to_string(waiter->protocol()) << ")";
        }
    });

    // Timers are not thread-safe; cancellation is posted to the io_context.
    waiter->on_resolved([this, token = waiter->token(), timer](const Resolution&) {
        forget(token);
        boost::asio::post(io_context_, [timer]() { timer->cancel(); });
    });
}

void ReplyCoordinator::forget(std::uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_.erase(token);
}

std::size_t ReplyCoordinator::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_.size();
}

void ReplyCoordinator::stop() {
    std::vector<std::shared_ptr<ExchangeWaiter>> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_.exchange(true)) {
            return;
        }
        for (auto& [token, weak_waiter] : open_) {
            if (auto waiter = weak_waiter.lock()) {
                leftovers.push_back(std::move(waiter));
            }
        }
    }
    for (auto& waiter : leftovers) {
        waiter->expire();
    }
    if (!leftovers.empty()) {
        CONDUIT_LOG_WARN << "ReplyCoordinator stopped with " << leftovers.size()
                         << " pending exchange(s), expired them";
    }

    work_guard_.reset();
    io_context_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_.clear();
    }
}

}  // namespace conduit::bridge
