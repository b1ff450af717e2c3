#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "conduit/bridge/exchange_waiter.hpp"

namespace conduit::bridge {

/// @brief Creates exchange waiters and enforces their deadlines.
///
/// Every open waiter has a timer on the coordinator's io_context that
/// expires it at its deadline unless it resolved first. Continuations of
/// waiters resolved by a timer, and of non-blocking exchanges in general,
/// run on the coordinator threads. stop() expires whatever is still open,
/// so no exchange outlives the coordinator unresolved.
class ReplyCoordinator {
public:
    explicit ReplyCoordinator(std::size_t threads = 1);
    ~ReplyCoordinator();

    ReplyCoordinator(const ReplyCoordinator&) = delete;
    ReplyCoordinator& operator=(const ReplyCoordinator&) = delete;

    /// @brief Opens a waiter and arms its deadline timer
    std::shared_ptr<ExchangeWaiter> open(ResponseProtocol protocol,
                                         std::chrono::milliseconds timeout,
                                         const std::string& actor_name);

    /// @brief Number of waiters not yet resolved
    std::size_t pending() const;

    boost::asio::io_context& context() { return io_context_; }

    void stop();
    bool stopped() const { return stopped_; }

private:
    void arm(const std::shared_ptr<ExchangeWaiter>& waiter);
    void forget(std::uint64_t token);

    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work_guard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> next_token_{0};

    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, std::weak_ptr<ExchangeWaiter>> open_;
};

}  // namespace conduit::bridge
