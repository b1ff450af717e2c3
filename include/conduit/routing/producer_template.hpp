#pragma once

#include <any>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "conduit/message/message.hpp"
#include "conduit/routing/exchange.hpp"
#include "conduit/routing/routing_engine.hpp"

namespace conduit::routing {

/// @brief Pending result of an asynchronous send
class AsyncResult {
public:
    explicit AsyncResult(std::future<std::any> future);

    /// @brief Waits up to `timeout` for the result. Throws TimeoutError when
    /// the exchange has not completed, or ExecutionError whose cause is the
    /// exchange's own ExecutionError when it failed.
    std::any get(std::chrono::milliseconds timeout);

    bool ready() const;

private:
    std::future<std::any> future_;
};

/// @brief Caller-side API for sending bodies to endpoints
class ProducerTemplate {
public:
    /// @brief Runs a task somewhere; asynchronous sends dispatch through it
    using Executor = std::function<void(std::function<void()>)>;

    /// @brief Without an executor asynchronous sends dispatch on the calling
    /// thread, which blocks it for synchronous endpoints
    explicit ProducerTemplate(RoutingEngine& engine, Executor executor = {});

    /// @brief In-out send; returns the result body or throws ExecutionError
    std::any request_body(const std::string& uri, std::any body,
                          Headers headers = {});

    /// @brief In-only send; throws ExecutionError on failure
    void send_body(const std::string& uri, std::any body, Headers headers = {});

    AsyncResult async_request_body(const std::string& uri, std::any body,
                                   Headers headers = {});

    /// @brief In-only asynchronous send, resolving to an empty value
    AsyncResult async_send_body(const std::string& uri, std::any body,
                                Headers headers = {});

    /// @brief Sends a prepared exchange and waits for it to complete
    std::shared_ptr<Exchange> send(const std::string& uri,
                                   const std::shared_ptr<Exchange>& exchange);

private:
    AsyncResult send_async(const std::string& uri, Message message,
                           ExchangePattern pattern);

    RoutingEngine& engine_;
    Executor executor_;
};

}  // namespace conduit::routing
