#include "conduit/routing/producer_template.hpp"

#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"

namespace conduit::routing {

namespace {

ExecutionError exchange_failure(const Exchange& exchange) {
    return ExecutionError(
        "Exception occurred during execution on the exchange " + exchange.id(),
        exchange.exception());
}

}  // namespace

AsyncResult::AsyncResult(std::future<std::any> future)
    : future_(std::move(future)) {}

std::any AsyncResult::get(std::chrono::milliseconds timeout) {
    if (future_.wait_for(timeout) != std::future_status::ready) {
        throw TimeoutError("Asynchronous exchange did not complete within " +
                           format_duration(timeout));
    }
    try {
        return future_.get();
    } catch (const ExecutionError&) {
        throw ExecutionError("Asynchronous exchange failed",
                             std::current_exception());
    }
}

bool AsyncResult::ready() const {
    return future_.wait_for(std::chrono::seconds(0)) ==
           std::future_status::ready;
}

ProducerTemplate::ProducerTemplate(RoutingEngine& engine, Executor executor)
    : engine_(engine), executor_(std::move(executor)) {}

std::shared_ptr<Exchange> ProducerTemplate::send(
    const std::string& uri, const std::shared_ptr<Exchange>& exchange) {
    auto completed = std::make_shared<std::promise<void>>();
    auto finished = completed->get_future();
    engine_.dispatch(uri, exchange, [completed]() { completed->set_value(); });
    finished.wait();
    return exchange;
}

std::any ProducerTemplate::request_body(const std::string& uri, std::any body,
                                        Headers headers) {
    auto exchange = std::make_shared<Exchange>(
        uri, Message(std::move(body), std::move(headers)),
        ExchangePattern::IN_OUT);
    send(uri, exchange);
    if (exchange->failed()) {
        throw exchange_failure(*exchange);
    }
    return exchange->result();
}

void ProducerTemplate::send_body(const std::string& uri, std::any body,
                                 Headers headers) {
    auto exchange = std::make_shared<Exchange>(
        uri, Message(std::move(body), std::move(headers)),
        ExchangePattern::IN_ONLY);
    send(uri, exchange);
    if (exchange->failed()) {
        throw exchange_failure(*exchange);
    }
}

AsyncResult ProducerTemplate::async_request_body(const std::string& uri,
                                                 std::any body,
                                                 Headers headers) {
    return send_async(uri, Message(std::move(body), std::move(headers)),
                      ExchangePattern::IN_OUT);
}

AsyncResult ProducerTemplate::async_send_body(const std::string& uri,
                                              std::any body, Headers headers) {
    return send_async(uri, Message(std::move(body), std::move(headers)),
                      ExchangePattern::IN_ONLY);
}

AsyncResult ProducerTemplate::send_async(const std::string& uri,
                                         Message message,
                                         ExchangePattern pattern) {
    auto exchange = std::make_shared<Exchange>(uri, std::move(message), pattern);
    auto promise = std::make_shared<std::promise<std::any>>();
    AsyncResult result(promise->get_future());

    auto done = [exchange, promise, pattern]() {
        if (exchange->failed()) {
            CONDUIT_LOG_DEBUG << "Exchange " << exchange->id()
                              << " failed: " << describe(exchange->exception());
            promise->set_exception(
                std::make_exception_ptr(exchange_failure(*exchange)));
        } else if (pattern == ExchangePattern::IN_OUT) {
            promise->set_value(exchange->result());
        } else {
            promise->set_value(std::any{});
        }
    };

    if (executor_) {
        executor_([this, uri, exchange, done]() {
            engine_.dispatch(uri, exchange, done);
        });
    } else {
        engine_.dispatch(uri, exchange, std::move(done));
    }
    return result;
}

}  // namespace conduit::routing
