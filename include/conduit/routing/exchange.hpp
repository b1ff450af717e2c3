#pragma once

#include <any>
#include <exception>
#include <functional>
#include <memory>
#include <string>

#include "conduit/message/message.hpp"

namespace conduit::routing {

enum class ExchangePattern { IN_ONLY, IN_OUT };

/// @brief One inbound request/response unit handled by the routing engine.
///
/// An exchange is mutated by whoever currently processes it; completion is
/// signalled through the AsyncCallback handed to the processor, which
/// publishes the final state to the caller.
class Exchange {
public:
    Exchange(std::string endpoint_uri, Message in, ExchangePattern pattern);

    const std::string& id() const { return id_; }
    const std::string& endpoint_uri() const { return endpoint_uri_; }
    ExchangePattern pattern() const { return pattern_; }

    const Message& in() const { return in_; }
    void set_in(Message in) { in_ = std::move(in); }

    const std::any& result() const { return result_; }
    void set_result(std::any result) { result_ = std::move(result); }

    bool failed() const { return static_cast<bool>(exception_); }
    std::exception_ptr exception() const { return exception_; }
    void set_exception(std::exception_ptr error) {
        exception_ = std::move(error);
    }
    void clear_exception() { exception_ = nullptr; }

private:
    std::string id_;
    std::string endpoint_uri_;
    ExchangePattern pattern_;
    Message in_;
    std::any result_;
    std::exception_ptr exception_;
};

/// @brief Invoked exactly once when processing of an exchange has finished
using AsyncCallback = std::function<void()>;

/// @brief Anything that can process an exchange, synchronously or not
class Processor {
public:
    virtual ~Processor() = default;

    /// @brief Processes `exchange` and calls `done` once, possibly from
    /// another thread, after the exchange holds its result or failure
    virtual void process(const std::shared_ptr<Exchange>& exchange,
                         AsyncCallback done) = 0;
};

}  // namespace conduit::routing
