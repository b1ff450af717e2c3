#pragma once

#include <any>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "conduit/message/message.hpp"
#include "conduit/routing/exchange.hpp"

namespace conduit::routing {

/// @brief Error handling for one class of exceptions raised inside a route.
///
/// Rules are plain values: the routing engine executes them, a consumer only
/// declares them.
struct ExceptionRule {
    using Predicate = std::function<bool(const std::exception&)>;
    using Transform =
        std::function<std::any(const std::exception&, const Message&)>;

    Predicate predicate;
    bool handled = false;
    Transform transform;
    std::optional<int> max_redeliveries;
    std::chrono::milliseconds redelivery_delay{0};

    ExceptionRule& set_handled(bool value) {
        handled = value;
        return *this;
    }
    ExceptionRule& set_transform(Transform fn) {
        transform = std::move(fn);
        return *this;
    }
    ExceptionRule& maximum_redeliveries(int count) {
        max_redeliveries = count;
        return *this;
    }
    ExceptionRule& set_redelivery_delay(std::chrono::milliseconds delay) {
        redelivery_delay = delay;
        return *this;
    }

    bool matches(const std::exception_ptr& error) const;
};

/// @brief Rule matching every exception derived from E
template <typename E>
ExceptionRule on_exception() {
    ExceptionRule rule;
    rule.predicate = [](const std::exception& e) {
        return dynamic_cast<const E*>(&e) != nullptr;
    };
    return rule;
}

/// @brief Transform replacing the body with the exception's message
ExceptionRule::Transform exception_message();

struct ErrorPolicy {
    std::vector<ExceptionRule> rules;

    ErrorPolicy& add(ExceptionRule rule) {
        rules.push_back(std::move(rule));
        return *this;
    }

    /// @brief First rule matching `error`, or nullptr
    const ExceptionRule* match(const std::exception_ptr& error) const;

    bool empty() const { return rules.empty(); }
};

/// @brief Everything the engine needs to build a route: where it consumes
/// from, what processes its exchanges and how failures are handled
class RouteDefinition {
public:
    RouteDefinition(std::string from_uri,
                    std::shared_ptr<Processor> processor);

    const std::string& from_uri() const { return from_uri_; }
    const std::shared_ptr<Processor>& processor() const { return processor_; }

    const ErrorPolicy& error_policy() const { return error_policy_; }
    RouteDefinition& set_error_policy(ErrorPolicy policy) {
        error_policy_ = std::move(policy);
        return *this;
    }
    RouteDefinition& on_exception(ExceptionRule rule) {
        error_policy_.add(std::move(rule));
        return *this;
    }

    const std::string& description() const { return description_; }
    RouteDefinition& set_description(std::string text) {
        description_ = std::move(text);
        return *this;
    }

private:
    std::string from_uri_;
    std::shared_ptr<Processor> processor_;
    ErrorPolicy error_policy_;
    std::string description_;
};

}  // namespace conduit::routing
