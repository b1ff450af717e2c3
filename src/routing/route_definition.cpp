#include "conduit/routing/route_definition.hpp"

#include "conduit/core/errors.hpp"

namespace conduit::routing {

bool ExceptionRule::matches(const std::exception_ptr& error) const {
    const auto* e = as_std_exception(error);
    if (e == nullptr) {
        return false;
    }
    return !predicate || predicate(*e);
}

ExceptionRule::Transform exception_message() {
    return [](const std::exception& e, const Message&) -> std::any {
        return std::string(e.what());
    };
}

const ExceptionRule* ErrorPolicy::match(
    const std::exception_ptr& error) const {
    for (const auto& rule : rules) {
        if (rule.matches(error)) {
            return &rule;
        }
    }
    return nullptr;
}

RouteDefinition::RouteDefinition(std::string from_uri,
                                 std::shared_ptr<Processor> processor)
    : from_uri_(std::move(from_uri)), processor_(std::move(processor)) {}

}  // namespace conduit::routing
