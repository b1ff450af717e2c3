#include "conduit/core/errors.hpp"

namespace conduit {

RouteCreationError::RouteCreationError(const std::string& endpoint_uri,
                                       const std::string& reason)
    : Error("Failed to create route from [" + endpoint_uri +
            "] because of: " + reason),
      endpoint_uri_(endpoint_uri) {}

ExecutionError::ExecutionError(const std::string& message,
                               std::exception_ptr cause)
    : Error(cause ? message + ": " + describe(cause) : message),
      cause_(std::move(cause)) {}

void ExecutionError::rethrow_cause() const {
    if (!cause_) {
        throw Error("ExecutionError has no cause");
    }
    std::rethrow_exception(cause_);
}

const std::exception* as_std_exception(
    const std::exception_ptr& error) noexcept {
    if (!error) {
        return nullptr;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return &e;
    } catch (...) {
        // Non-standard exception types carry no message to inspect.
        return nullptr;
    }
}

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    if (const auto* e = as_std_exception(error)) {
        return e->what();
    }
    return "unknown exception";
}

std::string format_duration(std::chrono::milliseconds duration) {
    return std::to_string(duration.count()) + "ms";
}

}  // namespace conduit
