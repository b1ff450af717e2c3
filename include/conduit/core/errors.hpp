#pragma once

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>

namespace conduit {

/// @brief Root of every error raised by the bridge and its routing layer
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief A route could not be built for an endpoint (bad URI, unknown
/// scheme, endpoint already consumed)
class RouteCreationError : public Error {
public:
    RouteCreationError(const std::string& endpoint_uri,
                       const std::string& reason);

    const std::string& endpoint_uri() const { return endpoint_uri_; }

private:
    std::string endpoint_uri_;
};

/// @brief A reply, acknowledgement or lifecycle transition did not happen in
/// time
class TimeoutError : public Error {
public:
    using Error::Error;
};

/// @brief Wraps the failure of an exchange; cause() is the original error
class ExecutionError : public Error {
public:
    ExecutionError(const std::string& message, std::exception_ptr cause);

    std::exception_ptr cause() const noexcept { return cause_; }

    /// @brief Rethrows the wrapped cause
    [[noreturn]] void rethrow_cause() const;

private:
    std::exception_ptr cause_;
};

/// @brief A body or header could not be coerced to the requested type
class TypeConversionError : public Error {
public:
    using Error::Error;
};

/// @brief The endpoint named in a send has no active consumer
class NoConsumerError : public Error {
public:
    using Error::Error;
};

/// @brief The URI named in a send cannot be resolved to a component
class ResolveEndpointError : public Error {
public:
    using Error::Error;
};

/// @brief The target actor no longer exists
class DeliveryError : public Error {
public:
    using Error::Error;
};

/// @brief An actor answered with a reply its response protocol does not allow
class ProtocolError : public Error {
public:
    using Error::Error;
};

/// @brief Returns the std::exception held by `error`, or nullptr when it holds
/// something else. The pointer stays valid while `error` is alive.
const std::exception* as_std_exception(const std::exception_ptr& error) noexcept;

/// @brief Human readable text of a stored exception
std::string describe(const std::exception_ptr& error);

std::string format_duration(std::chrono::milliseconds duration);

}  // namespace conduit
