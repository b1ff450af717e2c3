#pragma once

#include <exception>

namespace conduit::bridge {

/// @brief How a consumer answers the exchanges dispatched to it
enum class ResponseProtocol {
    AUTO_REPLY,  // any reply value completes the exchange with that value
    MANUAL_ACK   // only Ack or Failure complete the exchange
};

/// @brief Positive acknowledgement sentinel
struct Ack {};

/// @brief Negative acknowledgement sentinel carrying the underlying error
struct Failure {
    std::exception_ptr cause;
};

const char* to_string(ResponseProtocol protocol);

}  // namespace conduit::bridge
