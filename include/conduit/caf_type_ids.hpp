#pragma once

#include "caf/allowed_unsafe_message_type.hpp"
#include "caf/type_id.hpp"

namespace conduit {
class Message;
namespace bridge {
struct Delivery;
}  // namespace bridge
}  // namespace conduit

// Messages exchanged with consumer actors. They carry type-erased bodies
// and live pointers, so they never leave the process.
CAF_BEGIN_TYPE_ID_BLOCK(conduit, caf::first_custom_type_id)

  CAF_ADD_TYPE_ID(conduit, (conduit::Message))
  CAF_ADD_TYPE_ID(conduit, (conduit::bridge::Delivery))

CAF_END_TYPE_ID_BLOCK(conduit)

CAF_ALLOW_UNSAFE_MESSAGE_TYPE(conduit::Message)
CAF_ALLOW_UNSAFE_MESSAGE_TYPE(conduit::bridge::Delivery)

namespace conduit {

/// @brief Registers conduit's message types with CAF. Must run once before
/// the first caf::actor_system is created.
void init_caf_types();

}  // namespace conduit
