#include "caf/init_global_meta_objects.hpp"
#include "conduit/bridge/consumer_actor.hpp"
#include "conduit/caf_type_ids.hpp"

#include <mutex>

namespace conduit {

void init_caf_types() {
    static std::once_flag once;
    std::call_once(once, []() {
        caf::init_global_meta_objects<caf::id_block::conduit>();
        caf::core::init_global_meta_objects();
    });
}

}  // namespace conduit
