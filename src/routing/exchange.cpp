#include "conduit/routing/exchange.hpp"

#include <atomic>
#include <cstdint>

namespace conduit::routing {

namespace {

std::string next_exchange_id() {
    static std::atomic<std::uint64_t> counter{0};
    return "ID-conduit-" + std::to_string(++counter);
}

}  // namespace

Exchange::Exchange(std::string endpoint_uri, Message in,
                   ExchangePattern pattern)
    : id_(next_exchange_id()),
      endpoint_uri_(std::move(endpoint_uri)),
      pattern_(pattern),
      in_(std::move(in)) {}

}  // namespace conduit::routing
