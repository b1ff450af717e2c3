#pragma once

namespace conduit {

constexpr const char* VERSION = "0.1.0";

}  // namespace conduit
