#pragma once

#include <map>
#include <string>

namespace conduit::routing {

/// @brief Parsed endpoint address of the form scheme:[//]path[?k=v&...]
struct EndpointUri {
    std::string text;    // the URI as written
    std::string scheme;  // lower-cased
    std::string path;
    std::map<std::string, std::string> options;

    /// @brief Parses `uri`, throwing RouteCreationError when it is malformed
    static EndpointUri parse(const std::string& uri);

    /// @brief scheme:path without options, used as the endpoint key
    std::string key() const { return scheme + ":" + path; }
};

}  // namespace conduit::routing
