#include "conduit/routing/endpoint_uri.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <regex>
#include <vector>

#include "conduit/core/errors.hpp"

namespace conduit::routing {

EndpointUri EndpointUri::parse(const std::string& uri) {
    static const std::regex pattern(
        R"(^([A-Za-z][A-Za-z0-9+.\-]*):(//)?([^?\s]+)(\?(\S*))?$)");

    std::smatch match;
    if (!std::regex_match(uri, match, pattern)) {
        throw RouteCreationError(uri, "invalid endpoint uri");
    }

    EndpointUri result;
    result.text = uri;
    result.scheme = boost::algorithm::to_lower_copy(match[1].str());
    result.path = match[3].str();

    if (match[5].matched && !match[5].str().empty()) {
        std::vector<std::string> pairs;
        boost::algorithm::split(pairs, match[5].str(),
                                boost::algorithm::is_any_of("&"));
        for (const auto& pair : pairs) {
            if (pair.empty()) {
                continue;
            }
            auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw RouteCreationError(uri, "malformed option '" + pair + "'");
            }
            result.options[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }
    return result;
}

}  // namespace conduit::routing
