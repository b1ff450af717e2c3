#pragma once

#include <any>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/lexical_cast.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include "conduit/core/errors.hpp"

namespace conduit {

using Headers = std::map<std::string, std::any>;

// Header names stamped by the routing layer
namespace headers {
inline constexpr const char* REDELIVERED = "Redelivered";
inline constexpr const char* REDELIVERY_COUNTER = "RedeliveryCounter";
inline constexpr const char* FILE_NAME = "FileName";
inline constexpr const char* FILE_LENGTH = "FileLength";
}  // namespace headers

namespace detail {

std::optional<std::string> stringify(const std::any& value);
std::optional<bool> to_bool(const std::any& value);
std::optional<long double> to_number(const std::any& value);
std::string type_name_of(const std::any& value);

template <typename T>
T convert_any(const std::any& value, const std::string& what) {
    if (const auto* direct = std::any_cast<T>(&value)) {
        return *direct;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        if (auto text = stringify(value)) {
            return *text;
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (auto flag = to_bool(value)) {
            return *flag;
        }
    } else if constexpr (std::is_arithmetic_v<T>) {
        if (const auto* text = std::any_cast<std::string>(&value)) {
            // lexical_cast wraps negative text into unsigned targets
            bool negative = !text->empty() && text->front() == '-';
            if (!(std::is_unsigned_v<T> && negative)) {
                try {
                    return boost::lexical_cast<T>(*text);
                } catch (const boost::bad_lexical_cast&) {
                    // falls through to the conversion error below
                }
            }
        } else if (auto number = to_number(value)) {
            if (!(std::is_integral_v<T> && std::isnan(*number))) {
                try {
                    return boost::numeric_cast<T>(*number);
                } catch (const boost::numeric::bad_numeric_cast&) {
                    // out of range for T
                }
            }
        }
    }
    throw TypeConversionError("Cannot convert " + what + " of type " +
                              type_name_of(value) + " to the requested type");
}

}  // namespace detail

/// @brief Immutable envelope carried from an exchange to a consumer actor.
///
/// The body is an opaque value; body_as<T>() coerces it between strings,
/// booleans and arithmetic types and throws TypeConversionError otherwise.
class Message {
public:
    Message() = default;
    explicit Message(std::any body, Headers headers = {});

    const std::any& body() const { return body_; }
    const Headers& headers() const { return headers_; }

    template <typename T>
    T body_as() const {
        return detail::convert_any<T>(body_, "message body");
    }

    bool has_header(const std::string& name) const;

    /// @brief Typed header lookup; empty when the header is absent, throws
    /// TypeConversionError when present but incompatible
    template <typename T>
    std::optional<T> header_as(const std::string& name) const {
        auto it = headers_.find(name);
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return detail::convert_any<T>(it->second, "header '" + name + "'");
    }

    /// @brief True only when the Redelivered header is present and true.
    /// Absent, false or non-boolean values all read as not redelivered.
    bool redelivered() const;

    Message with_body(std::any body) const;
    Message with_header(const std::string& name, std::any value) const;
    Message with_headers(const Headers& extra) const;

private:
    std::any body_;
    Headers headers_;
};

}  // namespace conduit
