#include "conduit/message/message.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/core/demangle.hpp>
#include <cstdint>

namespace conduit {

namespace detail {

namespace {

template <typename T>
bool try_number(const std::any& value, long double& out) {
    if (const auto* v = std::any_cast<T>(&value)) {
        out = static_cast<long double>(*v);
        return true;
    }
    return false;
}

}  // namespace

std::optional<long double> to_number(const std::any& value) {
    long double out = 0;
    if (try_number<int>(value, out) || try_number<long>(value, out) ||
        try_number<long long>(value, out) ||
        try_number<unsigned>(value, out) ||
        try_number<unsigned long>(value, out) ||
        try_number<unsigned long long>(value, out) ||
        try_number<short>(value, out) || try_number<float>(value, out) ||
        try_number<double>(value, out) || try_number<long double>(value, out)) {
        return out;
    }
    if (const auto* flag = std::any_cast<bool>(&value)) {
        return *flag ? 1.0L : 0.0L;
    }
    return std::nullopt;
}

std::optional<std::string> stringify(const std::any& value) {
    if (const auto* text = std::any_cast<std::string>(&value)) {
        return *text;
    }
    if (const auto* text = std::any_cast<const char*>(&value)) {
        return *text ? std::string(*text) : std::string();
    }
    if (const auto* flag = std::any_cast<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    if (const auto* v = std::any_cast<int>(&value)) return std::to_string(*v);
    if (const auto* v = std::any_cast<long>(&value)) return std::to_string(*v);
    if (const auto* v = std::any_cast<long long>(&value))
        return std::to_string(*v);
    if (const auto* v = std::any_cast<unsigned>(&value))
        return std::to_string(*v);
    if (const auto* v = std::any_cast<unsigned long>(&value))
        return std::to_string(*v);
    if (const auto* v = std::any_cast<unsigned long long>(&value))
        return std::to_string(*v);
    if (const auto* v = std::any_cast<double>(&value))
        return boost::lexical_cast<std::string>(*v);
    if (const auto* v = std::any_cast<float>(&value))
        return boost::lexical_cast<std::string>(*v);
    return std::nullopt;
}

std::optional<bool> to_bool(const std::any& value) {
    if (auto text = stringify(value)) {
        if (boost::algorithm::iequals(*text, "true") || *text == "1") {
            return true;
        }
        if (boost::algorithm::iequals(*text, "false") || *text == "0") {
            return false;
        }
    }
    return std::nullopt;
}

std::string type_name_of(const std::any& value) {
    if (!value.has_value()) {
        return "<empty>";
    }
    return boost::core::demangle(value.type().name());
}

}  // namespace detail

Message::Message(std::any body, Headers headers)
    : body_(std::move(body)), headers_(std::move(headers)) {}

bool Message::has_header(const std::string& name) const {
    return headers_.count(name) > 0;
}

bool Message::redelivered() const {
    auto it = headers_.find(headers::REDELIVERED);
    if (it == headers_.end()) {
        return false;
    }
    return detail::to_bool(it->second).value_or(false);
}

Message Message::with_body(std::any body) const {
    return Message(std::move(body), headers_);
}

Message Message::with_header(const std::string& name, std::any value) const {
    Headers copy = headers_;
    copy[name] = std::move(value);
    return Message(body_, std::move(copy));
}

Message Message::with_headers(const Headers& extra) const {
    Headers copy = headers_;
    for (const auto& [name, value] : extra) {
        copy[name] = value;
    }
    return Message(body_, std::move(copy));
}

}  // namespace conduit
