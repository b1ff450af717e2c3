// tests/message/test_message.cpp
#define BOOST_TEST_MODULE MessageTests
#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>

#include "conduit/core/errors.hpp"
#include "conduit/message/message.hpp"

using conduit::Message;

BOOST_AUTO_TEST_SUITE(MessageTestSuite)

BOOST_AUTO_TEST_CASE(test_body_conversions) {
    Message text(std::string("42"));
    BOOST_CHECK_EQUAL(text.body_as<std::string>(), "42");
    BOOST_CHECK_EQUAL(text.body_as<int>(), 42);
    BOOST_CHECK_CLOSE(text.body_as<double>(), 42.0, 1e-9);

    Message literal("hello");
    BOOST_CHECK_EQUAL(literal.body_as<std::string>(), "hello");

    Message number(7);
    BOOST_CHECK_EQUAL(number.body_as<std::string>(), "7");
    BOOST_CHECK_EQUAL(number.body_as<long>(), 7L);

    Message flag(std::string("TRUE"));
    BOOST_CHECK(flag.body_as<bool>());
}

BOOST_AUTO_TEST_CASE(test_body_conversion_failure) {
    Message text(std::string("not a number"));
    BOOST_CHECK_THROW(text.body_as<int>(), conduit::TypeConversionError);

    Message list(std::vector<int>{1, 2});
    BOOST_CHECK_THROW(list.body_as<std::string>(),
                      conduit::TypeConversionError);
    BOOST_CHECK_EQUAL(list.body_as<std::vector<int>>().size(), 2u);

    Message empty;
    BOOST_CHECK_THROW(empty.body_as<std::string>(),
                      conduit::TypeConversionError);
}

BOOST_AUTO_TEST_CASE(test_numeric_range_checked) {
    Message negative_text(std::string("-1"));
    BOOST_CHECK_THROW(negative_text.body_as<unsigned>(),
                      conduit::TypeConversionError);
    BOOST_CHECK_EQUAL(negative_text.body_as<int>(), -1);

    Message huge(1e30);
    BOOST_CHECK_THROW(huge.body_as<int>(), conduit::TypeConversionError);
    BOOST_CHECK_CLOSE(huge.body_as<double>(), 1e30, 1e-9);

    Message fraction(2.75);
    BOOST_CHECK_EQUAL(fraction.body_as<int>(), 2);

    Message with_counter(std::string("body"), {{"counter", -5}});
    BOOST_CHECK_THROW(with_counter.header_as<unsigned>("counter"),
                      conduit::TypeConversionError);
    BOOST_CHECK_EQUAL(*with_counter.header_as<long>("counter"), -5L);
}

BOOST_AUTO_TEST_CASE(test_header_lookup) {
    Message message(std::string("body"),
                    {{"count", 3}, {"name", std::string("conduit")}});

    BOOST_CHECK(message.has_header("count"));
    BOOST_CHECK(!message.has_header("missing"));
    BOOST_CHECK_EQUAL(*message.header_as<int>("count"), 3);
    BOOST_CHECK_EQUAL(*message.header_as<std::string>("count"), "3");
    BOOST_CHECK(!message.header_as<int>("missing").has_value());
    BOOST_CHECK_THROW(message.header_as<int>("name"),
                      conduit::TypeConversionError);
}

BOOST_AUTO_TEST_CASE(test_redelivered_header) {
    namespace headers = conduit::headers;

    BOOST_CHECK(!Message(std::string("x")).redelivered());
    BOOST_CHECK(Message(std::string("x"), {{headers::REDELIVERED, true}})
                    .redelivered());
    BOOST_CHECK(!Message(std::string("x"), {{headers::REDELIVERED, false}})
                     .redelivered());
    BOOST_CHECK(
        Message(std::string("x"), {{headers::REDELIVERED, std::string("true")}})
            .redelivered());
    BOOST_CHECK(!Message(std::string("x"),
                         {{headers::REDELIVERED, std::string("maybe")}})
                     .redelivered());
}

BOOST_AUTO_TEST_CASE(test_with_copies) {
    Message original(std::string("a"), {{"k", 1}});

    Message changed = original.with_body(std::string("b")).with_header("k", 2);
    BOOST_CHECK_EQUAL(original.body_as<std::string>(), "a");
    BOOST_CHECK_EQUAL(*original.header_as<int>("k"), 1);
    BOOST_CHECK_EQUAL(changed.body_as<std::string>(), "b");
    BOOST_CHECK_EQUAL(*changed.header_as<int>("k"), 2);

    Message merged = original.with_headers({{"extra", true}});
    BOOST_CHECK(merged.has_header("k"));
    BOOST_CHECK(merged.has_header("extra"));
}

BOOST_AUTO_TEST_SUITE_END()
