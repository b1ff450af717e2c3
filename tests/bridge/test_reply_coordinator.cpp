// tests/bridge/test_reply_coordinator.cpp
#define BOOST_TEST_MODULE ReplyCoordinatorTests
#include <boost/test/unit_test.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

#include "conduit/bridge/consumer.hpp"
#include "conduit/bridge/exchange_waiter.hpp"
#include "conduit/bridge/reply_coordinator.hpp"
#include "conduit/core/errors.hpp"

using namespace conduit::bridge;
using namespace std::chrono_literals;

namespace {

std::string error_text(const std::exception_ptr& error) {
    return conduit::describe(error);
}

}  // namespace

BOOST_AUTO_TEST_SUITE(ExchangeWaiterTestSuite)

BOOST_AUTO_TEST_CASE(test_first_resolution_wins) {
    ExchangeWaiter waiter(1, ResponseProtocol::AUTO_REPLY, 1000ms, "a");
    BOOST_CHECK(!waiter.resolved());

    BOOST_CHECK(waiter.reply(std::string("first")));
    BOOST_CHECK(!waiter.reply(std::string("second")));
    BOOST_CHECK(!waiter.expire());
    BOOST_CHECK(!waiter.ack());

    auto resolution = waiter.resolution();
    BOOST_REQUIRE(resolution.has_value());
    BOOST_CHECK(resolution->kind == Resolution::Kind::REPLY);
    BOOST_CHECK(resolution->succeeded());
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(resolution->value), "first");
}

BOOST_AUTO_TEST_CASE(test_manual_ack_rejects_data_reply) {
    ExchangeWaiter waiter(2, ResponseProtocol::MANUAL_ACK, 1000ms, "b");
    waiter.reply(std::string("data"));

    auto resolution = waiter.wait();
    BOOST_CHECK(resolution.kind == Resolution::Kind::FAILURE);
    BOOST_CHECK_THROW(std::rethrow_exception(resolution.error),
                      conduit::ProtocolError);
}

BOOST_AUTO_TEST_CASE(test_timeout_texts_name_protocol) {
    ExchangeWaiter auto_reply(3, ResponseProtocol::AUTO_REPLY, 10ms, "actor-x");
    ExchangeWaiter manual(4, ResponseProtocol::MANUAL_ACK, 10ms, "actor-y");

    auto_reply.expire();
    manual.expire();

    const auto reply_text = error_text(auto_reply.wait().error);
    const auto ack_text = error_text(manual.wait().error);
    BOOST_CHECK_EQUAL(reply_text,
                      "Failed to get a reply from the actor [actor-x] within "
                      "timeout [10ms]");
    BOOST_CHECK_EQUAL(ack_text,
                      "Failed to get Ack or Failure response from the actor "
                      "[actor-y] within timeout [10ms]");
    BOOST_CHECK_THROW(std::rethrow_exception(manual.wait().error),
                      conduit::TimeoutError);
}

BOOST_AUTO_TEST_CASE(test_wait_until_deadline_expires) {
    ExchangeWaiter waiter(5, ResponseProtocol::AUTO_REPLY, 20ms, "c");
    auto resolution = waiter.wait_until_deadline();
    BOOST_CHECK(resolution.kind == Resolution::Kind::TIMEOUT);
}

BOOST_AUTO_TEST_CASE(test_continuations_run_once) {
    ExchangeWaiter waiter(6, ResponseProtocol::AUTO_REPLY, 1000ms, "d");
    int calls = 0;
    waiter.on_resolved([&calls](const Resolution& r) {
        BOOST_CHECK(r.kind == Resolution::Kind::ACK);
        ++calls;
    });
    waiter.ack();
    waiter.ack();
    BOOST_CHECK_EQUAL(calls, 1);

    // Registered after resolution: runs immediately.
    waiter.on_resolved([&calls](const Resolution&) { ++calls; });
    BOOST_CHECK_EQUAL(calls, 2);
}

BOOST_AUTO_TEST_CASE(test_continuation_runs_on_resolving_thread) {
    ExchangeWaiter waiter(7, ResponseProtocol::AUTO_REPLY, 1000ms, "e");
    std::promise<std::thread::id> ran_on;
    waiter.on_resolved([&ran_on](const Resolution&) {
        ran_on.set_value(std::this_thread::get_id());
    });

    std::thread::id replier;
    std::thread worker([&waiter, &replier]() {
        replier = std::this_thread::get_id();
        waiter.reply(std::string("done"));
    });
    worker.join();

    auto future = ran_on.get_future();
    BOOST_REQUIRE(future.wait_for(1s) == std::future_status::ready);
    BOOST_CHECK(future.get() == replier);
    BOOST_CHECK(replier != std::this_thread::get_id());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SenderTestSuite)

BOOST_AUTO_TEST_CASE(test_sender_sentinels) {
    auto acked = std::make_shared<ExchangeWaiter>(
        10, ResponseProtocol::MANUAL_ACK, 1000ms, "e");
    Sender(acked).reply(Ack{});
    BOOST_CHECK(acked->wait().kind == Resolution::Kind::ACK);

    auto failed = std::make_shared<ExchangeWaiter>(
        11, ResponseProtocol::MANUAL_ACK, 1000ms, "e");
    auto cause = std::make_exception_ptr(std::runtime_error("boom"));
    Sender(failed).reply(Failure{cause});
    auto resolution = failed->wait();
    BOOST_CHECK(resolution.kind == Resolution::Kind::FAILURE);
    BOOST_CHECK(resolution.error == cause);

    Sender sender(failed);
    BOOST_CHECK(sender.attached());
    BOOST_CHECK_EQUAL(sender.token(), 11u);
}

BOOST_AUTO_TEST_CASE(test_detached_sender_drops_replies) {
    Sender detached;
    BOOST_CHECK(!detached.attached());
    BOOST_CHECK_EQUAL(detached.token(), 0u);
    BOOST_CHECK_NO_THROW(detached.reply(std::string("nowhere")));
    BOOST_CHECK_NO_THROW(detached.ack());
    BOOST_CHECK_NO_THROW(detached.fail(conduit::Error("ignored")));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ReplyCoordinatorTestSuite)

BOOST_AUTO_TEST_CASE(test_deadline_enforced) {
    ReplyCoordinator coordinator;
    auto waiter = coordinator.open(ResponseProtocol::AUTO_REPLY, 20ms, "slow");
    BOOST_CHECK_EQUAL(coordinator.pending(), 1u);

    auto resolution = waiter->wait();
    BOOST_CHECK(resolution.kind == Resolution::Kind::TIMEOUT);
    BOOST_CHECK_EQUAL(coordinator.pending(), 0u);

    // A reply arriving after the timeout changes nothing.
    BOOST_CHECK(!waiter->reply(std::string("late")));
    BOOST_CHECK(waiter->resolution()->kind == Resolution::Kind::TIMEOUT);
}

BOOST_AUTO_TEST_CASE(test_abandoned_waiter_still_times_out) {
    ReplyCoordinator coordinator;
    std::promise<Resolution::Kind> outcome;
    {
        auto waiter = coordinator.open(ResponseProtocol::AUTO_REPLY, 20ms, "gone");
        waiter->on_resolved([&outcome](const Resolution& r) {
            outcome.set_value(r.kind);
        });
    }
    auto future = outcome.get_future();
    BOOST_REQUIRE(future.wait_for(2000ms) == std::future_status::ready);
    BOOST_CHECK(future.get() == Resolution::Kind::TIMEOUT);
}

BOOST_AUTO_TEST_CASE(test_reply_before_deadline) {
    ReplyCoordinator coordinator(2);
    auto waiter =
        coordinator.open(ResponseProtocol::AUTO_REPLY, 5000ms, "fast");
    std::thread replier([waiter]() { waiter->reply(42); });
    auto resolution = waiter->wait();
    replier.join();

    BOOST_CHECK(resolution.kind == Resolution::Kind::REPLY);
    BOOST_CHECK_EQUAL(std::any_cast<int>(resolution.value), 42);
    BOOST_CHECK_EQUAL(coordinator.pending(), 0u);
}

BOOST_AUTO_TEST_CASE(test_tokens_are_unique) {
    ReplyCoordinator coordinator;
    auto first = coordinator.open(ResponseProtocol::AUTO_REPLY, 5000ms, "t");
    auto second = coordinator.open(ResponseProtocol::AUTO_REPLY, 5000ms, "t");
    BOOST_CHECK_NE(first->token(), second->token());
    first->ack();
    second->ack();
}

BOOST_AUTO_TEST_CASE(test_stop_expires_open_waiters) {
    ReplyCoordinator coordinator;
    auto waiter =
        coordinator.open(ResponseProtocol::MANUAL_ACK, 60000ms, "stuck");
    coordinator.stop();

    BOOST_CHECK(coordinator.stopped());
    BOOST_CHECK(waiter->resolution()->kind == Resolution::Kind::TIMEOUT);

    auto after = coordinator.open(ResponseProtocol::AUTO_REPLY, 60000ms, "late");
    BOOST_CHECK(after->resolved());
}

BOOST_AUTO_TEST_SUITE_END()
