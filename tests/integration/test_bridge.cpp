// tests/integration/test_bridge.cpp
#define BOOST_TEST_MODULE BridgeIntegrationTests
#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>
#include <chrono>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "caf/actor_system.hpp"
#include "caf/actor_system_config.hpp"
#include "caf/send.hpp"
#include "conduit/bridge/bridge.hpp"
#include "conduit/caf_type_ids.hpp"
#include "conduit/core/errors.hpp"
#include "conduit/routing/route_definition.hpp"

using namespace conduit;
using namespace conduit::bridge;
using namespace std::chrono_literals;
namespace fs = boost::filesystem;

namespace {

class EchoConsumer : public Consumer {
public:
    explicit EchoConsumer(std::string uri) : uri_(std::move(uri)) {}

    std::string endpoint_uri() const override { return uri_; }

    void receive(const Message& message, Sender& sender) override {
        sender.reply("received " + message.body_as<std::string>());
    }

private:
    std::string uri_;
};

class BlockingEchoConsumer : public EchoConsumer {
public:
    using EchoConsumer::EchoConsumer;
    bool blocking() const override { return true; }
};

class SlowConsumer : public Consumer {
public:
    std::string endpoint_uri() const override { return "direct:slow"; }

    std::optional<std::chrono::milliseconds> reply_timeout() const override {
        return 10ms;
    }

    void receive(const Message& message, Sender& sender) override {
        std::this_thread::sleep_for(200ms);
        sender.reply(message.body());
    }
};

// Throws on "boom"; every fresh instance reports its restart
class RestartingConsumer : public Consumer {
public:
    explicit RestartingConsumer(std::shared_ptr<std::promise<void>> restarted)
        : restarted_(std::move(restarted)) {}

    std::string endpoint_uri() const override { return "direct:restarting"; }

    std::optional<std::chrono::milliseconds> reply_timeout() const override {
        return 200ms;
    }

    void receive(const Message& message, Sender& sender) override {
        const auto body = message.body_as<std::string>();
        if (body == "boom") {
            throw Error("boom");
        }
        sender.reply("received " + body);
    }

    void post_restart(const std::exception_ptr&) override {
        restarted_->set_value();
    }

private:
    std::shared_ptr<std::promise<void>> restarted_;
};

// Throws a non-standard exception, and its post_restart hook throws too
class UnrulyConsumer : public Consumer {
public:
    explicit UnrulyConsumer(std::shared_ptr<std::promise<void>> restarted)
        : restarted_(std::move(restarted)) {}

    std::string endpoint_uri() const override { return "direct:unruly"; }

    std::optional<std::chrono::milliseconds> reply_timeout() const override {
        return 200ms;
    }

    void receive(const Message& message, Sender& sender) override {
        const auto body = message.body_as<std::string>();
        if (body == "raw") {
            throw 42;
        }
        sender.reply("received " + body);
    }

    void post_restart(const std::exception_ptr&) override {
        restarted_->set_value();
        throw Error("post_restart failed");
    }

private:
    std::shared_ptr<std::promise<void>> restarted_;
};

class ErrorHandlingConsumer : public ErrorPassingConsumer {
public:
    std::string endpoint_uri() const override { return "direct:error-handler"; }

    void receive(const Message& message, Sender&) override {
        throw Error(message.body_as<std::string>());
    }

    routing::ErrorPolicy route_policy() const override {
        routing::ErrorPolicy policy;
        policy.add(routing::on_exception<std::exception>()
                       .set_handled(true)
                       .set_transform([](const std::exception& e,
                                         const Message&) -> std::any {
                           return std::string("error: ") + e.what();
                       }));
        return policy;
    }
};

class RedeliveryConsumer : public ErrorPassingConsumer {
public:
    std::string endpoint_uri() const override { return "direct:redelivery"; }

    void receive(const Message& message, Sender& sender) override {
        if (!message.redelivered()) {
            throw Error("rejected on first delivery");
        }
        sender.reply("accepted: " + message.body_as<std::string>());
    }

    routing::ErrorPolicy route_policy() const override {
        routing::ErrorPolicy policy;
        policy.add(routing::on_exception<Error>().maximum_redeliveries(1));
        return policy;
    }
};

class AckingConsumer : public ManualAckConsumer {
public:
    std::string endpoint_uri() const override { return "direct:ack"; }

    void receive(const Message&, Sender& sender) override {
        sender.reply(Ack{});
    }
};

class FailingAckConsumer : public ManualAckConsumer {
public:
    explicit FailingAckConsumer(std::exception_ptr cause)
        : cause_(std::move(cause)) {}

    std::string endpoint_uri() const override { return "direct:nack"; }

    void receive(const Message&, Sender& sender) override {
        sender.reply(Failure{cause_});
    }

private:
    std::exception_ptr cause_;
};

class SilentAckConsumer : public ManualAckConsumer {
public:
    std::string endpoint_uri() const override { return "direct:silent"; }

    std::optional<std::chrono::milliseconds> reply_timeout() const override {
        return 10ms;
    }

    void receive(const Message&, Sender&) override {}
};

class DataReplyingAckConsumer : public ManualAckConsumer {
public:
    std::string endpoint_uri() const override { return "direct:chatty"; }

    void receive(const Message& message, Sender& sender) override {
        sender.reply(message.body());
    }
};

// Holds replies until three messages arrived, then answers newest first
class ReorderingConsumer : public Consumer {
public:
    std::string endpoint_uri() const override { return "direct:reorder"; }

    void receive(const Message& message, Sender& sender) override {
        held_.emplace_back(sender, message.body_as<std::string>());
        if (held_.size() < 3) {
            return;
        }
        for (auto it = held_.rbegin(); it != held_.rend(); ++it) {
            it->first.reply("received " + it->second);
        }
        held_.clear();
    }

private:
    std::vector<std::pair<Sender, std::string>> held_;
};

// Gives up on the first failure instead of restarting
class StoppingConsumer : public EchoConsumer {
public:
    StoppingConsumer() : EchoConsumer("direct:fragile") {}

    void receive(const Message& message, Sender& sender) override {
        if (message.body_as<std::string>() == "crash") {
            throw Error("crash");
        }
        EchoConsumer::receive(message, sender);
    }

    SupervisionDirective on_failure(const std::exception_ptr&) override {
        return SupervisionDirective::STOP;
    }

    std::optional<std::chrono::milliseconds> reply_timeout() const override {
        return 100ms;
    }
};

struct CafTypes {
    CafTypes() { conduit::init_caf_types(); }
};

BridgeConfig test_config() {
    BridgeConfig config;
    config.reply_timeout_ms = 5000;
    config.activation_timeout_ms = 5000;
    return config;
}

struct BridgeFixture {
    CafTypes types;
    caf::actor_system_config cfg;
    caf::actor_system system{cfg};
    Bridge bridge{system, test_config()};
};

template <typename Cause>
bool caused_by(const ExecutionError& error) {
    try {
        error.rethrow_cause();
    } catch (const Cause&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
    return false;
}

}  // namespace

BOOST_FIXTURE_TEST_SUITE(ActivationTestSuite, BridgeFixture)

BOOST_AUTO_TEST_CASE(test_activation_of_valid_endpoint) {
    auto echo = bridge.spawn<EchoConsumer>("direct:echo");
    BOOST_CHECK_NO_THROW(bridge.await_activation(echo, 5000ms));
    BOOST_CHECK(bridge.tracker().state(echo.id()) == ActivationState::ACTIVE);
    BOOST_CHECK_EQUAL(bridge.route_count(), 1u);
    BOOST_CHECK_EQUAL(bridge.engine().route_count(), 1u);
}

BOOST_AUTO_TEST_CASE(test_invalid_endpoint_fails_activation) {
    auto broken = bridge.spawn<EchoConsumer>("some invalid uri");
    BOOST_CHECK_THROW(bridge.await_activation(broken, 5000ms),
                      RouteCreationError);
    BOOST_CHECK(bridge.tracker().state(broken.id()) == ActivationState::FAILED);
    BOOST_CHECK_EQUAL(bridge.route_count(), 0u);
}

BOOST_AUTO_TEST_CASE(test_duplicate_endpoint_fails_activation) {
    auto first = bridge.spawn<EchoConsumer>("direct:taken");
    bridge.await_activation(first, 5000ms);
    auto second = bridge.spawn<EchoConsumer>("direct:taken");
    BOOST_CHECK_THROW(bridge.await_activation(second, 5000ms),
                      RouteCreationError);
    BOOST_CHECK_EQUAL(bridge.route_count(), 1u);
}

BOOST_AUTO_TEST_CASE(test_stop_deactivates_route) {
    auto echo = bridge.spawn<EchoConsumer>("direct:stoppable");
    auto other = bridge.spawn<EchoConsumer>("direct:other");
    bridge.await_activation(echo, 5000ms);
    bridge.await_activation(other, 5000ms);
    BOOST_CHECK_EQUAL(bridge.route_count(), 2u);

    bridge.stop(echo);
    bridge.stop(other);
    BOOST_CHECK_NO_THROW(bridge.await_deactivation(echo, 5000ms));
    BOOST_CHECK_NO_THROW(bridge.await_deactivation(other, 5000ms));
    BOOST_CHECK_EQUAL(bridge.route_count(), 0u);
    BOOST_CHECK_EQUAL(bridge.engine().route_count(), 0u);

    try {
        bridge.send_to("direct:stoppable", std::string("anyone?"));
        BOOST_FAIL("expected ExecutionError");
    } catch (const ExecutionError& e) {
        BOOST_CHECK(caused_by<NoConsumerError>(e));
    }
}

BOOST_AUTO_TEST_CASE(test_file_consumer_unregisters_when_stopped) {
    const fs::path dir =
        fs::temp_directory_path() / fs::unique_path("conduit_inbox_%%%%%%");
    auto inbox =
        bridge.spawn<EchoConsumer>("file://" + dir.string() + "?delay=20");
    BOOST_CHECK_NO_THROW(bridge.await_activation(inbox, 5000ms));
    BOOST_CHECK_EQUAL(bridge.route_count(), 1u);
    BOOST_CHECK(fs::is_directory(dir));

    {
        std::ofstream out((dir / ".note.tmp").string());
        out << "file body";
    }
    fs::rename(dir / ".note.tmp", dir / "note.txt");
    const auto done = dir / ".done" / "note.txt";
    for (int i = 0; i < 250 && !fs::exists(done); ++i) {
        std::this_thread::sleep_for(20ms);
    }
    BOOST_CHECK(fs::exists(done));

    bridge.stop(inbox);
    BOOST_CHECK_NO_THROW(bridge.await_deactivation(inbox, 5000ms));
    BOOST_CHECK_EQUAL(bridge.route_count(), 0u);
    BOOST_CHECK_EQUAL(bridge.engine().route_count(), 0u);
    fs::remove_all(dir);
}

BOOST_AUTO_TEST_CASE(test_stop_directive_deactivates_route) {
    auto fragile = bridge.spawn<StoppingConsumer>();
    bridge.await_activation(fragile, 5000ms);
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(
                          bridge.send_to("direct:fragile", std::string("ok"))),
                      "received ok");

    BOOST_CHECK_THROW(bridge.send_to("direct:fragile", std::string("crash")),
                      ExecutionError);
    BOOST_CHECK_NO_THROW(bridge.await_deactivation(fragile, 5000ms));
    BOOST_CHECK_EQUAL(bridge.route_count(), 0u);
}

BOOST_AUTO_TEST_CASE(test_shutdown_is_idempotent) {
    auto echo = bridge.spawn<EchoConsumer>("direct:short-lived");
    bridge.await_activation(echo, 5000ms);

    bridge.shutdown();
    BOOST_CHECK_EQUAL(bridge.route_count(), 0u);
    BOOST_CHECK(bridge.coordinator().stopped());
    BOOST_CHECK_NO_THROW(bridge.shutdown());
    BOOST_CHECK_THROW(bridge.spawn<EchoConsumer>("direct:late"), Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(AutoReplyTestSuite, BridgeFixture)

BOOST_AUTO_TEST_CASE(test_in_out_reply) {
    auto echo = bridge.spawn<EchoConsumer>("direct:echo");
    bridge.await_activation(echo, 5000ms);

    auto reply = bridge.send_to("direct:echo", std::string("some message"));
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(reply),
                      "received some message");
}

BOOST_AUTO_TEST_CASE(test_blocking_consumer) {
    auto echo = bridge.spawn<BlockingEchoConsumer>("direct:blocking");
    bridge.await_activation(echo, 5000ms);

    auto reply = bridge.send_to("direct:blocking", std::string("abc"));
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(reply), "received abc");
}

BOOST_AUTO_TEST_CASE(test_slow_consumer_times_out) {
    auto slow = bridge.spawn<SlowConsumer>();
    bridge.await_activation(slow, 5000ms);

    try {
        bridge.send_to("direct:slow", std::string("hello"));
        BOOST_FAIL("expected ExecutionError");
    } catch (const ExecutionError& e) {
        BOOST_CHECK(caused_by<TimeoutError>(e));
        BOOST_CHECK(std::string(e.what()).find("Failed to get a reply") !=
                    std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(test_consumer_answers_after_restart) {
    auto restarted = std::make_shared<std::promise<void>>();
    auto restart_done = restarted->get_future();
    auto consumer = bridge.spawn<RestartingConsumer>(restarted);
    bridge.await_activation(consumer, 5000ms);

    try {
        bridge.send_to("direct:restarting", std::string("boom"));
        BOOST_FAIL("expected ExecutionError");
    } catch (const ExecutionError& e) {
        BOOST_CHECK(caused_by<TimeoutError>(e));
    }
    BOOST_REQUIRE(restart_done.wait_for(5000ms) == std::future_status::ready);

    BOOST_CHECK(bridge.tracker().state(consumer.id()) ==
                ActivationState::ACTIVE);
    BOOST_CHECK_EQUAL(bridge.route_count(), 1u);
    auto reply = bridge.send_to("direct:restarting", std::string("xyz"));
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(reply), "received xyz");
}

BOOST_AUTO_TEST_CASE(test_restart_after_failure_outside_endpoint) {
    auto restarted = std::make_shared<std::promise<void>>();
    auto restart_done = restarted->get_future();
    auto consumer = bridge.spawn<RestartingConsumer>(restarted);
    bridge.await_activation(consumer, 5000ms);

    // Sent to the actor itself, so the reply channel is detached.
    caf::anon_send(consumer, Message(std::string("boom")));
    BOOST_REQUIRE(restart_done.wait_for(5000ms) == std::future_status::ready);

    caf::anon_send(consumer, Message(std::string("nobody listens")));
    BOOST_CHECK(bridge.tracker().state(consumer.id()) ==
                ActivationState::ACTIVE);
    auto reply = bridge.send_to("direct:restarting", std::string("xyz"));
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(reply), "received xyz");
}

BOOST_AUTO_TEST_CASE(test_throwing_hooks_still_restart) {
    auto restarted = std::make_shared<std::promise<void>>();
    auto restart_done = restarted->get_future();
    auto consumer = bridge.spawn<UnrulyConsumer>(restarted);
    bridge.await_activation(consumer, 5000ms);

    BOOST_CHECK_THROW(bridge.send_to("direct:unruly", std::string("raw")),
                      ExecutionError);
    BOOST_REQUIRE(restart_done.wait_for(5000ms) == std::future_status::ready);

    BOOST_CHECK(bridge.tracker().state(consumer.id()) ==
                ActivationState::ACTIVE);
    auto reply = bridge.send_to("direct:unruly", std::string("calm"));
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(reply), "received calm");
}

BOOST_AUTO_TEST_CASE(test_replies_matched_by_exchange) {
    auto consumer = bridge.spawn<ReorderingConsumer>();
    bridge.await_activation(consumer, 5000ms);

    auto& producer = bridge.producer();
    auto a = producer.async_request_body("direct:reorder", std::string("a"));
    auto b = producer.async_request_body("direct:reorder", std::string("b"));
    auto c = producer.async_request_body("direct:reorder", std::string("c"));

    BOOST_CHECK_EQUAL(std::any_cast<std::string>(a.get(5000ms)), "received a");
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(b.get(5000ms)), "received b");
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(c.get(5000ms)), "received c");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ErrorPolicyTestSuite, BridgeFixture)

BOOST_AUTO_TEST_CASE(test_handled_failure_transformed) {
    auto consumer = bridge.spawn<ErrorHandlingConsumer>();
    bridge.await_activation(consumer, 5000ms);

    auto reply = bridge.send_to("direct:error-handler", std::string("hello"));
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(reply), "error: hello");
}

BOOST_AUTO_TEST_CASE(test_redelivered_message_accepted) {
    auto consumer = bridge.spawn<RedeliveryConsumer>();
    bridge.await_activation(consumer, 5000ms);

    auto reply = bridge.send_to("direct:redelivery", std::string("hello"));
    BOOST_CHECK_EQUAL(std::any_cast<std::string>(reply), "accepted: hello");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ManualAckTestSuite, BridgeFixture)

BOOST_AUTO_TEST_CASE(test_ack_completes_without_result) {
    auto consumer = bridge.spawn<AckingConsumer>();
    bridge.await_activation(consumer, 5000ms);

    auto reply = bridge.send_to("direct:ack", std::string("some message"));
    BOOST_CHECK(!reply.has_value());
}

BOOST_AUTO_TEST_CASE(test_failure_preserves_cause) {
    auto cause = std::make_exception_ptr(Error("test failure"));
    auto consumer = bridge.spawn<FailingAckConsumer>(cause);
    bridge.await_activation(consumer, 5000ms);

    auto pending = bridge.producer().async_request_body("direct:nack",
                                                        std::string("msg"));
    bool inspected = false;
    try {
        pending.get(5000ms);
        BOOST_FAIL("expected ExecutionError");
    } catch (const ExecutionError& outer) {
        try {
            outer.rethrow_cause();
        } catch (const ExecutionError& inner) {
            BOOST_CHECK(inner.cause() == cause);
            inspected = true;
        }
    }
    BOOST_CHECK(inspected);
}

BOOST_AUTO_TEST_CASE(test_missing_ack_times_out) {
    auto consumer = bridge.spawn<SilentAckConsumer>();
    bridge.await_activation(consumer, 5000ms);

    try {
        bridge.send_to("direct:silent", std::string("hello"));
        BOOST_FAIL("expected ExecutionError");
    } catch (const ExecutionError& e) {
        BOOST_CHECK(caused_by<TimeoutError>(e));
        BOOST_CHECK(std::string(e.what()).find("Failed to get Ack") !=
                    std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(test_data_reply_violates_protocol) {
    auto consumer = bridge.spawn<DataReplyingAckConsumer>();
    bridge.await_activation(consumer, 5000ms);

    try {
        bridge.send_to("direct:chatty", std::string("hello"));
        BOOST_FAIL("expected ExecutionError");
    } catch (const ExecutionError& e) {
        BOOST_CHECK(caused_by<ProtocolError>(e));
    }
}

BOOST_AUTO_TEST_SUITE_END()
