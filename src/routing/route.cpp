#include "conduit/routing/route.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"

namespace conduit::routing {

Route::Route(std::string id, EndpointUri from, RouteDefinition definition,
             boost::asio::io_context& io_context)
    : id_(std::move(id)),
      from_(std::move(from)),
      definition_(std::move(definition)),
      io_context_(io_context) {}

void Route::process(const std::shared_ptr<Exchange>& exchange,
                    AsyncCallback done) {
    attempt(exchange, std::move(done), 0);
}

void Route::attempt(const std::shared_ptr<Exchange>& exchange,
                    AsyncCallback done, int redeliveries) {
    auto self = shared_from_this();
    try {
        definition_.processor()->process(
            exchange, [self, exchange, done, redeliveries]() {
                self->on_attempt_done(exchange, done, redeliveries);
            });
    } catch (const std::exception& e) {
        CONDUIT_LOG_ERROR << "Route " << id_ << " processor threw on exchange "
                          << exchange->id() << ": " << e.what();
        exchange->set_exception(std::current_exception());
        on_attempt_done(exchange, std::move(done), redeliveries);
    }
}

void Route::on_attempt_done(const std::shared_ptr<Exchange>& exchange,
                            AsyncCallback done, int redeliveries) {
    if (!exchange->failed()) {
        done();
        return;
    }

    const ExceptionRule* rule =
        definition_.error_policy().match(exchange->exception());
    if (rule == nullptr) {
        done();
        return;
    }

    const int max_redeliveries = rule->max_redeliveries.value_or(0);
    if (redeliveries < max_redeliveries) {
        const int next = redeliveries + 1;
        CONDUIT_LOG_WARN << "Route " << id_ << " redelivering exchange "
                         << exchange->id() << " (" << next << "/"
                         << max_redeliveries << ") after failure: "
                         << describe(exchange->exception());

        exchange->clear_exception();
        exchange->set_in(exchange->in()
                             .with_header(headers::REDELIVERED, true)
                             .with_header(headers::REDELIVERY_COUNTER, next));

        // Redeliveries never run on the thread that completed the attempt.
        auto self = shared_from_this();
        auto timer = std::make_shared<boost::asio::steady_timer>(
            io_context_, rule->redelivery_delay);
        timer->async_wait([self, exchange, done, next,
                           timer](const boost::system::error_code& ec) {
            if (ec) {
                exchange->set_exception(std::make_exception_ptr(
                    Error("Redelivery of exchange " + exchange->id() +
                          " cancelled: " + ec.message())));
                done();
                return;
            }
            self->attempt(exchange, done, next);
        });
        return;
    }

    if (rule->handled) {
        auto error = exchange->exception();
        exchange->clear_exception();
        if (rule->transform) {
            exchange->set_result(
                rule->transform(*as_std_exception(error), exchange->in()));
        } else {
            exchange->set_result(exchange->in().body());
        }
        CONDUIT_LOG_DEBUG << "Route " << id_ << " handled failure of exchange "
                          << exchange->id() << ": " << describe(error);
    }
    done();
}

}  // namespace conduit::routing
