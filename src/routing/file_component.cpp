#include "conduit/routing/file_component.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"
#include "conduit/routing/route.hpp"

namespace fs = std::filesystem;

namespace conduit::routing {

namespace {

constexpr const char* DONE_DIR = ".done";

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error("Cannot open file: " + path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

}  // namespace

class FileComponent::Poller : public std::enable_shared_from_this<Poller> {
public:
    Poller(boost::asio::io_context& io_context, fs::path directory,
           std::chrono::milliseconds interval, std::shared_ptr<Route> route)
        : strand_(boost::asio::make_strand(io_context)),
          timer_(strand_),
          directory_(std::move(directory)),
          interval_(interval),
          route_(std::move(route)) {}

    void start() {
        boost::asio::post(strand_,
                          [self = shared_from_this()]() { self->schedule(); });
    }

    void stop() {
        boost::asio::post(strand_, [self = shared_from_this()]() {
            self->stopped_ = true;
            self->timer_.cancel();
        });
    }

private:
    void schedule() {
        if (stopped_) {
            return;
        }
        timer_.expires_after(interval_);
        timer_.async_wait(
            [self = shared_from_this()](const boost::system::error_code& ec) {
                if (ec || self->stopped_) {
                    return;
                }
                self->poll();
                self->schedule();
            });
    }

    void poll() {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(directory_, ec)) {
            if (!entry.is_regular_file() ||
                entry.path().filename().string().rfind('.', 0) == 0) {
                continue;
            }
            const std::string name = entry.path().filename().string();
            {
                std::lock_guard<std::mutex> lock(in_flight_mutex_);
                if (!in_flight_.insert(name).second) {
                    continue;
                }
            }
            dispatch(entry.path());
        }
        if (ec) {
            CONDUIT_LOG_ERROR << "Failed to poll " << directory_ << ": "
                              << ec.message();
        }
    }

    void dispatch(const fs::path& path) {
        const std::string name = path.filename().string();
        std::shared_ptr<Exchange> exchange;
        try {
            std::string content = read_file(path);
            Headers file_headers{{headers::FILE_NAME, name},
                                 {headers::FILE_LENGTH, content.size()}};
            exchange = std::make_shared<Exchange>(
                route_->from().text,
                Message(std::move(content), std::move(file_headers)),
                ExchangePattern::IN_ONLY);
        } catch (const Error& e) {
            CONDUIT_LOG_ERROR << e.what();
            release(name);
            return;
        }

        CONDUIT_LOG_DEBUG << "Polled " << path << " as exchange "
                          << exchange->id();
        route_->process(exchange, [self = shared_from_this(), path, exchange]() {
            boost::asio::post(self->strand_, [self, path, exchange]() {
                self->complete(path, *exchange);
            });
        });
    }

    void complete(const fs::path& path, const Exchange& exchange) {
        const std::string name = path.filename().string();
        if (exchange.failed()) {
            CONDUIT_LOG_WARN << "Processing " << path
                             << " failed, retrying on next poll: "
                             << describe(exchange.exception());
        } else {
            std::error_code ec;
            fs::create_directories(directory_ / DONE_DIR, ec);
            fs::rename(path, directory_ / DONE_DIR / name, ec);
            if (ec) {
                CONDUIT_LOG_ERROR << "Failed to move " << path
                                  << " to done directory: " << ec.message();
            }
        }
        release(name);
    }

    void release(const std::string& name) {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_.erase(name);
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    fs::path directory_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<Route> route_;
    bool stopped_ = false;
    std::mutex in_flight_mutex_;
    std::set<std::string> in_flight_;
};

FileComponent::FileComponent(boost::asio::io_context& io_context,
                             std::chrono::milliseconds poll_interval)
    : io_context_(io_context), poll_interval_(poll_interval) {}

FileComponent::~FileComponent() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, poller] : pollers_) {
        poller->stop();
    }
    pollers_.clear();
}

void FileComponent::start_consumer(const EndpointUri& uri,
                                   std::shared_ptr<Route> route) {
    std::chrono::milliseconds interval = poll_interval_;
    if (auto it = uri.options.find("delay"); it != uri.options.end()) {
        try {
            interval = std::chrono::milliseconds(
                boost::lexical_cast<long>(it->second));
        } catch (const boost::bad_lexical_cast&) {
            throw RouteCreationError(uri.text,
                                     "option delay is not a number: " +
                                         it->second);
        }
        if (interval.count() <= 0) {
            throw RouteCreationError(uri.text,
                                     "option delay must be positive: " +
                                         it->second);
        }
    }

    std::error_code ec;
    fs::create_directories(uri.path, ec);
    if (ec || !fs::is_directory(uri.path)) {
        throw RouteCreationError(uri.text, "cannot use directory '" +
                                               uri.path + "': " +
                                               ec.message());
    }

    auto poller = std::make_shared<Poller>(io_context_, fs::path(uri.path),
                                           interval, std::move(route));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pollers_.emplace(uri.key(), poller).second) {
            throw RouteCreationError(uri.text,
                                     "directory is already being consumed");
        }
    }
    poller->start();
    CONDUIT_LOG_INFO << "Polling directory " << uri.path << " every "
                     << format_duration(interval);
}

void FileComponent::stop_consumer(const EndpointUri& uri) {
    std::shared_ptr<Poller> poller;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pollers_.find(uri.key());
        if (it == pollers_.end()) {
            return;
        }
        poller = std::move(it->second);
        pollers_.erase(it);
    }
    poller->stop();
}

void FileComponent::send(const EndpointUri& uri,
                         const std::shared_ptr<Exchange>& exchange,
                         AsyncCallback done) {
    try {
        std::string name =
            exchange->in()
                .header_as<std::string>(headers::FILE_NAME)
                .value_or(exchange->id());
        fs::create_directories(uri.path);
        const fs::path target = fs::path(uri.path) / name;
        // Write under a hidden name first so pollers never see partial files.
        const fs::path temp = fs::path(uri.path) / ("." + name + ".tmp");
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw Error("Cannot write file: " + temp.string());
            }
            out << exchange->in().body_as<std::string>();
        }
        fs::rename(temp, target);
        exchange->set_result(target.string());
    } catch (const std::exception&) {
        exchange->set_exception(std::current_exception());
    }
    done();
}

}  // namespace conduit::routing
