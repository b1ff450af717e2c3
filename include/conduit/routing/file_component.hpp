#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "conduit/routing/component.hpp"

namespace conduit::routing {

/// @brief Directory endpoints ("file:dir" or "file://dir").
///
/// A consumer polls its directory; every regular file becomes an in-only
/// exchange whose body is the file content. Processed files are moved into
/// `.done/`, failed ones are retried on the next poll. Producing writes the
/// body to a file named after the FileName header (or the exchange id).
/// The `delay` option overrides the poll interval in milliseconds.
class FileComponent : public Component {
public:
    FileComponent(boost::asio::io_context& io_context,
                  std::chrono::milliseconds poll_interval);
    ~FileComponent() override;

    std::string scheme() const override { return "file"; }

    void start_consumer(const EndpointUri& uri,
                        std::shared_ptr<Route> route) override;
    void stop_consumer(const EndpointUri& uri) override;
    void send(const EndpointUri& uri, const std::shared_ptr<Exchange>& exchange,
              AsyncCallback done) override;

private:
    class Poller;

    boost::asio::io_context& io_context_;
    std::chrono::milliseconds poll_interval_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Poller>> pollers_;
};

}  // namespace conduit::routing
