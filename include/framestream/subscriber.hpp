#pragma once

#include "framestream/config.hpp"
#include "framestream/frame_processor.hpp"
#include "framestream/stop_token.hpp"

#include <zmq.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace framestream {

// Fatal transport failure; ends the subscriber loop.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Owns the SUB socket and drives a FrameProcessor from it. Runs on the
// network thread only.
class Subscriber {
public:
    Subscriber(const SubscriberConfig& config, FrameProcessor& processor);
    ~Subscriber();

    // Creates the socket, binds or connects every endpoint and subscribes.
    // Throws TransportError. run() calls it when it has not been called yet.
    void open();

    // Polls until `stop` is requested. Throws TransportError on socket
    // failures; the processor is shut down on every exit path.
    void run(const StopToken& stop);

    // Waits up to poll_timeout_ms for one message and hands it to the
    // processor. Returns false on timeout.
    bool poll_once();

    uint64_t received_count() const { return received_count_; }

    // Bound endpoints with wildcard ports resolved, valid after open().
    const std::vector<std::string>& bound_endpoints() const { return bound_endpoints_; }

private:

    SubscriberConfig config_;
    FrameProcessor& processor_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> socket_;
    std::vector<std::string> bound_endpoints_;
    uint64_t received_count_{0};
};

} // namespace framestream
