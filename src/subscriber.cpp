#include "framestream/subscriber.hpp"
#include "framestream/logger.hpp"
#include "framestream/time_format.hpp"

#include <zmq_addon.hpp>
#include <cerrno>
#include <chrono>
#include <iterator>
#include <vector>

namespace framestream {

namespace {

// Closes the log window however run() exits.
class ShutdownGuard {
public:
    explicit ShutdownGuard(FrameProcessor& processor) : processor_(processor) {}
    ~ShutdownGuard() { processor_.shutdown(); }

private:
    FrameProcessor& processor_;
};

} // namespace

Subscriber::Subscriber(const SubscriberConfig& config, FrameProcessor& processor)
    : config_(config)
    , processor_(processor)
{
}

Subscriber::~Subscriber() {
    if (socket_) {
        socket_->close();
    }
}

void Subscriber::open() {
    try {
        context_ = std::make_unique<zmq::context_t>(1);
        socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);
        socket_->set(zmq::sockopt::rcvhwm, config_.receive_hwm);
        socket_->set(zmq::sockopt::linger, 0);

        for (const auto& endpoint : config_.connect) {
            socket_->connect(endpoint);
            Logger::info("Subscriber connected to: " + endpoint);
        }
        for (const auto& endpoint : config_.bind) {
            socket_->bind(endpoint);
            bound_endpoints_.push_back(socket_->get(zmq::sockopt::last_endpoint));
            Logger::info("Subscriber bound to: " + bound_endpoints_.back());
        }

        if (config_.topics.empty()) {
            socket_->set(zmq::sockopt::subscribe, "");
        }
        for (const auto& topic : config_.topics) {
            socket_->set(zmq::sockopt::subscribe, topic);
        }
    } catch (const zmq::error_t& e) {
        socket_.reset();
        context_.reset();
        bound_endpoints_.clear();
        throw TransportError(std::string("ZMQ setup error: ") + e.what());
    }
}

bool Subscriber::poll_once() {
    if (!socket_) {
        throw TransportError("subscriber socket is not open");
    }
    zmq::pollitem_t items[] = {{socket_->handle(), 0, ZMQ_POLLIN, 0}};
    try {
        zmq::poll(items, 1, std::chrono::milliseconds(config_.poll_timeout_ms));
        if (!(items[0].revents & ZMQ_POLLIN)) {
            return false;
        }

        std::vector<zmq::message_t> messages;
        if (!zmq::recv_multipart(*socket_, std::back_inserter(messages), zmq::recv_flags::dontwait)) {
            return false;
        }

        std::vector<std::string> parts;
        parts.reserve(messages.size());
        for (const auto& message : messages) {
            parts.push_back(message.to_string());
        }
        received_count_++;
        processor_.handle_message(parts, wall_time_seconds());
        return true;

    } catch (const zmq::error_t& e) {
        if (e.num() == EINTR) {
            return false;
        }
        throw TransportError(std::string("ZMQ receive error: ") + e.what());
    }
}

void Subscriber::run(const StopToken& stop) {
    ShutdownGuard guard(processor_);
    if (!socket_) {
        open();
    }

    while (!stop.stop_requested()) {
        poll_once();
        processor_.tick(wall_time_seconds());
    }

    Logger::info("Subscriber stopped after " + std::to_string(received_count_) + " messages");
}

} // namespace framestream
