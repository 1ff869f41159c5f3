#pragma once

#include <atomic>
#include <memory>

namespace framestream {

// Cooperative cancellation shared by the subscriber and render loops.
// Copies observe the same flag. request_stop() is async-signal-safe as long
// as std::atomic<bool> is lock free, which holds on every supported target.
class StopToken {
public:
    StopToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void request_stop() const { flag_->store(true, std::memory_order_release); }
    bool stop_requested() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace framestream
