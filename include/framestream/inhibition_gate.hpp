#pragma once

namespace framestream {

// Enforces a minimum spacing between two persisted frames.
class InhibitionGate {
public:
    explicit InhibitionGate(double period) : period_(period) {}

    // True when a frame arriving at `now` may be persisted. Passing stamps
    // `now` as the last persisted time, whether or not the write succeeds.
    bool try_pass(double now) {
        if (has_passed_ && now < last_persisted_at_ + period_) {
            return false;
        }
        has_passed_ = true;
        last_persisted_at_ = now;
        return true;
    }

private:
    double period_;
    double last_persisted_at_{0.0};
    bool has_passed_{false};
};

} // namespace framestream
