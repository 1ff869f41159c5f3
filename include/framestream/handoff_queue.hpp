#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <vector>

namespace framestream {

// Bounded lock-free queue for exactly one producer thread and one consumer
// thread. Neither side ever blocks: a full queue rejects the new item and
// an empty queue drains nothing.
template<typename T>
class HandoffQueue {
public:
    explicit HandoffQueue(size_t capacity)
        : slots_(capacity + 1)
    {
        if (capacity == 0) {
            throw std::invalid_argument("handoff queue capacity must be >= 1");
        }
    }

    HandoffQueue(const HandoffQueue&) = delete;
    HandoffQueue& operator=(const HandoffQueue&) = delete;

    // Producer side. Returns false when full; `value` is left untouched
    // so the caller decides what to do with the rejected item.
    bool try_enqueue(T&& value) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = increment(tail);
        if (next == head_.load(std::memory_order_acquire)) {
            return false; // full
        }
        slots_[tail] = std::move(value);
        tail_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side. Moves every item available right now into `out`.
    size_t drain(std::vector<T>& out) {
        size_t head = head_.load(std::memory_order_relaxed);
        const size_t tail = tail_.load(std::memory_order_acquire);
        size_t count = 0;
        while (head != tail) {
            out.push_back(std::move(slots_[head]));
            slots_[head] = T();
            head = increment(head);
            ++count;
        }
        head_.store(head, std::memory_order_release);
        return count;
    }

private:
    size_t increment(size_t index) const {
        return index + 1 == slots_.size() ? 0 : index + 1;
    }

    std::vector<T> slots_;  // one spare slot distinguishes full from empty
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace framestream
