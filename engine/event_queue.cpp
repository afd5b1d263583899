#include "event_queue.hpp"

#include <iostream>
#include <utility>

namespace beatlight {

QueuedEventSink::QueuedEventSink(size_t capacity, Transport transport,
                                 std::chrono::milliseconds poll_interval)
    : ring_(capacity + 1), transport_(std::move(transport)), poll_interval_(poll_interval) {}

QueuedEventSink::~QueuedEventSink() {
    stop();
}

bool QueuedEventSink::start() {
    if (running_.load()) return true;
    if (!transport_) {
        std::cerr << "Event queue has no transport" << std::endl;
        return false;
    }
    running_ = true;
    consumer_ = std::thread(&QueuedEventSink::consumer_loop, this);
    return true;
}

void QueuedEventSink::stop() {
    if (!running_.load()) return;
    running_ = false;
    if (consumer_.joinable()) consumer_.join();
    drain();
}

bool QueuedEventSink::emit(const Event& event) {
    if (!ring_.push(event)) {
        dropped_++;
        return false;
    }
    accepted_++;
    return true;
}

int QueuedEventSink::drain() {
    if (!transport_) return 0;
    int n = 0;
    Event ev;
    while (ring_.pop(ev)) {
        if (transport_(ev)) {
            delivered_++;
        } else {
            // Log the first failure and every 100th after it
            uint64_t f = failed_++;
            if (f % 100 == 0) {
                std::cerr << "Event transport failed (" << (f + 1) << " total)" << std::endl;
            }
        }
        ++n;
    }
    return n;
}

void QueuedEventSink::consumer_loop() {
    while (running_.load()) {
        if (drain() == 0) {
            std::this_thread::sleep_for(poll_interval_);
        }
    }
}

} // namespace beatlight
