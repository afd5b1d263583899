#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

#include "event_sink.hpp"
#include "ring_buffer.hpp"

namespace beatlight {

// Non-blocking handoff from the audio thread to a transport. emit() pushes
// into a lock-free ring; a consumer thread drains it into the transport
// callback. A full ring drops the event, a failing transport is counted.
// Neither ever reaches the producer.
class QueuedEventSink : public IEventSink {
public:
    // Returns false when delivery failed
    using Transport = std::function<bool(const Event&)>;

    QueuedEventSink(size_t capacity, Transport transport,
                    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(2));
    ~QueuedEventSink() override;

    QueuedEventSink(const QueuedEventSink&) = delete;
    QueuedEventSink& operator=(const QueuedEventSink&) = delete;

    bool start();
    // Delivers whatever is still queued, then joins the consumer
    void stop();
    bool is_running() const { return running_.load(); }

    bool emit(const Event& event) override;

    // Consumer-side drain, also usable without start() for single-threaded use
    int drain();

    uint64_t accepted() const { return accepted_.load(); }
    uint64_t dropped() const { return dropped_.load(); }
    uint64_t delivered() const { return delivered_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    void consumer_loop();

    RingBuffer<Event> ring_;
    Transport transport_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> running_{false};
    std::thread consumer_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace beatlight
