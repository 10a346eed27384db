#pragma once

#include "relay/events/event_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

namespace relay::transfer {

/// Receives human readable progress lines (chat message edit, terminal, ...)
using NotificationSink = std::function<void(const std::string&)>;

struct ProgressEvent {
    std::string text;
    bool final = false;
};

/**
 * @brief Decouples the transfer loop from a rate-limited notification sink
 *
 * publish() only enqueues. A single consumer thread delivers at most one
 * message per interval, always the newest one; intermediate messages are
 * dropped. finish() delivers its text regardless of the interval, then stops
 * the consumer. A sink that throws is logged and otherwise ignored.
 */
class ProgressReporter {
public:
    ProgressReporter(NotificationSink sink, std::chrono::milliseconds interval);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void publish(std::string text);

    /// Deliver the final message and join the consumer. Later calls are no-ops.
    void finish(std::string final_text);

    [[nodiscard]] std::size_t delivered() const noexcept { return delivered_.load(); }
    [[nodiscard]] std::size_t sink_failures() const noexcept { return sink_failures_.load(); }

private:
    void run();
    void deliver(const std::string& text);

    NotificationSink sink_;
    std::chrono::milliseconds interval_;
    events::ThreadSafeQueue<ProgressEvent> channel_;
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> sink_failures_{0};
    std::atomic<bool> finished_{false};
    std::thread consumer_;
};

} // namespace relay::transfer
