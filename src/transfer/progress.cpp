#include "relay/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <optional>

namespace relay::transfer {

ProgressReporter::ProgressReporter(NotificationSink sink, std::chrono::milliseconds interval)
    : sink_(std::move(sink)), interval_(interval) {
    consumer_ = std::thread(&ProgressReporter::run, this);
}

ProgressReporter::~ProgressReporter() {
    channel_.shutdown();
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

void ProgressReporter::publish(std::string text) {
    if (finished_.load()) {
        return;
    }
    channel_.push(ProgressEvent{std::move(text), false});
}

void ProgressReporter::finish(std::string final_text) {
    if (finished_.exchange(true)) {
        return;
    }
    channel_.push(ProgressEvent{std::move(final_text), true});
    channel_.shutdown();
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

void ProgressReporter::run() {
    using clock = std::chrono::steady_clock;

    auto next_allowed = clock::now();
    std::optional<std::string> pending;

    while (true) {
        std::optional<ProgressEvent> event;
        if (pending) {
            const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_allowed - clock::now());
            event = channel_.pop_for(wait.count() > 0 ? wait : std::chrono::milliseconds(0));
        } else {
            event = channel_.pop();
        }

        if (!event) {
            if (channel_.is_shutdown() && channel_.empty()) {
                break;
            }
            if (pending && clock::now() >= next_allowed) {
                deliver(*pending);
                pending.reset();
                next_allowed = clock::now() + interval_;
            }
            continue;
        }

        if (event->final) {
            deliver(event->text);
            break;
        }

        if (clock::now() >= next_allowed) {
            deliver(event->text);
            pending.reset();
            next_allowed = clock::now() + interval_;
        } else {
            pending = std::move(event->text);
        }
    }
}

void ProgressReporter::deliver(const std::string& text) {
    if (!sink_) {
        return;
    }
    try {
        sink_(text);
        ++delivered_;
    } catch (const std::exception& e) {
        ++sink_failures_;
        spdlog::warn("[ProgressSink] notification dropped: {}", e.what());
    }
}

} // namespace relay::transfer
