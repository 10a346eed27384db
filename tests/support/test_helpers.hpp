#pragma once

#include "relay/transfer/object_store.hpp"
#include "relay/transfer/uploader.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace relay::test_support {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<std::uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() /
                   fs::path("relay_" + prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

inline void write_file(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string pattern_bytes(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>('a' + (i * 7 + i / 26) % 26);
    }
    return data;
}

inline bool directory_empty(const fs::path& dir) {
    return !fs::exists(dir) || fs::is_empty(dir);
}

/**
 * @brief In-memory ObjectStore with scripted failures
 *
 * - max_object_bytes: larger parts are answered with an LFS style 413,
 *   manifests are exempt
 * - scripted: errors returned for the next puts, in order, before any check
 * - fail_on_call(): error for one specific put
 * - hold(): puts block until release() is called
 */
class FakeStore : public relay::transfer::ObjectStore {
public:
    relay::Result<void, relay::transfer::BackendError> put(const std::string& name,
                                                           const std::vector<char>& bytes,
                                                           const std::string& target_namespace) override {
        {
            std::unique_lock lock(mutex_);
            ++calls_;
            attempted_sizes_.push_back(bytes.size());
            entered_ = true;
            entered_cv_.notify_all();
            gate_cv_.wait(lock, [this]() { return !held_; });

            if (auto it = by_call_.find(calls_); it != by_call_.end()) {
                return relay::Err<void>(it->second);
            }
            if (!scripted_.empty()) {
                auto error = scripted_.front();
                scripted_.pop_front();
                return relay::Err<void>(error);
            }
            if (max_object_bytes_ && bytes.size() > *max_object_bytes_ && !is_manifest(name)) {
                return relay::Err<void>(relay::transfer::BackendError(
                    "413 Payload Too Large: this file exceeds the limit, use Git LFS"));
            }
            objects_[target_namespace + "/" + name] = std::string(bytes.begin(), bytes.end());
            order_.push_back(name);
        }
        return relay::Ok();
    }

    std::string locate(const std::string& name, const std::string& target_namespace) const override {
        return "mem://" + target_namespace + "/" + name;
    }

    void set_max_object_bytes(std::uint64_t limit) {
        std::lock_guard lock(mutex_);
        max_object_bytes_ = limit;
    }

    void script(relay::transfer::BackendError error) {
        std::lock_guard lock(mutex_);
        scripted_.push_back(std::move(error));
    }

    /// Fail the n-th put (1-based, counting every attempt)
    void fail_on_call(std::size_t call_number, relay::transfer::BackendError error) {
        std::lock_guard lock(mutex_);
        by_call_[call_number] = std::move(error);
    }

    void hold() {
        std::lock_guard lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            held_ = false;
        }
        gate_cv_.notify_all();
    }

    bool wait_until_entered(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return entered_cv_.wait_for(lock, timeout, [this]() { return entered_; });
    }

    std::size_t calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::vector<std::size_t> attempted_sizes() const {
        std::lock_guard lock(mutex_);
        return attempted_sizes_;
    }

    /// Names of successfully stored objects in upload order
    std::vector<std::string> stored_names() const {
        std::lock_guard lock(mutex_);
        return order_;
    }

    std::optional<std::string> object(const std::string& target_namespace, const std::string& name) const {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(target_namespace + "/" + name);
        if (it == objects_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    static bool is_manifest(const std::string& name) {
        const std::string suffix = ".manifest.json";
        return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    std::condition_variable entered_cv_;
    bool held_ = false;
    bool entered_ = false;
    std::size_t calls_ = 0;
    std::optional<std::uint64_t> max_object_bytes_;
    std::deque<relay::transfer::BackendError> scripted_;
    std::map<std::size_t, relay::transfer::BackendError> by_call_;
    std::vector<std::size_t> attempted_sizes_;
    std::map<std::string, std::string> objects_;
    std::vector<std::string> order_;
};

/// Sleeper that records requested delays instead of waiting
struct RecordingSleeper {
    std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
        std::make_shared<std::vector<std::chrono::milliseconds>>();

    relay::transfer::Sleeper sleeper() const {
        auto sink = delays;
        return [sink](std::chrono::milliseconds delay) { sink->push_back(delay); };
    }
};

} // namespace relay::test_support
