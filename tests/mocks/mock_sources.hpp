#pragma once
/**
 * Scriptable source doubles for scheduler and cache tests.
 * A fetch can be made to block until released, which is how tests hold a
 * source past the tick deadline.
 */

#include "plexwatch/services/library/library_metadata_source.hpp"
#include "plexwatch/services/sources/source_adapter.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace plexwatch {
namespace testing {

class MockSourceAdapter : public services::SourceAdapter {
public:
    MockSourceAdapter(core::SourceKind kind, core::SourcePayload payload)
        : kind_(kind), payload_(std::move(payload)) {}

    ~MockSourceAdapter() override {
        release();
    }

    core::SourceKind kind() const override { return kind_; }
    bool enabled() const override { return enabled_; }

    core::SourceSnapshot fetch(std::chrono::milliseconds) override {
        ++fetch_count_;
        const size_t running = ++in_flight_;
        size_t peak = peak_in_flight_.load();
        while (running > peak && !peak_in_flight_.compare_exchange_weak(peak, running)) {
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !blocking_; });
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
        --in_flight_;

        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) {
            return core::SourceSnapshot::failure(kind_, core::Clock::now(), core::SourceError::Disabled);
        }
        if (error_) {
            return core::SourceSnapshot::failure(kind_, core::Clock::now(), *error_);
        }
        return core::SourceSnapshot::success(kind_, core::Clock::now(), payload_);
    }

    // Test inspection methods
    size_t fetch_count() const { return fetch_count_.load(); }
    // Most fetches ever running at the same time
    size_t peak_in_flight() const { return peak_in_flight_.load(); }

    // Test control
    void set_enabled(bool enabled) { enabled_ = enabled; }
    void set_delay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }

    void set_error(std::optional<core::SourceError> error) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = error;
    }

    void set_payload(core::SourcePayload payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        payload_ = std::move(payload);
    }

    // Makes every following fetch wait until release()
    void block() {
        std::lock_guard<std::mutex> lock(mutex_);
        blocking_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocking_ = false;
        }
        cv_.notify_all();
    }

private:
    core::SourceKind kind_;
    core::SourcePayload payload_;
    std::optional<core::SourceError> error_;
    std::atomic<bool> enabled_{true};
    std::atomic<size_t> fetch_count_{0};
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
    std::atomic<long long> delay_ms_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool blocking_ = false;
};

class MockLibraryMetadataSource : public services::LibraryMetadataSource {
public:
    explicit MockLibraryMetadataSource(core::LibraryCounts counts = {})
        : counts_(std::move(counts)) {}

    std::expected<core::LibraryCounts, core::SourceError>
    fetch_counts(std::chrono::milliseconds) override {
        ++fetch_count_;
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_) {
            return std::unexpected(*error_);
        }
        return counts_;
    }

    size_t fetch_count() const { return fetch_count_.load(); }

    void set_delay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }

    void set_counts(core::LibraryCounts counts) {
        std::lock_guard<std::mutex> lock(mutex_);
        counts_ = std::move(counts);
    }

    void set_error(std::optional<core::SourceError> error) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = error;
    }

private:
    std::mutex mutex_;
    core::LibraryCounts counts_;
    std::optional<core::SourceError> error_;
    std::atomic<size_t> fetch_count_{0};
    std::atomic<long long> delay_ms_{0};
};

} // namespace testing
} // namespace plexwatch
