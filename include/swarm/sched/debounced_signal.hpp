#pragma once
/**
 * @file debounced_signal.hpp
 * @brief Single-valued boolean signal with "latest value" semantics and a quiet-window wait.
 * @details Only value changes count as events (publishing the current value is a no-op).
 *          Debounce = wait until no new event has arrived for the window.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>

namespace swarm::sched {

class DebouncedSignal final {
public:
    /// A published value and the event generation it belongs to.
    struct Sample {
        bool value{false};
        uint64_t generation{0};
    };

    explicit DebouncedSignal(bool initial = false) noexcept : value_(initial) {}

    /// Publish a value. Returns true if it differed from the current one.
    bool publish(bool value);

    /// Current sample (non-blocking).
    [[nodiscard]] Sample current() const;

    /**
     * @brief Wait for an event newer than @p seen.
     * @return The new sample, or std::nullopt if stop was requested.
     */
    std::optional<Sample> wait_next(std::stop_token st, uint64_t seen);

    /**
     * @brief Wait for @p quiet with no new event after @p seen.
     * @return true if the window elapsed quietly; false on a newer event or stop.
     */
    bool wait_quiet(std::stop_token st, uint64_t seen, std::chrono::milliseconds quiet);

private:
    mutable std::mutex mu_;
    std::condition_variable_any cv_;
    bool value_;
    uint64_t generation_{0};
};

} // namespace swarm::sched
