// src/app/timing_controller.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

namespace app {

/**
 * TimingController - Paces the polling loop against the wall clock
 *
 * Deadlines are absolute (epoch + n * period) so lateness in one cycle does
 * not accumulate. The last few hundred microseconds before a deadline are
 * spent yielding instead of sleeping.
 *
 * Usage:
 *   TimingController timer(0.1);
 *   timer.reset();
 *   while (running) {
 *       timer.mark_loop_start();
 *       ... one cycle ...
 *       timer.update_loop_stats();
 *       timer.wait_for_next_step();
 *   }
 */
class TimingController {
public:
    struct Stats {
        size_t total_steps = 0;
        size_t deadline_misses = 0;
        double max_lateness_us = 0.0;
        double avg_lateness_us = 0.0;
        double max_loop_time_us = 0.0;
    };

    explicit TimingController(double period_s)
        : period_ns_(static_cast<int64_t>(period_s * 1e9)),
          spin_threshold_ns_(200000)
    {
        reset();
    }

    void reset() {
        step_count_ = 0;
        total_lateness_us_ = 0.0;
        stats_ = Stats{};
        epoch_ = std::chrono::steady_clock::now();
        last_loop_start_ = epoch_;
    }

    /**
     * Block until the next cycle deadline
     * @return false if the deadline had already passed
     */
    bool wait_for_next_step() {
        using namespace std::chrono;

        step_count_++;
        const auto deadline = epoch_ + nanoseconds(static_cast<int64_t>(step_count_) * period_ns_);
        const int64_t remaining_ns = duration_cast<nanoseconds>(deadline - steady_clock::now()).count();

        bool on_time = true;
        if (remaining_ns < 0) {
            on_time = false;
            stats_.deadline_misses++;

            const double lateness_us = -remaining_ns / 1000.0;
            stats_.max_lateness_us = std::max(stats_.max_lateness_us, lateness_us);
            total_lateness_us_ += lateness_us;
            stats_.avg_lateness_us = total_lateness_us_ / stats_.deadline_misses;
        }

        if (remaining_ns > spin_threshold_ns_) {
            std::this_thread::sleep_until(deadline - nanoseconds(spin_threshold_ns_));
        }
        while (steady_clock::now() < deadline) {
            std::this_thread::yield();
        }

        return on_time;
    }

    // Loop time in seconds: completed steps * period
    double get_loop_time() const {
        return step_count_ * (period_ns_ / 1e9);
    }

    void mark_loop_start() {
        last_loop_start_ = std::chrono::steady_clock::now();
    }

    // Work time of the current cycle, excluding the wait
    double get_last_loop_time_us() const {
        return std::chrono::duration<double, std::micro>(
            std::chrono::steady_clock::now() - last_loop_start_).count();
    }

    void update_loop_stats() {
        stats_.max_loop_time_us = std::max(stats_.max_loop_time_us, get_last_loop_time_us());
        stats_.total_steps++;
    }

    const Stats& get_stats() const { return stats_; }

private:
    int64_t period_ns_;
    int64_t spin_threshold_ns_;

    size_t step_count_ = 0;
    double total_lateness_us_ = 0.0;

    std::chrono::steady_clock::time_point epoch_;
    std::chrono::steady_clock::time_point last_loop_start_;

    Stats stats_;
};

} // namespace app
