#pragma once

#include <chrono>

namespace wishbone {

/**
 * Adds the lifetime of the timer to an accumulator on destruction (RAII).
 * Used by every block to fill its result's calculation_time_ms.
 */
class ScopedTimer {
private:
    double& time_accumulator_;
    std::chrono::steady_clock::time_point start_time_;

public:
    explicit ScopedTimer(double& accumulator)
        : time_accumulator_(accumulator),
          start_time_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        time_accumulator_ += get_elapsed_ms();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double get_elapsed_ms() const {
        std::chrono::duration<double, std::milli> duration =
            std::chrono::steady_clock::now() - start_time_;
        return duration.count();
    }
};

/**
 * Stopwatch for one-off measurements (sweep progress, tests)
 */
class Timer {
private:
    std::chrono::steady_clock::time_point start_time_;

public:
    Timer() : start_time_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double elapsed_ms() const {
        return elapsed_us() / 1000.0;
    }

    double elapsed_us() const {
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time_);
        return static_cast<double>(duration.count());
    }
};

} // namespace wishbone
