#pragma once

#include <chrono>

namespace sandscrape {

/// Wall-clock budget for one worker run.
class Deadline {
public:
    explicit Deadline(double max_seconds)
        : max_seconds_(max_seconds), start_time_(std::chrono::steady_clock::now()) {}

    void restart() { start_time_ = std::chrono::steady_clock::now(); }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    bool expired() const { return elapsedSeconds() >= max_seconds_; }

    /// Milliseconds left, clamped to [0, INT_MAX-ish]; suitable for poll().
    int remainingMillis() const {
        double left = max_seconds_ - elapsedSeconds();
        if (left <= 0.0) return 0;
        double ms = left * 1000.0 + 1.0;
        return ms > 2.0e9 ? 2000000000 : static_cast<int>(ms);
    }

    double maxSeconds() const { return max_seconds_; }

private:
    double max_seconds_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace sandscrape
