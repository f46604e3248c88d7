#pragma once
// steady_clock timing for chunk and pipeline stage durations
#include <chrono>
#include <cstdint>

namespace ledgerflow {

class Timer {
public:
    Timer() noexcept { start(); }

    void start() noexcept { start_ = std::chrono::steady_clock::now(); }

    // Milliseconds since start(); does not stop the timer
    [[nodiscard]] int64_t lap_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
};

} // namespace ledgerflow
