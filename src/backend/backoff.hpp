#pragma once
#include <chrono>
#include <cstdint>

namespace crew::backend {

// Delay before retrying after failed attempt number `attempt` (1-based):
// base * multiplier^(attempt-1), never above cap.
std::chrono::milliseconds backoff_delay(uint32_t attempt,
                                        std::chrono::milliseconds base,
                                        std::chrono::milliseconds cap,
                                        double multiplier = 2.0);

// Shrinks delay by up to `ratio` of itself; `unit_random` is in [0, 1).
// The result never exceeds the input, so the cap still holds.
std::chrono::milliseconds apply_jitter(std::chrono::milliseconds delay,
                                       double ratio,
                                       double unit_random);

} // namespace crew::backend
