#include "backend/backoff.hpp"
#include <algorithm>

namespace crew::backend {

std::chrono::milliseconds backoff_delay(uint32_t attempt,
                                        std::chrono::milliseconds base,
                                        std::chrono::milliseconds cap,
                                        double multiplier) {
    if (base.count() <= 0 || cap.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    if (base >= cap) {
        return cap;
    }

    double delay = static_cast<double>(base.count());
    for (uint32_t i = 1; i < attempt; ++i) {
        delay *= multiplier;
        if (delay >= static_cast<double>(cap.count())) {
            return cap;
        }
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::chrono::milliseconds apply_jitter(std::chrono::milliseconds delay,
                                       double ratio,
                                       double unit_random) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    unit_random = std::clamp(unit_random, 0.0, 1.0);
    double scaled = static_cast<double>(delay.count()) * (1.0 - ratio * unit_random);
    return std::chrono::milliseconds(static_cast<int64_t>(scaled));
}

} // namespace crew::backend
