#include "orchestrator/config.hpp"
#include "core/config.hpp"
#include <limits>
#include <spdlog/spdlog.h>

namespace crew::orchestrator {

namespace {

std::chrono::milliseconds env_ms(const char* key, std::chrono::milliseconds fallback) {
    auto value = core::config::get_env_int(key, fallback.count());
    if (value < 0) {
        spdlog::warn("Ignoring negative {}={}", key, value);
        return fallback;
    }
    return std::chrono::milliseconds(value);
}

// Timeouts and deadlines of zero would fail every exchange.
std::chrono::milliseconds env_positive_ms(const char* key, std::chrono::milliseconds fallback) {
    auto value = core::config::get_env_int(key, fallback.count());
    if (value <= 0) {
        spdlog::warn("Ignoring {}={} (must be positive), using {}ms", key, value, fallback.count());
        return fallback;
    }
    return std::chrono::milliseconds(value);
}

} // namespace

OrchestratorConfig OrchestratorConfig::from_env() {
    core::config::load_dotenv();

    OrchestratorConfig config;
    auto& gen = config.generation;
    gen.base_url = core::config::get_env_or("CREW_BACKEND_URL", gen.base_url);
    gen.model = core::config::get_env_or("CREW_MODEL", gen.model);
    gen.request_timeout = env_positive_ms("CREW_REQUEST_TIMEOUT_MS", gen.request_timeout);

    auto attempts = core::config::get_env_int("CREW_MAX_ATTEMPTS", gen.retry.max_attempts);
    if (attempts < 1) {
        gen.retry.max_attempts = 1;
    } else if (attempts > std::numeric_limits<uint32_t>::max()) {
        spdlog::warn("CREW_MAX_ATTEMPTS={} is out of range, clamping", attempts);
        gen.retry.max_attempts = std::numeric_limits<uint32_t>::max();
    } else {
        gen.retry.max_attempts = static_cast<uint32_t>(attempts);
    }
    gen.retry.base_delay = env_ms("CREW_BACKOFF_BASE_MS", gen.retry.base_delay);
    gen.retry.max_delay = env_ms("CREW_BACKOFF_MAX_MS", gen.retry.max_delay);
    gen.retry.overall_deadline = env_positive_ms("CREW_RETRY_DEADLINE_MS", gen.retry.overall_deadline);

    config.cancel_grace = env_ms("CREW_CANCEL_GRACE_MS", config.cancel_grace);

    spdlog::debug("Config: backend={} model={} timeout={}ms attempts={} backoff={}..{}ms",
        gen.base_url, gen.model, gen.request_timeout.count(), gen.retry.max_attempts,
        gen.retry.base_delay.count(), gen.retry.max_delay.count());
    return config;
}

} // namespace crew::orchestrator
