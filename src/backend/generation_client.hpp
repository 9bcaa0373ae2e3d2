/**
 * Crew Generation Client
 *
 * Resilient wrapper around one text-generation exchange with an
 * Ollama-compatible /api/generate endpoint. Owns the timeout, retry and
 * backoff policy; keeps no state between calls apart from a process-wide
 * attempt counter used for diagnostics.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "backend/http_transport.hpp"
#include "runtime/types.hpp"

namespace crew::backend {

struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double multiplier = 2.0;
    double jitter_ratio = 0.2;                       // 0 disables jitter
    std::chrono::milliseconds overall_deadline{180000};  // Bounds the whole retry sequence
};

struct GenerationConfig {
    std::string base_url = "http://localhost:11434";
    std::string model = "llama3.2";
    std::chrono::milliseconds request_timeout{60000};  // Per exchange
    RetryPolicy retry;

    // Sampling options forwarded to the backend
    double temperature = 0.7;
    int top_k = 40;
    double top_p = 0.9;

    // Trimmed responses shorter than this are treated as malformed
    size_t min_response_chars = 1;
};

struct GenerationRequest {
    std::string role_context;   // Sent as the system prompt
    std::string prompt;
    std::string model;          // Empty = GenerationConfig::model
    bool json_format = false;
};

struct GenerationResult {
    bool success = false;
    std::string text;
    runtime::ErrorKind error_kind = runtime::ErrorKind::NONE;
    std::string error;
    std::chrono::milliseconds latency{0};
    uint32_t attempts = 0;
};

// Per-attempt progress, reported to an optional observer.
struct InteractionEvent {
    enum class Type {
        REQUEST,
        RESPONSE,
        ERROR
    };

    Type type = Type::REQUEST;
    runtime::WorkerId worker_id = runtime::NO_WORKER;  // Filled in by the worker
    std::string model;
    uint32_t attempt = 0;
    size_t prompt_length = 0;
    size_t response_length = 0;
    std::string error;
};

const char* interaction_type_to_string(InteractionEvent::Type type);

using InteractionCallback = std::function<void(const InteractionEvent&)>;

// How a single HTTP response should be treated by the retry loop.
struct ResponseVerdict {
    enum class Kind {
        SUCCESS,
        TRANSIENT,   // Retry
        PERMANENT    // Surface immediately as BackendRejected
    };

    Kind kind = Kind::TRANSIENT;
    std::string text;     // Trimmed generated text on SUCCESS
    std::string reason;   // Cause otherwise
};

ResponseVerdict interpret_response(const HttpResponse& response, size_t min_response_chars);

class GenerationClient {
public:
    GenerationClient(GenerationConfig config, std::shared_ptr<HttpTransport> transport);

    GenerationClient(const GenerationClient&) = delete;
    GenerationClient& operator=(const GenerationClient&) = delete;

    // Runs the exchange with retries. `timeout` applies to each attempt;
    // raising `abort` stops the current transfer and any further attempts.
    GenerationResult generate(const GenerationRequest& request,
                              std::chrono::milliseconds timeout,
                              const std::atomic<bool>* abort = nullptr,
                              const InteractionCallback& on_interaction = {}) const;

    // Same, with the configured per-exchange timeout.
    GenerationResult generate(const GenerationRequest& request) const {
        return generate(request, config_.request_timeout);
    }

    const GenerationConfig& config() const { return config_; }

    // Attempts made by every client in the process.
    static uint64_t total_attempts();

    std::string build_request_body(const GenerationRequest& request) const;

private:
    GenerationConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    std::string endpoint_;

    std::chrono::milliseconds next_delay(uint32_t failed_attempt) const;
};

} // namespace crew::backend
