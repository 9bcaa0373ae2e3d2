#include "backend/generation_client.hpp"
#include "backend/backoff.hpp"
#include <algorithm>
#include <random>
#include <thread>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace crew::backend {

namespace {

std::atomic<uint64_t> g_total_attempts{0};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string excerpt(const std::string& s, size_t max_len = 200) {
    return s.size() > max_len ? s.substr(0, max_len) + "..." : s;
}

// Pull a human-readable error out of a backend error body, falling back to
// the raw body.
std::string error_from_body(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("error")) {
            const auto& err = j["error"];
            if (err.is_string()) return err.get<std::string>();
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                return err["message"].get<std::string>();
            }
            return err.dump();
        }
    } catch (const json::exception&) {
        // Not JSON; use the body as-is.
    }
    return excerpt(trim(body));
}

double unit_random() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

// Returns false if the abort flag was raised before the delay elapsed.
bool sleep_abortable(std::chrono::milliseconds delay, const std::atomic<bool>* abort) {
    auto until = std::chrono::steady_clock::now() + delay;
    const auto slice = std::chrono::milliseconds(10);
    while (true) {
        if (abort && abort->load()) return false;
        auto now = std::chrono::steady_clock::now();
        if (now >= until) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, until - now));
    }
}

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

const char* interaction_type_to_string(InteractionEvent::Type type) {
    switch (type) {
        case InteractionEvent::Type::REQUEST:  return "request";
        case InteractionEvent::Type::RESPONSE: return "response";
        case InteractionEvent::Type::ERROR:    return "error";
        default: return "unknown";
    }
}

ResponseVerdict interpret_response(const HttpResponse& response, size_t min_response_chars) {
    ResponseVerdict verdict;

    if (!response.transport_ok) {
        verdict.kind = ResponseVerdict::Kind::TRANSIENT;
        verdict.reason = response.timed_out ? "timeout: " + response.error
                                            : "transport error: " + response.error;
        return verdict;
    }

    long status = response.status;
    if (status == 408 || status == 429 || status >= 500) {
        verdict.kind = ResponseVerdict::Kind::TRANSIENT;
        verdict.reason = "HTTP " + std::to_string(status) + ": " + error_from_body(response.body);
        return verdict;
    }
    if (status < 200 || status >= 300) {
        verdict.kind = ResponseVerdict::Kind::PERMANENT;
        verdict.reason = "HTTP " + std::to_string(status) + ": " + error_from_body(response.body);
        return verdict;
    }

    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::exception& e) {
        verdict.kind = ResponseVerdict::Kind::TRANSIENT;
        verdict.reason = std::string("malformed response body: ") + e.what();
        return verdict;
    }

    if (!body.is_object()) {
        verdict.kind = ResponseVerdict::Kind::TRANSIENT;
        verdict.reason = "malformed response body: expected a JSON object";
        return verdict;
    }

    if (body.contains("error") && !body["error"].is_null()) {
        verdict.kind = ResponseVerdict::Kind::PERMANENT;
        verdict.reason = error_from_body(response.body);
        return verdict;
    }

    const char* field = body.contains("response") ? "response" : "text";
    if (!body.contains(field) || !body[field].is_string()) {
        verdict.kind = ResponseVerdict::Kind::TRANSIENT;
        verdict.reason = "malformed response body: missing text field";
        return verdict;
    }

    std::string text = trim(body[field].get<std::string>());
    if (text.size() < std::max<size_t>(min_response_chars, 1)) {
        verdict.kind = ResponseVerdict::Kind::TRANSIENT;
        verdict.reason = "response too short (" + std::to_string(text.size()) + " chars)";
        return verdict;
    }

    verdict.kind = ResponseVerdict::Kind::SUCCESS;
    verdict.text = std::move(text);
    return verdict;
}

GenerationClient::GenerationClient(GenerationConfig config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    std::string base = config_.base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    endpoint_ = base + "/api/generate";
    if (config_.retry.max_attempts == 0) {
        config_.retry.max_attempts = 1;
    }
    spdlog::debug("GenerationClient initialized (endpoint={}, model={}, max_attempts={})",
        endpoint_, config_.model, config_.retry.max_attempts);
}

uint64_t GenerationClient::total_attempts() {
    return g_total_attempts.load(std::memory_order_relaxed);
}

std::string GenerationClient::build_request_body(const GenerationRequest& request) const {
    json body;
    body["model"] = request.model.empty() ? config_.model : request.model;
    body["prompt"] = request.prompt;
    body["system"] = request.role_context;
    body["stream"] = false;
    body["options"] = {
        {"temperature", config_.temperature},
        {"top_k", config_.top_k},
        {"top_p", config_.top_p}
    };
    if (request.json_format) {
        body["format"] = "json";
    }
    return body.dump();
}

std::chrono::milliseconds GenerationClient::next_delay(uint32_t failed_attempt) const {
    const auto& retry = config_.retry;
    auto delay = backoff_delay(failed_attempt, retry.base_delay, retry.max_delay, retry.multiplier);
    if (retry.jitter_ratio > 0.0) {
        delay = apply_jitter(delay, retry.jitter_ratio, unit_random());
    }
    return delay;
}

GenerationResult GenerationClient::generate(const GenerationRequest& request,
                                            std::chrono::milliseconds timeout,
                                            const std::atomic<bool>* abort,
                                            const InteractionCallback& on_interaction) const {
    GenerationResult result;
    auto start = std::chrono::steady_clock::now();

    if (request.role_context.empty() || request.prompt.empty() || timeout.count() <= 0) {
        result.error_kind = runtime::ErrorKind::INVALID_REQUEST;
        result.error = request.prompt.empty() ? "empty prompt"
                     : request.role_context.empty() ? "empty role context"
                     : "timeout must be positive";
        spdlog::error("Rejected generation request: {}", result.error);
        return result;
    }

    const std::string model = request.model.empty() ? config_.model : request.model;
    const std::string body = build_request_body(request);
    const auto deadline = start + config_.retry.overall_deadline;

    auto emit = [&](InteractionEvent::Type type, uint32_t attempt, size_t response_length,
                    const std::string& error) {
        if (!on_interaction) return;
        InteractionEvent event;
        event.type = type;
        event.model = model;
        event.attempt = attempt;
        event.prompt_length = request.prompt.size();
        event.response_length = response_length;
        event.error = error;
        on_interaction(event);
    };

    auto cancelled = [&]() {
        result.success = false;
        result.error_kind = runtime::ErrorKind::CANCELLED;
        result.error = "Cancelled";
        result.latency = elapsed_since(start);
        spdlog::info("Generation cancelled after {} attempt(s)", result.attempts);
        return result;
    };

    std::string last_error = "no attempt made";

    for (uint32_t attempt = 1; attempt <= config_.retry.max_attempts; ++attempt) {
        if (abort && abort->load()) {
            return cancelled();
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            last_error = "retry deadline exceeded; last cause: " + last_error;
            break;
        }

        result.attempts = attempt;
        g_total_attempts.fetch_add(1, std::memory_order_relaxed);
        emit(InteractionEvent::Type::REQUEST, attempt, 0, {});

        HttpResponse response;
        try {
            response = transport_->post_json(endpoint_, body, std::min(timeout, remaining), abort);
        } catch (const std::exception& e) {
            response = HttpResponse{};
            response.error = e.what();
        }

        if (response.aborted || (!response.transport_ok && abort && abort->load())) {
            emit(InteractionEvent::Type::ERROR, attempt, 0, "Cancelled");
            return cancelled();
        }

        ResponseVerdict verdict = interpret_response(response, config_.min_response_chars);

        if (verdict.kind == ResponseVerdict::Kind::SUCCESS) {
            result.success = true;
            result.text = std::move(verdict.text);
            result.latency = elapsed_since(start);
            emit(InteractionEvent::Type::RESPONSE, attempt, result.text.size(), {});
            spdlog::debug("Generation succeeded (model={}, attempt={}, latency={}ms)",
                model, attempt, result.latency.count());
            return result;
        }

        emit(InteractionEvent::Type::ERROR, attempt, 0, verdict.reason);

        if (verdict.kind == ResponseVerdict::Kind::PERMANENT) {
            result.error_kind = runtime::ErrorKind::BACKEND_REJECTED;
            result.error = verdict.reason;
            result.latency = elapsed_since(start);
            spdlog::error("Backend rejected request (model={}): {}", model, verdict.reason);
            return result;
        }

        last_error = verdict.reason;
        spdlog::warn("Generation attempt {}/{} failed: {}",
            attempt, config_.retry.max_attempts, verdict.reason);

        if (attempt == config_.retry.max_attempts) {
            break;
        }

        auto delay = next_delay(attempt);
        if (std::chrono::steady_clock::now() + delay >= deadline) {
            last_error = "retry deadline exceeded; last cause: " + last_error;
            break;
        }
        if (!sleep_abortable(delay, abort)) {
            return cancelled();
        }
    }

    result.success = false;
    result.error_kind = runtime::ErrorKind::BACKEND_UNAVAILABLE;
    result.error = "BackendUnavailable after " + std::to_string(result.attempts) +
                   " attempt(s): " + last_error;
    result.latency = elapsed_since(start);
    spdlog::error("{}", result.error);
    return result;
}

} // namespace crew::backend
