#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "backend/generation_client.hpp"
#include "mocks/fake_transport.hpp"

using namespace crew::backend;
using crew::runtime::ErrorKind;
using crew::test::FakeTransport;
using crew::test::fast_config;
using crew::test::ok_response;
using crew::test::refused_response;
using crew::test::status_response;

namespace {

GenerationRequest make_request(const std::string& prompt = "Evaluate a 2018 Toyota Camry") {
    GenerationRequest request;
    request.role_context = "You are Sarah Chen, a Appraisal Manager.";
    request.prompt = prompt;
    return request;
}

} // namespace

// ---------------------------------------------------------------------------
// Response interpretation
// ---------------------------------------------------------------------------

TEST(InterpretResponseTest, AcceptsOllamaResponseField) {
    auto verdict = interpret_response(ok_response("  A fair price is $14,500.  "), 1);
    EXPECT_EQ(verdict.kind, ResponseVerdict::Kind::SUCCESS);
    EXPECT_EQ(verdict.text, "A fair price is $14,500.");
}

TEST(InterpretResponseTest, AcceptsTextField) {
    auto verdict = interpret_response(status_response(200, R"({"text":"hello"})"), 1);
    EXPECT_EQ(verdict.kind, ResponseVerdict::Kind::SUCCESS);
    EXPECT_EQ(verdict.text, "hello");
}

TEST(InterpretResponseTest, TransportFailureIsTransient) {
    auto verdict = interpret_response(refused_response(), 1);
    EXPECT_EQ(verdict.kind, ResponseVerdict::Kind::TRANSIENT);
    EXPECT_NE(verdict.reason.find("transport error"), std::string::npos);
}

TEST(InterpretResponseTest, MalformedBodyIsTransient) {
    EXPECT_EQ(interpret_response(status_response(200, "<html>oops"), 1).kind,
              ResponseVerdict::Kind::TRANSIENT);
    EXPECT_EQ(interpret_response(status_response(200, R"(["a"])"), 1).kind,
              ResponseVerdict::Kind::TRANSIENT);
    EXPECT_EQ(interpret_response(status_response(200, R"({"done":true})"), 1).kind,
              ResponseVerdict::Kind::TRANSIENT);
}

TEST(InterpretResponseTest, ServerErrorsAndThrottlingAreTransient) {
    EXPECT_EQ(interpret_response(status_response(503, "busy"), 1).kind, ResponseVerdict::Kind::TRANSIENT);
    EXPECT_EQ(interpret_response(status_response(500, "{}"), 1).kind, ResponseVerdict::Kind::TRANSIENT);
    EXPECT_EQ(interpret_response(status_response(429, "slow down"), 1).kind, ResponseVerdict::Kind::TRANSIENT);
}

TEST(InterpretResponseTest, ClientErrorIsPermanentWithBackendMessage) {
    auto verdict = interpret_response(
        status_response(404, R"({"error":"model 'llama9' not found"})"), 1);
    EXPECT_EQ(verdict.kind, ResponseVerdict::Kind::PERMANENT);
    EXPECT_NE(verdict.reason.find("model 'llama9' not found"), std::string::npos);
    EXPECT_NE(verdict.reason.find("404"), std::string::npos);
}

TEST(InterpretResponseTest, ErrorFieldInSuccessBodyIsPermanent) {
    auto verdict = interpret_response(status_response(200, R"({"error":"invalid options"})"), 1);
    EXPECT_EQ(verdict.kind, ResponseVerdict::Kind::PERMANENT);
    EXPECT_EQ(verdict.reason, "invalid options");
}

TEST(InterpretResponseTest, ShortResponseIsTransient) {
    EXPECT_EQ(interpret_response(ok_response("   "), 1).kind, ResponseVerdict::Kind::TRANSIENT);
    EXPECT_EQ(interpret_response(ok_response("too short"), 10).kind, ResponseVerdict::Kind::TRANSIENT);
    EXPECT_EQ(interpret_response(ok_response("long enough now"), 10).kind, ResponseVerdict::Kind::SUCCESS);
}

// ---------------------------------------------------------------------------
// Retry loop
// ---------------------------------------------------------------------------

TEST(GenerationClientTest, SucceedsFirstTime) {
    auto transport = FakeTransport::scripted({ok_response("Here is the appraisal.")});
    GenerationClient client(fast_config(), transport);

    auto result = client.generate(make_request());

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.text, "Here is the appraisal.");
    EXPECT_EQ(result.attempts, 1u);
    EXPECT_EQ(result.error_kind, ErrorKind::NONE);
    EXPECT_EQ(transport->calls(), 1u);
}

TEST(GenerationClientTest, TwoTransientFailuresThenSuccessWithThreeAttempts) {
    auto transport = FakeTransport::scripted({
        refused_response(), status_response(503, "loading model"), ok_response("Recovered answer")});
    GenerationClient client(fast_config(3), transport);

    auto result = client.generate(make_request());

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.text, "Recovered answer");
    EXPECT_EQ(result.attempts, 3u);
    EXPECT_EQ(transport->calls(), 3u);
}

TEST(GenerationClientTest, TwoTransientFailuresExhaustTwoAttempts) {
    auto transport = FakeTransport::scripted({
        refused_response(), status_response(503, "loading model"), ok_response("Too late")});
    GenerationClient client(fast_config(2), transport);

    auto result = client.generate(make_request());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::BACKEND_UNAVAILABLE);
    EXPECT_EQ(result.attempts, 2u);
    EXPECT_EQ(transport->calls(), 2u);
    // The last underlying cause is carried along.
    EXPECT_NE(result.error.find("503"), std::string::npos);
}

TEST(GenerationClientTest, PermanentRejectionIsNotRetried) {
    auto transport = FakeTransport::scripted({
        status_response(404, R"({"error":"model not found"})"), ok_response("never reached")});
    GenerationClient client(fast_config(5), transport);

    auto result = client.generate(make_request());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::BACKEND_REJECTED);
    EXPECT_EQ(transport->calls(), 1u);
    EXPECT_NE(result.error.find("model not found"), std::string::npos);
}

TEST(GenerationClientTest, InvalidRequestsNeverReachTheBackend) {
    auto transport = FakeTransport::scripted({ok_response("unused")});
    GenerationClient client(fast_config(), transport);

    GenerationRequest no_prompt = make_request("");
    GenerationRequest no_role = make_request();
    no_role.role_context.clear();

    EXPECT_EQ(client.generate(no_prompt).error_kind, ErrorKind::INVALID_REQUEST);
    EXPECT_EQ(client.generate(no_role).error_kind, ErrorKind::INVALID_REQUEST);
    EXPECT_EQ(client.generate(make_request(), std::chrono::milliseconds(0)).error_kind,
              ErrorKind::INVALID_REQUEST);
    EXPECT_EQ(transport->calls(), 0u);
}

TEST(GenerationClientTest, BuildsOllamaRequestBody) {
    auto transport = FakeTransport::scripted({ok_response("structured")});
    GenerationClient client(fast_config(), transport);

    GenerationRequest request = make_request("Explain APR vs flat rate financing");
    request.model = "mistral";
    request.json_format = true;
    ASSERT_TRUE(client.generate(request).success);

    auto sent = transport->requests().at(0);
    EXPECT_EQ(sent["model"], "mistral");
    EXPECT_EQ(sent["prompt"], "Explain APR vs flat rate financing");
    EXPECT_EQ(sent["system"], "You are Sarah Chen, a Appraisal Manager.");
    EXPECT_EQ(sent["stream"], false);
    EXPECT_EQ(sent["format"], "json");
    EXPECT_EQ(sent["options"]["top_k"], 40);
    EXPECT_EQ(transport->urls().at(0), "http://backend.test:11434/api/generate");
}

TEST(GenerationClientTest, UsesDefaultModelAndPerAttemptTimeout) {
    auto transport = FakeTransport::scripted({ok_response("fine")});
    GenerationClient client(fast_config(), transport);

    ASSERT_TRUE(client.generate(make_request(), std::chrono::milliseconds(750)).success);

    auto sent = transport->requests().at(0);
    EXPECT_EQ(sent["model"], "test-model");
    EXPECT_FALSE(sent.contains("format"));
    EXPECT_EQ(transport->timeouts().at(0), std::chrono::milliseconds(750));
}

TEST(GenerationClientTest, CountsAttemptsProcessWide) {
    auto before = GenerationClient::total_attempts();
    auto transport = FakeTransport::scripted({refused_response(), ok_response("ok then")});
    GenerationClient client(fast_config(), transport);

    ASSERT_TRUE(client.generate(make_request()).success);
    EXPECT_GE(GenerationClient::total_attempts(), before + 2);
}

TEST(GenerationClientTest, ReportsInteractionsPerAttempt) {
    auto transport = FakeTransport::scripted({refused_response(), ok_response("done now")});
    GenerationClient client(fast_config(), transport);

    std::vector<InteractionEvent> events;
    auto result = client.generate(make_request(), std::chrono::milliseconds(1000), nullptr,
        [&events](const InteractionEvent& e) { events.push_back(e); });

    ASSERT_TRUE(result.success);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, InteractionEvent::Type::REQUEST);
    EXPECT_EQ(events[0].attempt, 1u);
    EXPECT_EQ(events[1].type, InteractionEvent::Type::ERROR);
    EXPECT_EQ(events[2].type, InteractionEvent::Type::REQUEST);
    EXPECT_EQ(events[2].attempt, 2u);
    EXPECT_EQ(events[3].type, InteractionEvent::Type::RESPONSE);
    EXPECT_EQ(events[3].response_length, std::string("done now").size());
    EXPECT_EQ(events[3].model, "test-model");
}

TEST(GenerationClientTest, RaisedAbortFlagCancelsBeforeFirstAttempt) {
    auto transport = FakeTransport::scripted({ok_response("unused")});
    GenerationClient client(fast_config(), transport);
    std::atomic<bool> abort{true};

    auto result = client.generate(make_request(), std::chrono::milliseconds(1000), &abort);

    EXPECT_EQ(result.error_kind, ErrorKind::CANCELLED);
    EXPECT_EQ(transport->calls(), 0u);
}

TEST(GenerationClientTest, AbortDuringTransferCancels) {
    crew::test::Gate never_opened;
    auto transport = std::make_shared<FakeTransport>(
        [&never_opened](const nlohmann::json&, const std::atomic<bool>* abort) {
            never_opened.wait(abort);
            return crew::test::aborted_response();
        });
    GenerationClient client(fast_config(), transport);
    std::atomic<bool> abort{false};

    std::thread trigger([&abort]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        abort = true;
    });
    auto result = client.generate(make_request(), std::chrono::milliseconds(5000), &abort);
    trigger.join();

    EXPECT_EQ(result.error_kind, ErrorKind::CANCELLED);
    EXPECT_EQ(transport->calls(), 1u);
}

TEST(GenerationClientTest, OverallDeadlineBoundsTheRetrySequence) {
    auto config = fast_config(10);
    config.retry.base_delay = std::chrono::milliseconds(40);
    config.retry.max_delay = std::chrono::milliseconds(40);
    config.retry.overall_deadline = std::chrono::milliseconds(100);
    auto transport = FakeTransport::scripted({refused_response()});
    GenerationClient client(config, transport);

    auto result = client.generate(make_request());

    EXPECT_EQ(result.error_kind, ErrorKind::BACKEND_UNAVAILABLE);
    EXPECT_LT(transport->calls(), 10u);
    EXPECT_NE(result.error.find("deadline"), std::string::npos);
}
