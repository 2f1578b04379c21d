#include <iostream>
#include <thread>
#include "test_helpers.h"
#include "common/error_handler.h"
#include "common/thread_pool.h"
#include "model_gateway/model_gateway.h"
#include "model_gateway/chat_model_endpoint.h"
#include "simulation/scenario.h"

using namespace deskpilot;
using namespace deskpilot::testing;

namespace {

ReasoningRequest makeRequest() {
    ReasoningRequest request;
    request.runId = "run-gateway";
    request.sequence = 1;
    request.goal.objective = "open the settings window";
    request.snapshot.snapshotId = "snap-1";
    request.snapshot.text = "Desktop with a Settings icon";
    return request;
}

const std::string CLICK_REPLY = R"({"action": "click", "target": {"element": "Settings"}, "rationale": "open settings", "confidence": 0.9})";

}

void testFirstEndpointAnswers() {
    std::cout << "[TEST] First endpoint answers\n";

    ThreadPool pool(2);
    auto log = std::make_shared<CallLog>();
    auto metrics = std::make_shared<CollectingMetricsSink>();
    auto token = std::make_shared<CancellationToken>();

    ModelGateway gateway({
        std::make_shared<FunctionEndpoint>("vision", replies({CLICK_REPLY}), log),
        std::make_shared<FunctionEndpoint>("reasoning", replies({CLICK_REPLY}), log)
    }, pool, metrics, 5ms);

    GatewayResult result = gateway.invoke(makeRequest(), token);
    CHECK(result.status == GatewayStatus::OK);
    CHECK_EQ(result.endpoint, std::string("vision"));
    CHECK(result.proposal && result.proposal->kind == ActionKind::CLICK);
    CHECK_EQ(result.attempts.size(), size_t(1));
    CHECK_EQ(log->calls().size(), size_t(1));
    CHECK_EQ(metrics->ofKind(MetricsEventKind::MODEL_ATTEMPT).size(), size_t(1));

    std::cout << "[OK] First endpoint test passed\n\n";
}

void testTimeoutFallsBackInOrder() {
    std::cout << "[TEST] Timed out endpoint falls back to the next\n";

    ThreadPool pool(2);
    auto log = std::make_shared<CallLog>();
    auto metrics = std::make_shared<CollectingMetricsSink>();
    auto token = std::make_shared<CancellationToken>();

    ModelGateway gateway({
        std::make_shared<FunctionEndpoint>("slow", hangs(), log, 40ms),
        std::make_shared<FunctionEndpoint>("quick", replies({CLICK_REPLY}), log),
        std::make_shared<FunctionEndpoint>("spare", replies({CLICK_REPLY}), log)
    }, pool, metrics, 5ms);

    GatewayResult result = gateway.invoke(makeRequest(), token);
    CHECK(result.status == GatewayStatus::OK);
    CHECK_EQ(result.endpoint, std::string("quick"));
    CHECK_EQ(result.attempts.size(), size_t(2));
    CHECK(result.attempts[0].outcome == AttemptOutcome::TIMED_OUT);
    CHECK(result.attempts[0].latency >= 40ms);
    CHECK(result.attempts[1].succeeded());

    auto calls = log->calls();
    CHECK_EQ(calls.size(), size_t(2));
    CHECK_EQ(calls[0], std::string("slow"));
    CHECK_EQ(calls[1], std::string("quick"));

    auto events = metrics->ofKind(MetricsEventKind::MODEL_ATTEMPT);
    CHECK_EQ(events.size(), size_t(2));
    CHECK_EQ(events[0].data["outcome"].get<std::string>(), std::string("timeout"));
    CHECK_EQ(events[1].data["position"].get<size_t>(), size_t(1));

    // Release the abandoned call
    token->cancel("test finished");

    std::cout << "[OK] Timeout fallback test passed\n\n";
}

void testUnavailableAndMalformed() {
    std::cout << "[TEST] Unavailable and malformed endpoints\n";

    ThreadPool pool(2);
    auto log = std::make_shared<CallLog>();
    auto token = std::make_shared<CancellationToken>();

    auto offline = std::make_shared<FunctionEndpoint>("offline", replies({CLICK_REPLY}), log);
    offline->setAvailable(false);

    auto refused = std::make_shared<FunctionEndpoint>("refused",
        [](const ReasoningRequest&, std::chrono::milliseconds, const CancellationToken&) -> std::string {
            DESKPILOT_THROW(ErrorType::MODEL_UNAVAILABLE, ErrorSeverity::MEDIUM,
                            "connection refused", "", "test");
        }, log);

    auto chatty = std::make_shared<FunctionEndpoint>("chatty", replies({"Sure! I would click Settings."}), log);
    auto good = std::make_shared<FunctionEndpoint>("good", replies({CLICK_REPLY}), log);

    ModelGateway gateway({offline, refused, chatty, good}, pool, nullptr, 5ms);
    GatewayResult result = gateway.invoke(makeRequest(), token);

    CHECK(result.status == GatewayStatus::OK);
    CHECK_EQ(result.endpoint, std::string("good"));
    CHECK_EQ(result.attempts.size(), size_t(4));
    CHECK(result.attempts[0].outcome == AttemptOutcome::UNAVAILABLE);
    CHECK(result.attempts[0].latency == 0ms);
    CHECK(result.attempts[1].outcome == AttemptOutcome::UNAVAILABLE);
    CHECK(result.attempts[2].outcome == AttemptOutcome::MALFORMED);
    CHECK_EQ(log->count("offline"), size_t(0));

    std::cout << "[OK] Unavailable and malformed test passed\n\n";
}

void testExhausted() {
    std::cout << "[TEST] Every endpoint fails\n";

    ThreadPool pool(2);
    auto log = std::make_shared<CallLog>();
    auto metrics = std::make_shared<CollectingMetricsSink>();
    auto token = std::make_shared<CancellationToken>();

    auto failing = [](const ReasoningRequest&, std::chrono::milliseconds, const CancellationToken&) -> std::string {
        throw std::runtime_error("HTTP 500");
    };

    ModelGateway gateway({
        std::make_shared<FunctionEndpoint>("a", failing, log),
        std::make_shared<FunctionEndpoint>("b", replies({"{}"}), log),
        std::make_shared<FunctionEndpoint>("c", failing, log)
    }, pool, metrics, 5ms);

    GatewayResult result = gateway.invoke(makeRequest(), token);
    CHECK(result.status == GatewayStatus::EXHAUSTED);
    CHECK(!result.proposal.has_value());
    CHECK_EQ(result.attempts.size(), size_t(3));
    CHECK(result.attempts[0].outcome == AttemptOutcome::FAILED);
    CHECK(result.attempts[1].outcome == AttemptOutcome::MALFORMED);
    CHECK_EQ(metrics->ofKind(MetricsEventKind::MODEL_ATTEMPT).size(), size_t(3));

    std::cout << "[OK] Exhausted test passed\n\n";
}

void testCancellationStopsFallback() {
    std::cout << "[TEST] Cancellation during a call\n";

    ThreadPool pool(2);
    auto log = std::make_shared<CallLog>();
    auto token = std::make_shared<CancellationToken>();

    ModelGateway gateway({
        std::make_shared<FunctionEndpoint>("stuck", hangs(), log, 5000ms),
        std::make_shared<FunctionEndpoint>("next", replies({CLICK_REPLY}), log)
    }, pool, nullptr, 5ms);

    std::thread stopper([token]() {
        std::this_thread::sleep_for(30ms);
        token->cancel("operator hotkey");
    });

    auto started = std::chrono::steady_clock::now();
    GatewayResult result = gateway.invoke(makeRequest(), token);
    auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    CHECK(result.status == GatewayStatus::CANCELLED);
    CHECK(elapsed < 2000ms);
    CHECK_EQ(log->count("next"), size_t(0));

    GatewayResult again = gateway.invoke(makeRequest(), token);
    CHECK(again.status == GatewayStatus::CANCELLED);
    CHECK(again.attempts.empty());

    std::cout << "[OK] Cancellation test passed\n\n";
}

void testChatEndpointPayload() {
    std::cout << "[TEST] Chat endpoint over a scripted transport\n";

    simulation::ModelScript llava;
    llava.replies.push_back({CLICK_REPLY, "", false, 0ms});
    simulation::ModelScript phi3;
    phi3.available = false;

    auto transport = std::make_shared<simulation::ScriptedTransport>(
        std::map<std::string, simulation::ModelScript>{{"llava", llava}, {"phi3", phi3}});

    EndpointConfig visionConfig{"vision", "llava", 1000ms, true};
    EndpointConfig textConfig{"reasoning", "phi3", 1000ms, false};
    auto vision = std::make_shared<ChatModelEndpoint>(visionConfig, transport);
    auto text = std::make_shared<ChatModelEndpoint>(textConfig, transport);

    ReasoningRequest request = makeRequest();
    request.imageRef = "mem://snap-1";
    request.lastFailure = std::string("click failed: element not found");

    nlohmann::json payload = vision->buildPayload(request);
    CHECK_EQ(payload["model"].get<std::string>(), std::string("llava"));
    CHECK_EQ(payload["messages"].size(), size_t(2));
    CHECK_EQ(payload["messages"][0]["role"].get<std::string>(), std::string("system"));
    CHECK_EQ(payload["messages"][1]["images"][0].get<std::string>(), std::string("mem://snap-1"));

    nlohmann::json content = nlohmann::json::parse(payload["messages"][1]["content"].get<std::string>());
    CHECK_EQ(content["cycle"].get<uint64_t>(), uint64_t(1));
    CHECK_EQ(content["last_failure"].get<std::string>(), std::string("click failed: element not found"));

    nlohmann::json textPayload = text->buildPayload(request);
    CHECK(!textPayload["messages"][1].contains("images"));
    CHECK(!text->isAvailable());
    CHECK(vision->isAvailable());

    ThreadPool pool(2);
    auto token = std::make_shared<CancellationToken>();
    ModelGateway gateway({text, vision}, pool, nullptr, 5ms);
    GatewayResult result = gateway.invoke(request, token);
    CHECK(result.status == GatewayStatus::OK);
    CHECK_EQ(result.endpoint, std::string("vision"));
    CHECK(result.attempts[0].outcome == AttemptOutcome::UNAVAILABLE);
    CHECK_EQ(transport->callCount("phi3"), size_t(0));
    CHECK_EQ(transport->callCount("llava"), size_t(1));

    std::cout << "[OK] Chat endpoint test passed\n\n";
}

int main() {
    std::cout << "=== Deskpilot Model Gateway Test Suite ===\n\n";

    try {
        testFirstEndpointAnswers();
        testTimeoutFallsBackInOrder();
        testUnavailableAndMalformed();
        testExhausted();
        testCancellationStopsFallback();
        testChatEndpointPayload();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
