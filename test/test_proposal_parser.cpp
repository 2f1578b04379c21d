#include <iostream>
#include "test_helpers.h"
#include "common/error_handler.h"
#include "model_gateway/proposal_parser.h"

using namespace deskpilot;

namespace {

// True if parsing throws MODEL_MALFORMED_RESPONSE
bool rejects(const std::string& text) {
    try {
        ProposalParser::parse(text);
    } catch (const DeskpilotException& e) {
        return e.type() == ErrorType::MODEL_MALFORMED_RESPONSE;
    }
    return false;
}

}

void testPlainReply() {
    std::cout << "[TEST] Plain JSON reply\n";

    ModelReply reply = ProposalParser::parse(
        R"({"action": "click", "target": {"x": 120, "y": 48}, "rationale": "press Save", "confidence": 0.82})");
    CHECK(reply.proposal.kind == ActionKind::CLICK);
    CHECK_EQ(reply.proposal.target.parameters["x"].get<int>(), 120);
    CHECK_EQ(reply.proposal.rationale, std::string("press Save"));
    CHECK(reply.proposal.confidence > 0.81 && reply.proposal.confidence < 0.83);
    CHECK(!reply.proposal.goalSatisfied);
    CHECK(!reply.proposal.riskHint.has_value());

    std::cout << "[OK] Plain reply test passed\n\n";
}

void testFencedReplyWithProse() {
    std::cout << "[TEST] Fenced reply surrounded by prose\n";

    std::string text =
        "Looking at the screen, the field is empty.\n"
        "```json\n"
        "{\"action\": \"type\", \"target\": {\"element\": \"Name field\", \"text\": \"Ada {L}\"},"
        " \"reasoning\": \"fill in the name\", \"confidence\": 0.7, \"risk_hint\": 2}\n"
        "```\n"
        "Let me know if that worked.";
    ModelReply reply = ProposalParser::parse(text);
    CHECK(reply.proposal.kind == ActionKind::TEXT_ENTRY);
    CHECK_EQ(reply.proposal.target.element, std::string("Name field"));
    CHECK(!reply.proposal.target.has("element"));
    CHECK_EQ(reply.proposal.target.parameters["text"].get<std::string>(), std::string("Ada {L}"));
    CHECK_EQ(reply.proposal.rationale, std::string("fill in the name"));
    CHECK(reply.proposal.riskHint == RiskLevel::MEDIUM);

    auto extracted = ProposalParser::extractJsonObject("noise {\"a\": \"}\"} trailing");
    CHECK(extracted.has_value());
    CHECK_EQ(*extracted, std::string("{\"a\": \"}\"}"));

    std::cout << "[OK] Fenced reply test passed\n\n";
}

void testGoalSatisfiedSentinel() {
    std::cout << "[TEST] Goal satisfied sentinel\n";

    ModelReply byAction = ProposalParser::parse(R"({"action": "done", "rationale": "saved"})");
    CHECK(byAction.proposal.goalSatisfied);
    CHECK(byAction.proposal.confidence == 1.0);

    ModelReply byFlag = ProposalParser::parse(
        R"({"action": "click", "goal_satisfied": true, "rationale": "already open", "confidence": 0.9})");
    CHECK(byFlag.proposal.goalSatisfied);
    CHECK_EQ(byFlag.proposal.rationale, std::string("already open"));

    std::cout << "[OK] Sentinel test passed\n\n";
}

void testMalformedReplies() {
    std::cout << "[TEST] Malformed replies\n";

    CHECK(rejects("I am not sure what to do next."));
    CHECK(rejects(R"({"action": "click", "target": {"x": 1, "y": 2}, "confidence": 0.5)"));
    CHECK(rejects(R"({"action": "teleport", "confidence": 0.5})"));
    CHECK(rejects(R"({"action": "click", "target": {"x": 1, "y": 2}, "confidence": 1.5})"));
    CHECK(rejects(R"({"action": "click", "target": {"x": 1, "y": 2}})"));
    CHECK(rejects(R"({"action": "click", "target": {"x": 1}, "confidence": 0.5})"));
    CHECK(rejects(R"({"action": "text_entry", "target": {"text": ""}, "confidence": 0.5})"));
    CHECK(rejects(R"({"action": "drag", "target": {"x": 1, "y": 2}, "confidence": 0.5})"));
    CHECK(rejects(R"({"action": "file_operation", "target": {"path": "/tmp/a"}, "confidence": 0.5})"));
    CHECK(rejects(R"({"action": "wait", "confidence": 0.5, "risk_hint": 7})"));
    CHECK(rejects(R"({"action": "wait", "confidence": "high"})"));

    std::cout << "[OK] Malformed reply test passed\n\n";
}

void testTargetRequirements() {
    std::cout << "[TEST] Per-kind target requirements\n";

    ModelReply byElement = ProposalParser::parse(
        R"({"action": "double-click", "target": "Report.docx", "rationale": "open it", "confidence": 0.6})");
    CHECK(byElement.proposal.kind == ActionKind::DOUBLE_CLICK);
    CHECK_EQ(byElement.proposal.target.element, std::string("Report.docx"));

    ModelReply key = ProposalParser::parse(
        R"({"action": "key_press", "target": {"key": "ctrl+s"}, "rationale": "save", "confidence": 0.9})");
    CHECK(key.proposal.kind == ActionKind::KEY_INPUT);

    ModelReply wait = ProposalParser::parse(R"({"action": "wait", "confidence": 0.4})");
    CHECK(wait.proposal.kind == ActionKind::WAIT);

    ModelReply launch = ProposalParser::parse(
        R"({"action": "launch_app", "target": {"app": "notepad"}, "rationale": "editor", "confidence": 0.9})");
    CHECK(launch.proposal.kind == ActionKind::LAUNCH_APP);

    std::cout << "[OK] Target requirement test passed\n\n";
}

void testLargeFencedReply() {
    std::cout << "[TEST] Very long fenced reply\n";

    const std::string padding(200000, 'a');
    ModelReply reply = ProposalParser::parse(
        "```json\n{\"action\": \"wait\", \"rationale\": \"" + padding + "\", \"confidence\": 0.5}\n```");
    CHECK(reply.proposal.kind == ActionKind::WAIT);
    CHECK_EQ(reply.proposal.rationale.size(), padding.size());

    // Unclosed fence and a bare fence without the json tag
    CHECK(ProposalParser::parse("```json\n{\"action\": \"done\"}").proposal.goalSatisfied);
    CHECK(ProposalParser::parse("```\n{\"action\": \"done\"}\n```").proposal.goalSatisfied);
    CHECK(rejects("```json\n" + padding + "\n```"));

    std::cout << "[OK] Long reply test passed\n\n";
}

int main() {
    std::cout << "=== Deskpilot Proposal Parser Test Suite ===\n\n";

    try {
        testPlainReply();
        testFencedReplyWithProse();
        testGoalSatisfiedSentinel();
        testMalformedReplies();
        testTargetRequirements();
        testLargeFencedReply();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
