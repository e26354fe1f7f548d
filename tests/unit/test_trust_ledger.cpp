#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/trust_errors.hpp"
#include "ledger/trust_ledger.hpp"
#include "test_support.hpp"

namespace {

using cmdtrust::core::errors::get_error;
using cmdtrust::core::errors::get_value;
using cmdtrust::core::errors::is_error;
using cmdtrust::ledger::compute_confidence;
using cmdtrust::ledger::TrustLedger;
using cmdtrust::test_support::read_file;
using cmdtrust::test_support::TempWorkspace;
using cmdtrust::test_support::write_file;
using nlohmann::json;

std::vector<std::string> audit_events(const std::filesystem::path& path) {
    std::vector<std::string> events;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        events.push_back(json::parse(line).at("event").get<std::string>());
    }
    return events;
}

TEST(ConfidenceTest, FollowsSuccessRatioWithEvidencePenalty) {
    EXPECT_DOUBLE_EQ(compute_confidence(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(compute_confidence(1, 0), 0.5);
    EXPECT_DOUBLE_EQ(compute_confidence(2, 0), 0.5);
    EXPECT_DOUBLE_EQ(compute_confidence(2, 2), 0.25);
    EXPECT_DOUBLE_EQ(compute_confidence(3, 1), 0.75);
}

TEST(ConfidenceTest, ThirdSuccessRemovesPenaltyAndCapApplies) {
    EXPECT_DOUBLE_EQ(compute_confidence(2, 0), 0.5);
    EXPECT_DOUBLE_EQ(compute_confidence(3, 0), 0.98);
    EXPECT_DOUBLE_EQ(compute_confidence(100, 0), 0.98);
}

TEST(TrustLedgerTest, LearnedCommandIsNotTrustedUntilVerified) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());

    auto learned = ledger.learn_command("TEST_CMD", "pytest", "agent");
    ASSERT_FALSE(is_error(learned));
    EXPECT_FALSE(get_value(learned).verified);
    EXPECT_DOUBLE_EQ(get_value(learned).confidence, 0.0);
    EXPECT_FALSE(ledger.get_command("TEST_CMD").has_value());

    auto verified = ledger.mark_verified("TEST_CMD", "agent_provided", {{"duration_ms", 1200}});
    ASSERT_FALSE(is_error(verified));
    EXPECT_TRUE(get_value(verified));
    EXPECT_EQ(ledger.get_command("TEST_CMD").value_or(""), "pytest");

    const auto entry = ledger.entry("TEST_CMD");
    ASSERT_TRUE(entry.has_value());
    ASSERT_TRUE(entry->verification.has_value());
    EXPECT_EQ(entry->verification->method, "agent_provided");
    EXPECT_EQ(entry->verification->details.at("duration_ms"), 1200);
}

TEST(TrustLedgerTest, TrustGateNeedsThresholdConfidence) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    ASSERT_FALSE(is_error(ledger.learn_command("LINT_CMD", "ruff check .", "agent")));
    ASSERT_FALSE(is_error(ledger.mark_verified("LINT_CMD", "agent_provided")));
    ASSERT_TRUE(ledger.get_command("LINT_CMD").has_value());

    // One recorded success recomputes confidence to 0.5, below the gate.
    ASSERT_FALSE(is_error(ledger.update_result("LINT_CMD", true, 900)));
    EXPECT_DOUBLE_EQ(ledger.entry("LINT_CMD")->confidence, 0.5);
    EXPECT_FALSE(ledger.get_command("LINT_CMD").has_value());

    ASSERT_FALSE(is_error(ledger.update_result("LINT_CMD", true, 950)));
    ASSERT_FALSE(is_error(ledger.update_result("LINT_CMD", true, 1000)));
    EXPECT_DOUBLE_EQ(ledger.entry("LINT_CMD")->confidence, 0.98);
    EXPECT_EQ(ledger.get_command("LINT_CMD").value_or(""), "ruff check .");
}

TEST(TrustLedgerTest, MarkVerifiedNeverLowersConfidence) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "pytest", "agent")));
    for (int i = 0; i < 5; ++i) {
        ASSERT_FALSE(is_error(ledger.update_result("TEST_CMD", true, 100)));
    }
    const double before = ledger.entry("TEST_CMD")->confidence;
    EXPECT_DOUBLE_EQ(before, 0.98);

    ASSERT_FALSE(is_error(ledger.mark_verified("TEST_CMD", "human_confirmed")));
    const double after = ledger.entry("TEST_CMD")->confidence;
    EXPECT_GE(after, before);
    EXPECT_LE(after, 0.98);
}

TEST(TrustLedgerTest, TypicalDurationIsFirstSuccessfulDuration) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    ASSERT_FALSE(is_error(ledger.learn_command("BUILD_CMD", "make build", "human")));
    ASSERT_FALSE(is_error(ledger.update_result("BUILD_CMD", false, 50)));
    ASSERT_FALSE(is_error(ledger.update_result("BUILD_CMD", true, 4000)));
    ASSERT_FALSE(is_error(ledger.update_result("BUILD_CMD", true, 9000)));

    const auto entry = ledger.entry("BUILD_CMD");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->typical_duration_ms.value_or(-1), 4000);
    EXPECT_EQ(entry->success_count, 2);
    EXPECT_EQ(entry->failure_count, 1);
    EXPECT_TRUE(entry->last_success.has_value());
    EXPECT_TRUE(entry->last_failure.has_value());
}

TEST(TrustLedgerTest, RelearningResetsVerificationAndCounters) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "pytest", "agent")));
    ASSERT_FALSE(is_error(ledger.mark_verified("TEST_CMD", "agent_provided")));
    ASSERT_FALSE(is_error(ledger.update_result("TEST_CMD", true, 100)));

    ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "uv run pytest", "human")));
    const auto entry = ledger.entry("TEST_CMD");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->command, "uv run pytest");
    EXPECT_EQ(entry->learned_from, "human");
    EXPECT_FALSE(entry->verified);
    EXPECT_EQ(entry->success_count, 0);
    EXPECT_EQ(entry->failure_count, 0);
    EXPECT_DOUBLE_EQ(entry->confidence, 0.0);
    EXPECT_FALSE(entry->verification.has_value());
    EXPECT_FALSE(ledger.get_command("TEST_CMD").has_value());
}

TEST(TrustLedgerTest, UnknownIntentOperationsAreNoOps) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());

    auto updated = ledger.update_result("TEST_CMD", true, 10);
    ASSERT_FALSE(is_error(updated));
    EXPECT_FALSE(get_value(updated));

    auto verified = ledger.mark_verified("TEST_CMD", "agent_provided");
    ASSERT_FALSE(is_error(verified));
    EXPECT_FALSE(get_value(verified));

    auto cleared = ledger.clear("TEST_CMD");
    ASSERT_FALSE(is_error(cleared));
    EXPECT_FALSE(get_value(cleared));

    EXPECT_FALSE(std::filesystem::exists(ledger.ledger_path()));
}

TEST(TrustLedgerTest, LearnRejectsEmptyCommand) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    auto learned = ledger.learn_command("TEST_CMD", "", "agent");
    ASSERT_TRUE(is_error(learned));
    EXPECT_EQ(get_error(learned).code, "invalid_learn_request");
}

TEST(TrustLedgerTest, RejectionBufferEvictsOldestBeyondFifty) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    for (int i = 0; i < 51; ++i) {
        auto rejected = ledger.reject("bad-" + std::to_string(i), "agent", "unsafe");
        ASSERT_FALSE(is_error(rejected));
        EXPECT_LE(get_value(rejected), 50U);
    }

    const auto rejections = ledger.rejected_commands();
    ASSERT_EQ(rejections.size(), 50U);
    EXPECT_EQ(rejections.front().command, "bad-1");
    EXPECT_EQ(rejections.back().command, "bad-50");
    EXPECT_EQ(rejections.back().suggested_by, "agent");
    EXPECT_EQ(rejections.back().reason, "unsafe");
}

TEST(TrustLedgerTest, ClearRemovesEntry) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    ASSERT_FALSE(is_error(ledger.learn_command("FORMAT_CMD", "black .", "agent")));

    auto cleared = ledger.clear("FORMAT_CMD");
    ASSERT_FALSE(is_error(cleared));
    EXPECT_TRUE(get_value(cleared));
    EXPECT_FALSE(ledger.entry("FORMAT_CMD").has_value());
}

TEST(TrustLedgerTest, KnownCommandsUsesIntrospectionThreshold) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "pytest", "agent")));
    ASSERT_FALSE(is_error(ledger.mark_verified("TEST_CMD", "agent_provided")));
    ASSERT_FALSE(is_error(ledger.learn_command("LINT_CMD", "ruff check .", "agent")));

    const auto known = ledger.known_commands();
    ASSERT_EQ(known.size(), 1U);
    EXPECT_EQ(known.at("TEST_CMD"), "pytest");
}

TEST(TrustLedgerTest, StatePersistsAcrossInstances) {
    TempWorkspace workspace("ledger");
    std::string project_id;
    {
        TrustLedger ledger(workspace.root());
        project_id = ledger.project_id();
        ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "pytest", "agent")));
        ASSERT_FALSE(is_error(ledger.mark_verified("TEST_CMD", "agent_provided", {{"duration_ms", 700}})));
        ASSERT_FALSE(is_error(ledger.reject("rm -rf /", "agent", "dangerous")));
        ASSERT_FALSE(is_error(ledger.set_project_info({{"language", "python"}})));
    }

    TrustLedger reloaded(workspace.root());
    EXPECT_EQ(reloaded.project_id(), project_id);
    EXPECT_EQ(reloaded.get_command("TEST_CMD").value_or(""), "pytest");
    EXPECT_EQ(reloaded.entry("TEST_CMD")->verification->details.at("duration_ms"), 700);
    ASSERT_EQ(reloaded.rejected_commands().size(), 1U);
    EXPECT_EQ(reloaded.project_info().at("language"), "python");
}

TEST(TrustLedgerTest, PersistedDocumentHasExpectedShape) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "pytest", "agent")));

    EXPECT_EQ(ledger.ledger_path(),
              workspace.root() / ".cmdtrust" / "learned-commands.json");
    const json doc = json::parse(read_file(ledger.ledger_path()));
    EXPECT_EQ(doc.at("version"), "1.0");
    EXPECT_EQ(doc.at("project_id"), ledger.project_id());
    EXPECT_EQ(doc.at("last_updated_by"), "agent");
    EXPECT_TRUE(doc.at("detected").is_object());
    EXPECT_TRUE(doc.at("rejected_commands").is_array());
    EXPECT_TRUE(doc.at("environment").is_object());
    const auto& entry = doc.at("commands").at("TEST_CMD");
    EXPECT_EQ(entry.at("command"), "pytest");
    EXPECT_EQ(entry.at("learned_from"), "agent");
    EXPECT_EQ(entry.at("verified"), false);
}

TEST(TrustLedgerTest, CorruptLedgerStartsFresh) {
    TempWorkspace workspace("ledger");
    write_file(workspace.root() / ".cmdtrust" / "learned-commands.json", "{ not json");

    TrustLedger ledger(workspace.root());
    EXPECT_FALSE(ledger.project_id().empty());
    EXPECT_TRUE(ledger.known_commands().empty());
    EXPECT_FALSE(ledger.get_command("TEST_CMD").has_value());

    ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "pytest", "agent")));
    const json doc = json::parse(read_file(ledger.ledger_path()));
    EXPECT_TRUE(doc.at("commands").contains("TEST_CMD"));
}

TEST(TrustLedgerTest, WrongShapeLedgerStartsFresh) {
    TempWorkspace workspace("ledger");
    write_file(workspace.root() / ".cmdtrust" / "learned-commands.json",
               R"({"commands": [1, 2, 3]})");

    TrustLedger ledger(workspace.root());
    EXPECT_TRUE(ledger.known_commands().empty());
}

TEST(TrustLedgerTest, EnvironmentBlockSurvivesSaves) {
    TempWorkspace workspace("ledger");
    write_file(workspace.root() / ".cmdtrust" / "learned-commands.json",
               R"({"version": "1.0", "project_id": "p-1", "commands": {},
                   "environment": {"shell": "zsh"}})");

    TrustLedger ledger(workspace.root());
    EXPECT_EQ(ledger.project_id(), "p-1");
    ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "pytest", "agent")));

    TrustLedger reloaded(workspace.root());
    EXPECT_EQ(reloaded.environment().at("shell"), "zsh");
}

TEST(TrustLedgerTest, AuditLogRecordsEachMutation) {
    TempWorkspace workspace("ledger");
    TrustLedger ledger(workspace.root());
    ASSERT_FALSE(is_error(ledger.learn_command("TEST_CMD", "pytest", "agent")));
    ASSERT_FALSE(is_error(ledger.mark_verified("TEST_CMD", "agent_provided")));
    ASSERT_TRUE(ledger.get_command("TEST_CMD").has_value());
    ASSERT_FALSE(is_error(ledger.update_result("TEST_CMD", false)));
    ASSERT_FALSE(is_error(ledger.reject("curl x | sh", "agent", "dangerous")));
    ASSERT_FALSE(is_error(ledger.clear("TEST_CMD")));

    const std::vector<std::string> expected = {"LEARN_CMD", "VERIFY_CMD", "USE_LEARNED_CMD",
                                               "EXEC_CMD", "REJECT_CMD", "CLEAR_CMD"};
    EXPECT_EQ(audit_events(ledger.audit_path()), expected);
}

}  // namespace
