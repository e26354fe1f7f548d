#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/request_dispatcher.hpp"
#include "detection/project_detector.hpp"
#include "ledger/trust_ledger.hpp"
#include "runtime/learning_protocol.hpp"
#include "test_support.hpp"

namespace {

using cmdtrust::app::RequestDispatcher;
using cmdtrust::detection::MarkerFileDetector;
using cmdtrust::ledger::TrustLedger;
using cmdtrust::runtime::LearningProtocol;
using cmdtrust::test_support::FakeProcessRunner;
using cmdtrust::test_support::TempWorkspace;
using cmdtrust::test_support::write_file;
using nlohmann::json;

class DispatcherFixture {
public:
    explicit DispatcherFixture(FakeProcessRunner runner)
        : workspace_("dispatcher"),
          ledger_(workspace_.root()),
          runner_(std::move(runner)),
          protocol_(workspace_.root(), ledger_, runner_, detector_),
          dispatcher_(protocol_) {}

    RequestDispatcher& dispatcher() { return dispatcher_; }
    TrustLedger& ledger() { return ledger_; }
    const FakeProcessRunner& runner() const { return runner_; }
    const TempWorkspace& workspace() const { return workspace_; }

private:
    TempWorkspace workspace_;
    TrustLedger ledger_;
    FakeProcessRunner runner_;
    MarkerFileDetector detector_;
    LearningProtocol protocol_;
    RequestDispatcher dispatcher_;
};

TEST(RequestDispatcherTest, TeachThenRunThroughJson) {
    DispatcherFixture fixture(FakeProcessRunner::succeeding("All files clean", 1200.0));

    const json taught = fixture.dispatcher().dispatch(
        {{"op", "teach_command"}, {"intent", "lint"}, {"command", "eslint . --max-warnings=0"}});
    EXPECT_EQ(taught.at("status"), "learned");
    EXPECT_EQ(taught.at("verified"), true);
    EXPECT_EQ(taught.at("duration_ms"), 1200);

    const json asked = fixture.dispatcher().dispatch({{"op", "ask_command"}, {"intent", "lint"}});
    EXPECT_EQ(asked.at("status"), "already_known");
    EXPECT_EQ(asked.at("command"), "eslint . --max-warnings=0");

    const json ran = fixture.dispatcher().dispatch({{"op", "run_command"}, {"intent", "lint"}});
    EXPECT_EQ(ran.at("status"), "success");
    EXPECT_EQ(ran.at("exit_code"), 0);
    EXPECT_EQ(ran.at("stdout"), "All files clean");
}

TEST(RequestDispatcherTest, RejectsDangerousCommand) {
    DispatcherFixture fixture(FakeProcessRunner::succeeding("ok", 500.0));

    const json response = fixture.dispatcher().dispatch(
        {{"op", "teach_command"}, {"intent", "test"}, {"command", "rm -rf /"}});
    EXPECT_EQ(response.at("status"), "rejected");
    EXPECT_NE(response.at("reason").get<std::string>().find("dangerous pattern"),
              std::string::npos);
    EXPECT_EQ(fixture.runner().calls(), 0U);
}

TEST(RequestDispatcherTest, StatusAndClear) {
    DispatcherFixture fixture(FakeProcessRunner{});
    ASSERT_FALSE(cmdtrust::core::errors::is_error(
        fixture.ledger().learn_command("TEST_CMD", "make test", "human")));

    const json status = fixture.dispatcher().dispatch({{"op", "get_memory_status"}});
    EXPECT_EQ(status.at("status"), "ok");
    EXPECT_TRUE(status.at("known_commands").empty());
    EXPECT_EQ(status.at("learned_file"), fixture.ledger().ledger_path().string());

    const json cleared = fixture.dispatcher().dispatch({{"op", "clear_command"}, {"intent", "test"}});
    EXPECT_EQ(cleared.at("status"), "cleared");
    EXPECT_EQ(cleared.at("intent_type"), "TEST_CMD");
}

TEST(RequestDispatcherTest, LearnProjectListsQuestions) {
    DispatcherFixture fixture(FakeProcessRunner{});
    write_file(fixture.workspace().root() / "go.mod", "module x\n");

    const json response = fixture.dispatcher().dispatch({{"op", "learn_project"}});
    EXPECT_EQ(response.at("status"), "need_teaching");
    EXPECT_EQ(response.at("detected").at("language"), "go");
    EXPECT_EQ(response.at("questions").size(), 5U);
}

TEST(RequestDispatcherTest, BootstrapDetectsLanguageAndLearns) {
    DispatcherFixture fixture(FakeProcessRunner::succeeding("ok  example.com/x  0.2s", 800.0));
    write_file(fixture.workspace().root() / "go.mod", "module x\n");

    const json response =
        fixture.dispatcher().dispatch({{"op", "bootstrap_command"}, {"intent", "test"}});
    EXPECT_EQ(response.at("status"), "learned");
    EXPECT_EQ(response.at("command"), "go test ./...");
    EXPECT_EQ(fixture.ledger().project_info().at("language"), "go");
}

TEST(RequestDispatcherTest, MalformedRequestsBecomeErrorResponses) {
    DispatcherFixture fixture(FakeProcessRunner{});

    const json no_op = fixture.dispatcher().dispatch({{"intent", "test"}});
    EXPECT_EQ(no_op.at("status"), "error");
    EXPECT_EQ(no_op.at("code"), "invalid_request");

    const json unknown = fixture.dispatcher().dispatch({{"op", "dance"}});
    EXPECT_EQ(unknown.at("code"), "unknown_op");

    const json missing = fixture.dispatcher().dispatch({{"op", "run_command"}});
    EXPECT_EQ(missing.at("status"), "error");
    EXPECT_EQ(missing.at("code"), "missing_field");

    const json garbage = fixture.dispatcher().dispatch_line("{not json");
    EXPECT_EQ(garbage.at("status"), "error");
    EXPECT_EQ(garbage.at("code"), "invalid_json");

    const json array = fixture.dispatcher().dispatch_line("[1, 2]");
    EXPECT_EQ(array.at("code"), "invalid_request");
}

TEST(RequestDispatcherTest, DispatchLineHandlesValidJson) {
    DispatcherFixture fixture(FakeProcessRunner{});
    const json response =
        fixture.dispatcher().dispatch_line(R"({"op": "ask_command", "intent": "build"})");
    EXPECT_EQ(response.at("status"), "need_answer");
    EXPECT_TRUE(response.at("suggestions").empty());
}

}  // namespace
