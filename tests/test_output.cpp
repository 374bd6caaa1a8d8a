#include <noclaw/sandbox/output.hpp>

#include "test_helpers.hpp"

using namespace noclaw;
using noclaw::test::TempDir;

namespace {

ProcessResult completed(const std::string& out, int exit_code = 0) {
    ProcessResult p;
    p.state = ProcessState::COMPLETED;
    p.exit_code = exit_code;
    p.out = out;
    p.elapsed_ms = 42;
    return p;
}

class OutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(tmp_.path().empty());
        workspace_ = tmp_.mkdir("ws");
    }

    void write_sidecar(const std::string& content) {
        tmp_.write("ws/.noclaw_output.json", content);
    }

    bool sidecar_exists() const {
        return file_exists(sidecar_path(workspace_));
    }

    TempDir tmp_;
    std::string workspace_;
};

TEST_F(OutputTest, PlainResponse) {
    ExecutionResult r = interpret(completed("{\"response\": \"4\"}"), workspace_);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ("4", r.response_text);
    EXPECT_FALSE(r.has_tokens_used());
    EXPECT_TRUE(r.side_effects.empty());
    EXPECT_EQ(42, r.elapsed_ms);
}

TEST_F(OutputTest, MetadataIsRead) {
    ExecutionResult r = interpret(completed(
        "{\"response\": \"ok\", \"model_used\": \"sonnet\", \"tokens_used\": 321, \"success\": true}"),
        workspace_);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ("sonnet", r.model_used);
    EXPECT_EQ(321, r.tokens_used);
}

TEST_F(OutputTest, NullTokensStayUnknown) {
    ExecutionResult r = interpret(completed("{\"response\": \"ok\", \"tokens_used\": null}"), workspace_);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.has_tokens_used());
    EXPECT_TRUE(r.to_json()["tokens_used"].is_null());
}

TEST_F(OutputTest, TimeoutDiscardsPartialOutput) {
    write_sidecar("{\"scheduled_tasks\": [{\"cron\": \"* * * * *\"}]}");
    ProcessResult p = completed("{\"response\": \"half");
    p.state = ProcessState::TIMED_OUT;
    p.force_killed = true;

    ExecutionResult r = interpret(p, workspace_);
    EXPECT_EQ(ErrorKind::TIMEOUT, r.error_kind);
    EXPECT_TRUE(r.response_text.empty());
    EXPECT_TRUE(r.raw_output.empty());
    EXPECT_FALSE(sidecar_exists());
}

TEST_F(OutputTest, NonZeroExitKeepsExactStdout) {
    write_sidecar("{\"scheduled_tasks\": []}");
    ProcessResult p = completed("partial", 3);
    p.err = "boom\n";

    ExecutionResult r = interpret(p, workspace_);
    EXPECT_EQ(ErrorKind::NON_ZERO_EXIT, r.error_kind);
    EXPECT_EQ(3, r.exit_code);
    EXPECT_EQ("partial", r.raw_output);
    EXPECT_EQ("boom\n", r.stderr_output);
    EXPECT_NE(std::string::npos, r.error_message.find("boom"));
    EXPECT_TRUE(r.response_text.empty());
    EXPECT_FALSE(sidecar_exists());
}

TEST_F(OutputTest, NonZeroExitWinsOverValidJson) {
    ExecutionResult r = interpret(completed("{\"response\": \"looks fine\"}", 1), workspace_);
    EXPECT_EQ(ErrorKind::NON_ZERO_EXIT, r.error_kind);
    EXPECT_TRUE(r.response_text.empty());
}

TEST_F(OutputTest, SpawnFailure) {
    ProcessResult p;
    p.spawn_failed = true;
    p.spawn_error = "cannot execute docker: No such file or directory";

    ExecutionResult r = interpret(p, workspace_);
    EXPECT_EQ(ErrorKind::EXECUTION_FAILED, r.error_kind);
    EXPECT_NE(std::string::npos, r.error_message.find("docker"));
}

TEST_F(OutputTest, MalformedOutputKeepsRawText) {
    const char* cases[] = {
        "not json at all",
        "",
        "[1, 2]",
        "{\"answer\": \"4\"}",
        "{\"response\": 4}",
    };
    for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
        write_sidecar("{\"scheduled_tasks\": []}");
        ExecutionResult r = interpret(completed(cases[i]), workspace_);
        EXPECT_EQ(ErrorKind::MALFORMED_OUTPUT, r.error_kind) << cases[i];
        EXPECT_EQ(cases[i], r.raw_output);
        EXPECT_TRUE(r.response_text.empty());
        EXPECT_FALSE(sidecar_exists()) << cases[i];
    }
}

TEST_F(OutputTest, TaskReportedFailure) {
    ExecutionResult r = interpret(completed(
        "{\"response\": \"Error executing request: quota\", \"error\": \"quota\", \"success\": false}"),
        workspace_);
    EXPECT_EQ(ErrorKind::TASK_FAILED, r.error_kind);
    EXPECT_EQ("quota", r.error_message);
    EXPECT_TRUE(r.response_text.empty());
}

TEST_F(OutputTest, SidecarTasksAreMergedAndFileDeleted) {
    write_sidecar("{\"scheduled_tasks\": [{\"cron\": \"0 9 * * *\", \"prompt\": \"standup\"}]}");

    ExecutionResult r = interpret(completed("{\"response\": \"done\"}"), workspace_);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(1u, r.side_effects.size());
    EXPECT_EQ("0 9 * * *", r.side_effects[0]["cron"]);
    EXPECT_FALSE(sidecar_exists());
}

TEST_F(OutputTest, SidecarTasksReplaceStdoutTasks) {
    write_sidecar("{\"scheduled_tasks\": [{\"cron\": \"0 9 * * *\", \"prompt\": \"p\"}]}");

    ExecutionResult r = interpret(completed(
        "{\"response\": \"done\", \"scheduled_tasks\": ["
        "{\"cron\": \"0 8 * * 1\", \"prompt\": \"q\"}]}"), workspace_);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(1u, r.side_effects.size());
    EXPECT_EQ("p", r.side_effects[0]["prompt"]);
}

TEST_F(OutputTest, EmptySidecarListClearsStdoutTasks) {
    write_sidecar("{\"scheduled_tasks\": []}");
    ExecutionResult r = interpret(completed(
        "{\"response\": \"done\", \"scheduled_tasks\": [{\"cron\": \"@daily\"}]}"), workspace_);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.side_effects.empty());
}

TEST_F(OutputTest, StdoutTasksKeptWithoutSidecarList) {
    write_sidecar("{\"note\": \"nothing scheduled here\"}");
    ExecutionResult r = interpret(completed(
        "{\"response\": \"done\", \"scheduled_tasks\": [{\"cron\": \"@daily\"}, {\"cron\": \"@daily\"}]}"),
        workspace_);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(1u, r.side_effects.size());
    EXPECT_EQ("@daily", r.side_effects[0]["cron"]);
    EXPECT_FALSE(sidecar_exists());
}

TEST_F(OutputTest, UnreadableSidecarIsIgnored) {
    write_sidecar("{{{ garbage");
    ExecutionResult r = interpret(completed("{\"response\": \"fine\"}"), workspace_);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ("fine", r.response_text);
    EXPECT_TRUE(r.side_effects.empty());
    EXPECT_FALSE(sidecar_exists());
}

TEST_F(OutputTest, SidecarWithWrongShapeIsIgnored) {
    write_sidecar("{\"scheduled_tasks\": \"tomorrow\"}");
    ExecutionResult r = interpret(completed("{\"response\": \"fine\"}"), workspace_);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.side_effects.empty());
    EXPECT_FALSE(sidecar_exists());
}

TEST_F(OutputTest, ConsumeSidecarWithoutFile) {
    EXPECT_TRUE(consume_sidecar(workspace_).is_null());
}

TEST_F(OutputTest, ResultDocumentShapes) {
    ExecutionResult ok = interpret(completed("{\"response\": \"hi\", \"model_used\": \"m\"}"), workspace_);
    Json doc = ok.to_json();
    EXPECT_TRUE(doc["success"].get<bool>());
    EXPECT_EQ("hi", doc["response"]);
    EXPECT_EQ("m", doc["model_used"]);

    ExecutionResult bad = interpret(completed("x", 2), workspace_);
    Json err = bad.to_json();
    EXPECT_FALSE(err["success"].get<bool>());
    EXPECT_EQ("non_zero_exit", err["error_kind"]);
    EXPECT_EQ(2, err["exit_code"]);
    EXPECT_EQ("x", err["raw_output"]);
    EXPECT_FALSE(err.contains("response"));
}

} // anonymous namespace
