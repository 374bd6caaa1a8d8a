#include <noclaw/worker/worker.hpp>
#include <noclaw/worker/backend.hpp>
#include <noclaw/sandbox/output.hpp>
#include <noclaw/sandbox/process.hpp>
#include <noclaw/core/config.hpp>

#include "test_helpers.hpp"

using namespace noclaw;
using noclaw::test::TempDir;

namespace {

// Records what it was asked and answers with a canned reply
class CannedBackend : public CompletionBackend {
public:
    CannedBackend() : fail_(false), calls_(0) {}

    const char* name() const { return "canned"; }

    CompletionResult complete(const std::string& prompt, const CompletionOptions& opts) {
        ++calls_;
        last_prompt_ = prompt;
        last_opts_ = opts;
        if (fail_) {
            return CompletionResult::fail("backend unavailable");
        }
        CompletionResult r = CompletionResult::ok(reply_, "canned-model");
        r.tokens_used = 17;
        return r;
    }

    std::string reply_;
    bool fail_;
    int calls_;
    std::string last_prompt_;
    CompletionOptions last_opts_;
};

Json request(const std::string& prompt, const std::string& user = "alice") {
    Json r = Json::object();
    r["prompt"] = prompt;
    r["user"] = user;
    r["context"] = Json::object();
    r["history"] = Json::array();
    return r;
}

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(tmp_.path().empty());
        workspace_ = tmp_.mkdir("ws");
    }

    TempDir tmp_;
    std::string workspace_;
    CannedBackend backend_;
};

TEST(WorkerPromptTest, UserHistoryPromptAndContext) {
    Json history = Json::array();
    Json first = Json::object();
    first["message"] = "hello";
    first["response"] = "hi there";
    history.push_back(first);
    Json second = Json::object();
    second["message"] = "what's up";
    second["response"] = "";
    history.push_back(second);

    Json context = Json::object();
    context["channel"] = "telegram";
    context["tz"] = "UTC";

    std::string prompt = Worker::enhance_prompt("What is 2+2?", context, "alice", history);
    EXPECT_EQ("[User: alice]\n"
              "Recent conversation:\n"
              "  User: hello\n"
              "  Assistant: hi there\n"
              "  User: what's up\n"
              "\n"
              "What is 2+2?\n"
              "\n"
              "Context:\n"
              "channel: telegram\n"
              "tz: UTC",
              prompt);
}

TEST(WorkerPromptTest, BarePromptForUnknownUser) {
    EXPECT_EQ("ping", Worker::enhance_prompt("ping", Json::object(), "unknown", Json::array()));
}

TEST(WorkerPromptTest, LongResponsesAreTruncated) {
    Json history = Json::array();
    Json entry = Json::object();
    entry["message"] = "m";
    entry["response"] = std::string(500, 'r');
    history.push_back(entry);

    std::string prompt = Worker::enhance_prompt("p", Json::object(), "unknown", history);
    EXPECT_NE(std::string::npos, prompt.find("  Assistant: " + std::string(200, 'r') + "\n"));
    EXPECT_EQ(std::string::npos, prompt.find(std::string(201, 'r')));
}

TEST(WorkerScheduleTest, ExplicitScheduleLines) {
    Json tasks = Worker::extract_scheduled_tasks(
        "Sure.\n"
        "SCHEDULE: 0 */2 Check the build status and report failures to the team channel\n"
        "  SCHEDULE: @daily water the plants\n"
        "SCHEDULE: incomplete\n");

    ASSERT_EQ(2u, tasks.size());
    EXPECT_EQ("0", tasks[0]["cron"]);
    EXPECT_EQ("*/2 Check the build status and report failures to the team channel", tasks[0]["prompt"]);
    EXPECT_EQ(50u, tasks[0]["description"].get<std::string>().size());
    EXPECT_EQ("@daily", tasks[1]["cron"]);
    EXPECT_EQ("water the plants", tasks[1]["prompt"]);
}

TEST(WorkerScheduleTest, DailyNineAmReminder) {
    Json tasks = Worker::extract_scheduled_tasks("I will remind you daily at 9am.");
    ASSERT_EQ(1u, tasks.size());
    EXPECT_EQ("0 9 * * *", tasks[0]["cron"]);
    EXPECT_EQ("Daily 9am reminder", tasks[0]["description"]);
}

TEST(WorkerScheduleTest, NothingToSchedule) {
    EXPECT_TRUE(Worker::extract_scheduled_tasks("The answer is 4.").empty());
    EXPECT_TRUE(Worker::extract_scheduled_tasks("I will remind you at 9am.").empty());
}

TEST_F(WorkerTest, SuccessfulRunWritesSidecar) {
    backend_.reply_ = "Done.\nSCHEDULE: 0 8 * * 1 weekly review";
    Worker worker(workspace_, backend_);

    Json doc = worker.run(request("plan my week"));
    EXPECT_TRUE(doc["success"].get<bool>());
    EXPECT_EQ(backend_.reply_, doc["response"]);
    EXPECT_EQ("canned-model", doc["model_used"]);
    EXPECT_EQ(17, doc["tokens_used"]);
    EXPECT_EQ("alice", doc["user"]);
    ASSERT_EQ(1u, doc["scheduled_tasks"].size());

    std::string sidecar;
    ASSERT_TRUE(read_file(sidecar_path(workspace_), sidecar));
    Json parsed = Json::parse(sidecar);
    EXPECT_EQ(doc["scheduled_tasks"], parsed["scheduled_tasks"]);
}

TEST_F(WorkerTest, LoadsInstructionsAndMemory) {
    tmp_.write("ws/CLAUDE.md", "You are terse.");
    tmp_.write("ws/memory.md", "\nlikes tea\n");
    backend_.reply_ = "ok";
    Worker worker(workspace_, backend_);

    worker.run(request("hi"));
    EXPECT_EQ("You are terse.\n\n## Remembered Facts\nlikes tea", backend_.last_opts_.system_prompt);
    EXPECT_EQ("[User: alice]\nhi", backend_.last_prompt_);
}

TEST_F(WorkerTest, NoSystemPromptWithoutFiles) {
    backend_.reply_ = "ok";
    Worker worker(workspace_, backend_);
    worker.run(request("hi"));
    EXPECT_TRUE(backend_.last_opts_.system_prompt.empty());
}

TEST_F(WorkerTest, ModelHintIsPassedOn) {
    backend_.reply_ = "ok";
    Worker worker(workspace_, backend_);
    Json req = request("hi");
    req["model_hint"] = "high";
    worker.run(req);
    EXPECT_EQ(ModelHint::HIGH, backend_.last_opts_.model_hint);
}

TEST_F(WorkerTest, BackendFailureIsReported) {
    backend_.fail_ = true;
    Worker worker(workspace_, backend_);

    Json doc = worker.run(request("hi", "bob"));
    EXPECT_FALSE(doc["success"].get<bool>());
    EXPECT_EQ("backend unavailable", doc["error"]);
    EXPECT_EQ("Error executing request: backend unavailable", doc["response"]);
    EXPECT_EQ("bob", doc["user"]);
    EXPECT_FALSE(file_exists(sidecar_path(workspace_)));
}

TEST_F(WorkerTest, NonObjectRequest) {
    Worker worker(workspace_, backend_);
    Json doc = worker.run(Json::array());
    EXPECT_FALSE(doc["success"].get<bool>());
    EXPECT_EQ(0, backend_.calls_);
}

TEST(CommandBackendTest, BuildsArgvFromOptions) {
    std::vector<std::string> command;
    command.push_back("claude");
    command.push_back("--print");
    CommandBackend backend(command, 10);

    CompletionOptions opts;
    EXPECT_EQ(command, backend.build_argv(opts));

    opts.system_prompt = "be brief";
    opts.model_hint = ModelHint::LOW;
    std::vector<std::string> argv = backend.build_argv(opts);
    ASSERT_EQ(6u, argv.size());
    EXPECT_EQ("--append-system-prompt", argv[2]);
    EXPECT_EQ("be brief", argv[3]);
    EXPECT_EQ("--model", argv[4]);
    EXPECT_EQ("haiku", argv[5]);
}

TEST(CommandBackendTest, FlagsAndModelsFromConfig) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"worker\": {\"agent_command\": [\"agent\"], \"model_flag\": \"-m\","
        " \"system_prompt_flag\": \"\", \"models\": {\"mid\": \"claude-sonnet-4-5\"}}}"));
    std::unique_ptr<CommandBackend> backend = CommandBackend::from_config(cfg);

    CompletionOptions opts;
    opts.system_prompt = "ignored";
    opts.model_hint = ModelHint::MID;
    std::vector<std::string> argv = backend->build_argv(opts);
    ASSERT_EQ(3u, argv.size());
    EXPECT_EQ("agent", argv[0]);
    EXPECT_EQ("-m", argv[1]);
    EXPECT_EQ("claude-sonnet-4-5", argv[2]);
}

TEST(CommandBackendTest, OversizedTimeoutIsClamped) {
    Config cfg;
    cfg.set_int("worker.agent_timeout", 2200000);
    EXPECT_EQ(MAX_TIMEOUT_SECONDS, CommandBackend::from_config(cfg)->timeout_seconds());

    CommandBackend direct(std::vector<std::string>(1, "cat"), 5000000);
    EXPECT_EQ(MAX_TIMEOUT_SECONDS, direct.timeout_seconds());
}

TEST(CommandBackendTest, PromptGoesThroughStdin) {
    CommandBackend backend(std::vector<std::string>(1, "cat"), 10);
    backend.set_system_prompt_flag("");
    backend.set_model_flag("");

    CompletionResult r = backend.complete("echo me back\n");
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ("echo me back", r.content);
    EXPECT_EQ("auto", r.model);
}

TEST(CommandBackendTest, FailingCommand) {
    std::vector<std::string> command;
    command.push_back("/bin/sh");
    command.push_back("-c");
    command.push_back("echo 'not logged in' >&2; exit 1");
    CommandBackend backend(command, 10);
    backend.set_system_prompt_flag("");
    backend.set_model_flag("");

    CompletionResult r = backend.complete("hi");
    EXPECT_FALSE(r.success);
    EXPECT_NE(std::string::npos, r.error.find("not logged in"));
}

TEST(CommandBackendTest, MissingCommand) {
    CommandBackend backend(std::vector<std::string>(1, "/nonexistent/agent-cli"), 10);
    CompletionResult r = backend.complete("hi");
    EXPECT_FALSE(r.success);
    EXPECT_NE(std::string::npos, r.error.find("cannot run"));
}

TEST_F(WorkerTest, EndToEndWithCommandBackend) {
    CommandBackend backend(std::vector<std::string>(1, "cat"), 10);
    backend.set_system_prompt_flag("");
    backend.set_model_flag("");
    Worker worker(workspace_, backend);

    Json doc = worker.run(request("SCHEDULE: @hourly stretch", "unknown"));
    EXPECT_TRUE(doc["success"].get<bool>());
    EXPECT_EQ("SCHEDULE: @hourly stretch", doc["response"]);
    ASSERT_EQ(1u, doc["scheduled_tasks"].size());
    EXPECT_EQ("@hourly", doc["scheduled_tasks"][0]["cron"]);
}

} // anonymous namespace
