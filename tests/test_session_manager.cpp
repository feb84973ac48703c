#include <gtest/gtest.h>
#include <managers/session_manager.hpp>
#include "fakes.hpp"

namespace {

JobSpec make_spec() {
    JobSpec spec;
    spec.session = "train";
    spec.command = "python train.py --epochs 3";
    spec.workdir = "/root/job";
    spec.log_path = "/root/job/logs/run.log";
    return spec;
}

} // namespace

class SessionManagerTest : public ::testing::Test {
protected:
    FakeShell shell;
    std::vector<std::string> messages;
    SessionManager sessions{shell, [this](const std::string& m) { messages.push_back(m); }};
};

TEST_F(SessionManagerTest, LaunchWithoutExistingSessionSkipsStop) {
    shell.on("tmux has-session", 1);
    EXPECT_EQ(sessions.launch_job(test_target(), make_spec()), 0);

    EXPECT_EQ(shell.count("tmux kill-session"), 0);
    EXPECT_EQ(shell.count("tmux new-session -d -s train"), 1);
    EXPECT_LT(shell.index_of("mkdir -p /root/job/logs"), shell.index_of("tmux new-session"));
}

TEST_F(SessionManagerTest, LaunchStopsRunningSessionFirst) {
    shell.on("tmux has-session", 0);
    EXPECT_EQ(sessions.launch_job(test_target(), make_spec()), 0);

    int stop = shell.index_of("tmux kill-session -t =train");
    int start = shell.index_of("tmux new-session");
    ASSERT_GE(stop, 0);
    EXPECT_LT(stop, start);
}

TEST_F(SessionManagerTest, HasSessionUsesExactMatch) {
    shell.on("has-session", 0);
    EXPECT_TRUE(sessions.has_session(test_target(), "train"));
    EXPECT_EQ(shell.calls.back().command, "tmux has-session -t =train");
    EXPECT_EQ(sessions.session_state(test_target(), "train"), SessionState::Running);
}

TEST_F(SessionManagerTest, FailedStopAbortsLaunch) {
    shell.on("tmux has-session", 0);
    shell.on("tmux kill-session", 1, "", "error connecting to /tmp/tmux-0/default");
    EXPECT_EQ(sessions.launch_job(test_target(), make_spec()), 1);
    EXPECT_EQ(shell.count("tmux new-session"), 0);
}

TEST_F(SessionManagerTest, FailedLogDirAbortsLaunch) {
    shell.on("tmux has-session", 1);
    shell.on("mkdir -p", 2, "", "mkdir: cannot create directory: Permission denied");
    EXPECT_EQ(sessions.launch_job(test_target(), make_spec()), 2);
    EXPECT_EQ(shell.count("tmux new-session"), 0);
}

TEST_F(SessionManagerTest, SessionCreationStatusIsReturned) {
    shell.on("tmux has-session", 1);
    shell.on("tmux new-session", 127, "", "bash: tmux: command not found");
    EXPECT_EQ(sessions.launch_job(test_target(), make_spec()), 127);
}

TEST_F(SessionManagerTest, SecretsNeverReachTheLoggedCommand) {
    shell.on("tmux has-session", 1);
    auto spec = make_spec();
    spec.env["API_TOKEN"] = "s3cr3t";
    spec.env["MODE"] = "fast";
    spec.env["EMPTY"] = "";
    ASSERT_EQ(sessions.launch_job(test_target(), spec), 0);

    const auto& launch = shell.calls.back();
    EXPECT_NE(launch.command.find("s3cr3t"), std::string::npos);
    EXPECT_EQ(launch.display.find("s3cr3t"), std::string::npos);
    EXPECT_NE(launch.display.find("API_TOKEN=***"), std::string::npos);
    EXPECT_NE(launch.display.find("MODE=fast"), std::string::npos);
    EXPECT_EQ(launch.command.find("EMPTY="), std::string::npos);
    for (const auto& m : messages) EXPECT_EQ(m.find("s3cr3t"), std::string::npos) << m;
}

TEST_F(SessionManagerTest, InvalidSpecsRunNothing) {
    auto spec = make_spec();
    spec.command.clear();
    EXPECT_THROW(sessions.launch_job(test_target(), spec), std::invalid_argument);

    spec = make_spec();
    spec.session = "bad.name";
    EXPECT_THROW(sessions.launch_job(test_target(), spec), std::invalid_argument);

    spec = make_spec();
    spec.env["1BAD"] = "x";
    EXPECT_THROW(sessions.launch_job(test_target(), spec), std::invalid_argument);

    RemoteTarget no_host;
    no_host.user = "ubuntu";
    EXPECT_THROW(sessions.launch_job(no_host, make_spec()), std::invalid_argument);

    EXPECT_TRUE(shell.calls.empty());
}

TEST_F(SessionManagerTest, StopReturnsTmuxStatus) {
    shell.on("kill-session", 1, "", "can't find session: =train");
    EXPECT_EQ(sessions.stop_session(test_target(), "train"), 1);
}

TEST_F(SessionManagerTest, JobExitCodeReadsLogTail) {
    shell.on("tail -n 200 /root/job/logs/run.log", 0,
             "[START] 2026-01-01T00:00:00+00:00 session=train cmd=x\nepoch 1\n"
             "[END] 2026-01-01T00:10:00+00:00 exit_code=3\n");
    auto code = sessions.job_exit_code(test_target(), "/root/job/logs/run.log");
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 3);
}

TEST_F(SessionManagerTest, JobExitCodeUnknownWhenLogUnreadable) {
    shell.on("tail", 1, "", "tail: cannot open");
    EXPECT_FALSE(sessions.job_exit_code(test_target(), "/root/job/logs/run.log").has_value());
}

TEST(SessionCommands, JobBodyGroupsCommandAndKeepsItsStatus) {
    auto body = SessionManager::build_job_body(make_spec(), false);
    EXPECT_EQ(body.rfind("cd /root/job && { ", 0), 0u);
    EXPECT_NE(body.find("{ python train.py --epochs 3; } 2>&1 | tee -a /root/job/logs/run.log"),
              std::string::npos);
    EXPECT_NE(body.find("exit_code=${PIPESTATUS[0]}"), std::string::npos);
    EXPECT_NE(body.find("[END] $(date -Is) exit_code=${exit_code}"), std::string::npos);
    EXPECT_NE(body.find("exit $exit_code; }"), std::string::npos);
}

TEST(SessionCommands, LaunchCommandIsDetached) {
    auto cmd = SessionManager::build_launch_command(make_spec(), true);
    EXPECT_EQ(cmd.rfind("tmux new-session -d -s train 'bash -lc ", 0), 0u);
}

TEST(SessionCommands, MkdirFollowsLogLocation) {
    auto spec = make_spec();
    EXPECT_EQ(SessionManager::build_mkdir_command(spec), "bash -lc 'mkdir -p /root/job/logs'");
    spec.log_path = "logs/run.log";
    EXPECT_EQ(SessionManager::build_mkdir_command(spec), "bash -lc 'cd /root/job && mkdir -p logs'");
}

TEST(SessionCommands, SensitiveKeys) {
    EXPECT_TRUE(SessionManager::is_sensitive_key("HF_TOKEN"));
    EXPECT_TRUE(SessionManager::is_sensitive_key("aws_secret_access"));
    EXPECT_TRUE(SessionManager::is_sensitive_key("ApiKey"));
    EXPECT_FALSE(SessionManager::is_sensitive_key("BATCH_SIZE"));
}

TEST(ParseExitCode, LastEndWins) {
    std::string log =
        "[START] t session=s cmd=a\n[END] t exit_code=1\n"
        "[START] t session=s cmd=a\nwork\n[END] t exit_code=0\n";
    EXPECT_EQ(parse_exit_code(log).value_or(-1), 0);
}

TEST(ParseExitCode, RunInProgressHasNoCode) {
    std::string log = "[START] t session=s cmd=a\n[END] t exit_code=1\n[START] t session=s cmd=a\n";
    EXPECT_FALSE(parse_exit_code(log).has_value());
    EXPECT_FALSE(parse_exit_code("").has_value());
}

TEST(ParseExitCode, IgnoresUnparsableEndLines) {
    EXPECT_EQ(parse_exit_code("[END] t exit_code=4\n[END] t exit_code=oops\n").value_or(-1), 4);
    EXPECT_EQ(parse_exit_code("[END] t exit_code=137\r\n").value_or(-1), 137);
}
