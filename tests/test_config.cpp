#include <gtest/gtest.h>
#include <core/config.hpp>
#include "fakes.hpp"
#include <cstdlib>

TEST(ConfigYaml, EmptyDocumentGivesDefaults) {
    auto r = Config::from_yaml("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.remote().tmux_session, "remora");
    EXPECT_EQ(c.transfer().retries, 3);
    EXPECT_EQ(c.transfer().retry_backoff_sec, 3);
    EXPECT_TRUE(c.transfer().verify_manifest);
    EXPECT_EQ(c.transfer().manifest_name, "_manifest.txt");
    EXPECT_EQ(c.logging().mirror_interval_sec, 3);
    EXPECT_EQ(c.logging().filename, "run.log");
    EXPECT_TRUE(c.logging().mirror_on_view);
    EXPECT_EQ(c.cleanup().keep_log_backups, 5);
    EXPECT_FALSE(c.cleanup().remove_remote_outputs);
    EXPECT_EQ(c.ssh().connect_timeout, 10);
    EXPECT_NE(c.ssh().test_command.find("SSH OK"), std::string::npos);
    EXPECT_FALSE(c.ssh().port.has_value());
}

TEST(ConfigYaml, DirectoriesDeriveFromProjectDir) {
    auto r = Config::from_yaml("remote:\n  project_dir: /root/job/\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.remote().project_dir, "/root/job");
    EXPECT_EQ(r.value.remote().inputs_dir, "/root/job/inputs");
    EXPECT_EQ(r.value.remote().outputs_dir, "/root/job/outputs");
    EXPECT_EQ(r.value.remote().log_file, "/root/job/logs/run.log");
}

TEST(ConfigYaml, ExplicitDirectoriesWin) {
    auto r = Config::from_yaml(
        "remote:\n  project_dir: /root/job\n  outputs_dir: /data/out\n  log_file: /var/log/j.log\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.remote().outputs_dir, "/data/out");
    EXPECT_EQ(r.value.remote().log_file, "/var/log/j.log");
    EXPECT_EQ(r.value.remote().inputs_dir, "/root/job/inputs");
}

TEST(ConfigYaml, BadNumbersFallBackToDefaults) {
    auto r = Config::from_yaml(
        "ssh:\n  port: 70000\n  connect_timeout: soon\n"
        "transfer:\n  retries: lots\n  retry_backoff_sec: -4\n"
        "logging:\n  mirror_interval_sec: 0\n"
        "cleanup:\n  keep_log_backups: 0\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.ssh().port.has_value());
    EXPECT_EQ(r.value.ssh().connect_timeout, 10);
    EXPECT_EQ(r.value.transfer().retries, 3);
    EXPECT_EQ(r.value.transfer().retry_backoff_sec, 3);
    EXPECT_EQ(r.value.logging().mirror_interval_sec, 3);
    EXPECT_EQ(r.value.cleanup().keep_log_backups, 5);
}

TEST(ConfigYaml, ZeroRetriesAllowed) {
    auto r = Config::from_yaml("transfer:\n  retries: 0\n  retry_backoff_sec: 0\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.transfer().retries, 0);
    EXPECT_EQ(r.value.transfer().retry_backoff_sec, 0);
}

TEST(ConfigYaml, JobEnvAndTarget) {
    auto r = Config::from_yaml(
        "ssh:\n  host: 1.2.3.4\n  user: ubuntu\n  port: 2200\n  keyfile: /keys/id\n"
        "job:\n  command: python train.py\n  env:\n    HF_TOKEN: abc\n    EPOCHS: 3\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.job().command, "python train.py");
    EXPECT_EQ(r.value.job().env.at("HF_TOKEN"), "abc");
    EXPECT_EQ(r.value.job().env.at("EPOCHS"), "3");

    auto t = r.value.target();
    EXPECT_EQ(t.destination(), "ubuntu@1.2.3.4");
    EXPECT_EQ(t.port.value_or(0), 2200);
    EXPECT_EQ(t.key_path.value_or(""), "/keys/id");
}

TEST(ConfigYaml, TargetNeedsHostAndUser) {
    auto r = Config::from_yaml("ssh:\n  user: ubuntu\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_THROW(r.value.target(), std::invalid_argument);
}

TEST(ConfigYaml, InvalidManifestNameFallsBack) {
    auto r = Config::from_yaml("transfer:\n  manifest_name: sub/m.txt\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.transfer().manifest_name, "_manifest.txt");
}

TEST(ConfigYaml, MalformedInputIsAnError) {
    EXPECT_TRUE(Config::from_yaml("ssh: [unclosed").is_err());
    EXPECT_TRUE(Config::from_yaml("- a\n- b\n").is_err());
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "remora_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "project");
        const char* home = std::getenv("HOME");
        saved_home = home ? home : "";
        setenv("HOME", test_dir.c_str(), 1);
        unsetenv("REMORA_HOST");
        unsetenv("REMORA_USER");
        unsetenv("REMORA_KEYFILE");
    }

    void TearDown() override {
        setenv("HOME", saved_home.c_str(), 1);
        unsetenv("REMORA_HOST");
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigFileTest, ProjectFileOverridesGlobalKeys) {
    write_text(test_dir / ".remora/config.yaml",
               "ssh:\n  host: global.example\n  user: ubuntu\ntransfer:\n  retries: 5\n");
    write_text(test_dir / "project/remora.yaml", "ssh:\n  host: project.example\n");

    auto r = Config::load(test_dir / "project");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().host, "project.example");
    EXPECT_EQ(r.value.ssh().user, "ubuntu");
    EXPECT_EQ(r.value.transfer().retries, 5);
    EXPECT_EQ(r.value.source().string(), (test_dir / "project/remora.yaml").string());
}

TEST_F(ConfigFileTest, EnvironmentOverridesFile) {
    write_text(test_dir / ".remora/config.yaml", "ssh:\n  host: a\n  user: b\n");
    setenv("REMORA_HOST", "from-env", 1);
    auto r = Config::load(test_dir / "project");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.ssh().host, "from-env");
}

TEST_F(ConfigFileTest, MissingConfigIsAnError) {
    EXPECT_TRUE(Config::load(test_dir / "project").is_err());
    EXPECT_TRUE(Config::load_file(test_dir / "nope.yaml").is_err());
}

TEST_F(ConfigFileTest, DefaultConfigIsWrittenOnceAndLoads) {
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());
    auto r = Config::load_file(get_global_config_path());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.remote().outputs_dir, "/root/remora_job/outputs");
    EXPECT_EQ(r.value.ssh().keyfile, (test_dir / ".ssh/id_ed25519").string());
}

TEST_F(ConfigFileTest, KeyfileTildeExpands) {
    auto r = Config::from_yaml("ssh:\n  keyfile: ~/.ssh/k\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.ssh().keyfile, (test_dir / ".ssh/k").string());
}
