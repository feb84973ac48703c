#include <gtest/gtest.h>
#include <cli/preflight.hpp>
#include "fakes.hpp"
#include <sys/stat.h>

class PreflightTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "remora_preflight_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    Config config(const std::string& yaml) {
        auto r = Config::from_yaml(yaml);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};

TEST_F(PreflightTest, MissingHostAndUser) {
    auto issues = check_target(config(""));
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_FALSE(report_preflight(issues));
}

TEST_F(PreflightTest, OpenKeyPermissionsAreAnError) {
    auto key = test_dir / "id";
    write_text(key, "PRIVATE");
    chmod(key.c_str(), 0644);
    auto issues = check_target(config("ssh:\n  host: h\n  user: u\n  keyfile: " + key.string() + "\n"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_NE(issues[0].fix.find("chmod 600"), std::string::npos);
    EXPECT_FALSE(issues[0].is_hint);

    chmod(key.c_str(), 0600);
    EXPECT_TRUE(check_target(config("ssh:\n  host: h\n  user: u\n  keyfile: " + key.string() + "\n")).empty());
}

TEST_F(PreflightTest, JobNeedsCommandAndDirectories) {
    EXPECT_EQ(check_job(config("")).size(), 3u);
    EXPECT_TRUE(check_job(config("job:\n  command: make\nremote:\n  project_dir: /w\n")).empty());
}

TEST_F(PreflightTest, HintsDoNotFailTheCheck) {
    EXPECT_TRUE(report_preflight({{"rsync not found locally", "install it", true}}));
    EXPECT_TRUE(report_preflight({}));
}

TEST_F(PreflightTest, OutputsDir) {
    EXPECT_EQ(check_outputs(config("")).size(), 1u);
    EXPECT_TRUE(check_outputs(config("remote:\n  outputs_dir: /o\n")).empty());
}
