#include <gtest/gtest.h>
#include <managers/transporter.hpp>
#include <algorithm>
#include <cstdlib>
#include "fakes.hpp"

namespace {

RemoteTarget keyed_target() {
    RemoteTarget t = test_target();
    t.key_path = "/home/me/.ssh/id ed25519";
    t.port = 2222;
    return t;
}

bool has(const std::vector<std::string>& args, const std::string& v) {
    return std::find(args.begin(), args.end(), v) != args.end();
}

} // namespace

TEST(SshArgs, OptionsKeyPortThenDestination) {
    auto args = ssh_args(keyed_target(), 7);
    EXPECT_TRUE(has(args, "BatchMode=yes"));
    EXPECT_TRUE(has(args, "StrictHostKeyChecking=no"));
    EXPECT_TRUE(has(args, "ConnectTimeout=7"));
    auto key = std::find(args.begin(), args.end(), "-i");
    ASSERT_NE(key, args.end());
    EXPECT_EQ(*(key + 1), "/home/me/.ssh/id ed25519");
    auto port = std::find(args.begin(), args.end(), "-p");
    ASSERT_NE(port, args.end());
    EXPECT_EQ(*(port + 1), "2222");
    EXPECT_EQ(args.back(), "ubuntu@10.0.0.5");
}

TEST(SshArgs, NoTimeoutUnlessAsked) {
    auto args = ssh_args(test_target());
    for (const auto& a : args) EXPECT_EQ(a.find("ConnectTimeout"), std::string::npos);
}

TEST(SshArgs, RshCommandQuotesKey) {
    auto rsh = ssh_rsh_command(keyed_target());
    EXPECT_EQ(rsh.rfind("ssh -o ", 0), 0u);
    EXPECT_NE(rsh.find("-i '/home/me/.ssh/id ed25519'"), std::string::npos);
    EXPECT_NE(rsh.find("-p 2222"), std::string::npos);
}

TEST(SshArgs, ScpUsesCapitalP) {
    auto args = scp_option_args(keyed_target());
    EXPECT_TRUE(has(args, "-P"));
    EXPECT_FALSE(has(args, "-p"));
}

TEST(SshArgs, RequireTarget) {
    RemoteTarget t;
    EXPECT_THROW(require_target(t), std::invalid_argument);
    t.host = "h";
    EXPECT_THROW(require_target(t), std::invalid_argument);
    t.user = "u";
    EXPECT_NO_THROW(require_target(t));
}

TEST(RsyncArgs, UploadCopiesContentsIntoRemoteDir) {
    RsyncTransporter rsync("/usr/bin/rsync");
    auto args = rsync.upload_args(test_target(), "/tmp/in", "/root/job/inputs");
    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[0], "-az");
    EXPECT_TRUE(has(args, "--partial"));
    EXPECT_EQ(args[args.size() - 2], "/tmp/in/");
    EXPECT_EQ(args.back(), "ubuntu@10.0.0.5:/root/job/inputs/");
}

TEST(RsyncArgs, DownloadFilterRules) {
    RsyncTransporter rsync("/usr/bin/rsync");
    auto args = rsync.download_args(test_target(), "/out", "/tmp/res", "*.json");
    auto inc_dirs = std::find(args.begin(), args.end(), "--include=*/");
    auto inc_pat = std::find(args.begin(), args.end(), "--include=*.json");
    auto exc = std::find(args.begin(), args.end(), "--exclude=*");
    ASSERT_NE(inc_dirs, args.end());
    ASSERT_NE(inc_pat, args.end());
    ASSERT_NE(exc, args.end());
    EXPECT_LT(inc_dirs, inc_pat);
    EXPECT_LT(inc_pat, exc);
    EXPECT_TRUE(has(args, "--prune-empty-dirs"));
    EXPECT_EQ(args[args.size() - 2], "ubuntu@10.0.0.5:/out/");
    EXPECT_EQ(args.back(), "/tmp/res/");
}

TEST(RsyncArgs, DownloadWithoutFilterHasNoRules) {
    RsyncTransporter rsync("/usr/bin/rsync");
    auto args = rsync.download_args(test_target(), "/out/", "/tmp/res", "");
    for (const auto& a : args) EXPECT_EQ(a.rfind("--include", 0), std::string::npos);
    EXPECT_EQ(args[args.size() - 2], "ubuntu@10.0.0.5:/out/");
}

TEST(RsyncArgs, FileProgressOnlyWhenVisible) {
    RsyncTransporter rsync("/usr/bin/rsync");
    EXPECT_TRUE(has(rsync.file_args(test_target(), "/l/run.log", "/tmp/run.log", false), "--progress"));
    EXPECT_FALSE(has(rsync.file_args(test_target(), "/l/run.log", "/tmp/run.log", true), "--progress"));
}

TEST(ScpArgs, ItemUploadAndTreeDownload) {
    ScpTransporter scp;
    auto up = scp.item_upload_args(keyed_target(), "/tmp/in/data", "/root/in");
    EXPECT_TRUE(has(up, "-r"));
    EXPECT_EQ(up[up.size() - 2], "/tmp/in/data");
    EXPECT_EQ(up.back(), "ubuntu@10.0.0.5:/root/in/");

    auto down = scp.tree_download_args(test_target(), "/out//", "/tmp/res/.staging");
    EXPECT_EQ(down[down.size() - 2], "ubuntu@10.0.0.5:/out");
    EXPECT_EQ(down.back(), "/tmp/res/.staging");
}

class MergeTreeTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "remora_merge_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(MergeTreeTest, MergesDirectoriesAndReplacesFiles) {
    write_text(test_dir / "dst/keep.txt", "old");
    write_text(test_dir / "dst/sub/a.txt", "old a");
    write_text(test_dir / "src/sub/a.txt", "new a");
    write_text(test_dir / "src/sub/b.txt", "b");
    write_text(test_dir / "src/top.txt", "top");

    merge_tree(test_dir / "src", test_dir / "dst");

    EXPECT_FALSE(fs::exists(test_dir / "src"));
    EXPECT_EQ(read_text(test_dir / "dst/keep.txt"), "old");
    EXPECT_EQ(read_text(test_dir / "dst/sub/a.txt"), "new a");
    EXPECT_EQ(read_text(test_dir / "dst/sub/b.txt"), "b");
    EXPECT_EQ(read_text(test_dir / "dst/top.txt"), "top");
}

// PATH points at an empty directory so the override and RSYNC_PATH
// fallbacks are reached whatever is installed on the machine.
class RsyncLookupTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_path;
    std::string saved_rsync_path;
    bool had_rsync_path = false;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "remora_rsync_lookup_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "empty_bin");

        if (const char* p = std::getenv("PATH")) saved_path = p;
        if (const char* r = std::getenv("RSYNC_PATH")) {
            saved_rsync_path = r;
            had_rsync_path = true;
        }
        setenv("PATH", (test_dir / "empty_bin").c_str(), 1);
        unsetenv("RSYNC_PATH");
    }

    void TearDown() override {
        setenv("PATH", saved_path.c_str(), 1);
        if (had_rsync_path) {
            setenv("RSYNC_PATH", saved_rsync_path.c_str(), 1);
        } else {
            unsetenv("RSYNC_PATH");
        }
        fs::remove_all(test_dir);
    }

    fs::path fake_rsync(const std::string& name, bool executable) {
        fs::path p = test_dir / name;
        write_text(p, "#!/bin/sh\nexit 0\n");
        fs::permissions(p, executable ? fs::perms::owner_all : fs::perms::owner_read);
        return p;
    }
};

TEST_F(RsyncLookupTest, OverridePathMustBeExecutable) {
    EXPECT_FALSE(find_local_rsync("/nonexistent/rsync").has_value());
    EXPECT_TRUE(make_primary_transporter("/nonexistent/rsync") == nullptr);

    auto plain = fake_rsync("rsync-noexec", false);
    EXPECT_FALSE(find_local_rsync(plain.string()).has_value());
}

TEST_F(RsyncLookupTest, OverridePathUsedWhenNotOnPath) {
    auto tool = fake_rsync("rsync-custom", true);
    auto found = find_local_rsync(tool.string());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->string(), tool.string());

    auto t = make_primary_transporter(tool.string());
    ASSERT_TRUE(t != nullptr);
    EXPECT_EQ(t->name(), "rsync");
}

TEST_F(RsyncLookupTest, EnvironmentFallbackComesLast) {
    auto from_env = fake_rsync("rsync-env", true);
    setenv("RSYNC_PATH", from_env.c_str(), 1);
    ASSERT_TRUE(find_local_rsync().has_value());
    EXPECT_EQ(find_local_rsync()->string(), from_env.string());

    auto from_config = fake_rsync("rsync-config", true);
    EXPECT_EQ(find_local_rsync(from_config.string())->string(), from_config.string());
}
