#include <gtest/gtest.h>
#include <managers/transfer_engine.hpp>
#include "fakes.hpp"

class TransferEngineTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeShell shell;
    std::vector<long long> sleeps;
    std::vector<std::string> messages;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "remora_transfer_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    TransferEngine make_engine(std::unique_ptr<Transporter> primary,
                               std::unique_ptr<Transporter> fallback) {
        return TransferEngine(shell, std::move(primary), std::move(fallback),
                              [this](long long s) { sleeps.push_back(s); },
                              [this](const std::string& m) { messages.push_back(m); });
    }

    int count_messages(const std::string& needle) const {
        int n = 0;
        for (const auto& m : messages) {
            if (m.find(needle) != std::string::npos) ++n;
        }
        return n;
    }
};

TEST_F(TransferEngineTest, FallbackFiltersLocallyAndKeepsManifest) {
    auto scp = std::make_unique<FakeTransporter>("scp", false);
    scp->remote_files = {
        {"a.json", "{\"a\":1}"},
        {"b.txt", "text"},
        {"sub/c.json", "{}"},
        {"sub/d.log", "log"},
        {"_manifest.txt", "7\ta.json\n2\tsub/c.json\n"},
    };
    scp->remote_singles["/out/_manifest.txt"] = "7\ta.json\n2\tsub/c.json\n";
    FakeTransporter* scp_raw = scp.get();
    auto engine = make_engine(nullptr, std::move(scp));

    DownloadOptions options;
    options.filter = "*.json";
    auto local = test_dir / "results";
    auto result = engine.download_tree(test_target(), "/out", local, options);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.checked, 2);
    EXPECT_TRUE(fs::exists(local / "a.json"));
    EXPECT_TRUE(fs::exists(local / "sub/c.json"));
    EXPECT_TRUE(fs::exists(local / "_manifest.txt"));
    EXPECT_FALSE(fs::exists(local / "b.txt"));
    EXPECT_FALSE(fs::exists(local / "sub/d.log"));
    EXPECT_EQ(scp_raw->tree_calls, 1);
    EXPECT_EQ(count_messages("rsync not available"), 1);
    EXPECT_EQ(shell.count("-name '*.json'"), 1);
}

TEST_F(TransferEngineTest, DegradedWarningOncePerCall) {
    auto scp = std::make_unique<FakeTransporter>("scp", false);
    scp->remote_files = {{"x.bin", "1"}};
    auto engine = make_engine(nullptr, std::move(scp));

    DownloadOptions options;
    options.verify_manifest = false;
    engine.download_tree(test_target(), "/out", test_dir / "r1", options);
    engine.download_tree(test_target(), "/out", test_dir / "r2", options);
    EXPECT_EQ(count_messages("rsync not available"), 2);
    EXPECT_FALSE(engine.primary_available());
}

TEST_F(TransferEngineTest, RetriesWithExponentialBackoff) {
    auto rsync = std::make_unique<FakeTransporter>("rsync", true);
    rsync->tree_failures = 2;
    rsync->remote_files = {{"model.pt", "weights"}};
    FakeTransporter* raw = rsync.get();
    auto engine = make_engine(std::move(rsync), std::make_unique<FakeTransporter>("scp", false));

    DownloadOptions options;
    options.verify_manifest = false;
    options.max_retries = 3;
    options.backoff_base = 1;
    auto result = engine.download_tree(test_target(), "/out", test_dir / "r", options);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(raw->tree_calls, 3);
    EXPECT_EQ(sleeps, (std::vector<long long>{1, 2}));
    EXPECT_TRUE(fs::exists(test_dir / "r/model.pt"));
    EXPECT_EQ(count_messages("rsync not available"), 0);
}

TEST_F(TransferEngineTest, ExhaustedRetriesPropagate) {
    auto rsync = std::make_unique<FakeTransporter>("rsync", true);
    rsync->tree_failures = 100;
    FakeTransporter* raw = rsync.get();
    auto engine = make_engine(std::move(rsync), std::make_unique<FakeTransporter>("scp", false));

    DownloadOptions options;
    options.verify_manifest = false;
    options.max_retries = 1;
    options.backoff_base = 5;
    EXPECT_THROW(engine.download_tree(test_target(), "/out", test_dir / "r", options), TransferError);
    EXPECT_EQ(raw->tree_calls, 2);
    EXPECT_EQ(sleeps, (std::vector<long long>{5}));
}

TEST_F(TransferEngineTest, ManifestGenerationFailureIsReported) {
    shell.on("find .", 1, "", "cd: /out: No such file or directory");
    auto rsync = std::make_unique<FakeTransporter>("rsync", true);
    rsync->remote_files = {{"a.txt", "x"}};
    FakeTransporter* raw = rsync.get();
    auto engine = make_engine(std::move(rsync), std::make_unique<FakeTransporter>("scp", false));

    auto result = engine.download_tree(test_target(), "/out", test_dir / "r", DownloadOptions{});
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.manifest_found);
    EXPECT_EQ(raw->file_calls, 0);
    EXPECT_EQ(raw->tree_calls, 1);
}

TEST_F(TransferEngineTest, SizeMismatchFailsVerification) {
    auto rsync = std::make_unique<FakeTransporter>("rsync", true);
    rsync->remote_files = {{"a.txt", "short"}};
    rsync->remote_singles["/out/_manifest.txt"] = "100\ta.txt\n";
    auto engine = make_engine(std::move(rsync), std::make_unique<FakeTransporter>("scp", false));

    auto result = engine.download_tree(test_target(), "/out", test_dir / "r", DownloadOptions{});
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.size_mismatch.size(), 1u);
    EXPECT_EQ(result.size_mismatch[0].expected, 100);
    EXPECT_EQ(result.size_mismatch[0].actual, 5);
}

TEST_F(TransferEngineTest, InvalidFilterRejectedBeforeAnyTransfer) {
    auto rsync = std::make_unique<FakeTransporter>("rsync", true);
    FakeTransporter* raw = rsync.get();
    auto engine = make_engine(std::move(rsync), std::make_unique<FakeTransporter>("scp", false));

    DownloadOptions options;
    options.filter = "[unterminated";
    EXPECT_THROW(engine.download_tree(test_target(), "/out", test_dir / "r", options),
                 std::invalid_argument);
    EXPECT_EQ(raw->tree_calls, 0);
    EXPECT_TRUE(shell.calls.empty());
}

TEST_F(TransferEngineTest, UploadFallsBackWhenPrimaryFails) {
    write_text(test_dir / "in/data.csv", "1,2,3");
    auto rsync = std::make_unique<FakeTransporter>("rsync", true);
    rsync->upload_fails = true;
    auto scp = std::make_unique<FakeTransporter>("scp", false);
    FakeTransporter* rsync_raw = rsync.get();
    FakeTransporter* scp_raw = scp.get();
    auto engine = make_engine(std::move(rsync), std::move(scp));

    engine.upload_tree(test_target(), test_dir / "in", "/root/job/inputs", {"/root/job/outputs"});

    EXPECT_EQ(rsync_raw->upload_calls, 1);
    EXPECT_EQ(scp_raw->upload_calls, 1);
    ASSERT_EQ(shell.calls.size(), 1u);
    EXPECT_EQ(shell.calls[0].command, "mkdir -p /root/job/inputs /root/job/outputs");
}

TEST_F(TransferEngineTest, UploadOfEmptyDirOnlyCreatesRemoteDirs) {
    fs::create_directories(test_dir / "in");
    auto rsync = std::make_unique<FakeTransporter>("rsync", true);
    FakeTransporter* raw = rsync.get();
    auto engine = make_engine(std::move(rsync), std::make_unique<FakeTransporter>("scp", false));

    engine.upload_tree(test_target(), test_dir / "in", "~/job/inputs");
    EXPECT_EQ(raw->upload_calls, 0);
    EXPECT_EQ(shell.count("mkdir -p ~/job/inputs"), 1);
}

TEST_F(TransferEngineTest, UploadFailsWhenRemoteMkdirFails) {
    write_text(test_dir / "in/a", "x");
    shell.on("mkdir", 1, "", "mkdir: cannot create directory '/root/job': Permission denied");
    auto engine = make_engine(nullptr, std::make_unique<FakeTransporter>("scp", false));
    EXPECT_THROW(engine.upload_tree(test_target(), test_dir / "in", "/root/job/inputs"),
                 TransferError);
}

TEST_F(TransferEngineTest, UploadRejectsMissingLocalDir) {
    auto engine = make_engine(nullptr, std::make_unique<FakeTransporter>("scp", false));
    EXPECT_THROW(engine.upload_tree(test_target(), test_dir / "absent", "/in"),
                 std::invalid_argument);
    EXPECT_TRUE(shell.calls.empty());
}

TEST_F(TransferEngineTest, FallbackIsRequired) {
    EXPECT_THROW(make_engine(std::make_unique<FakeTransporter>("rsync", true), nullptr),
                 std::invalid_argument);
}
