#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include "fake_share.hpp"
#include "logger.hpp"
#include "transfer_engine.hpp"

namespace fs = std::filesystem;

namespace {

std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        workDir = fs::temp_directory_path() /
                  ("smbrelay-engine-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(workDir);
        fs::create_directories(workDir);
    }

    void TearDown() override { fs::remove_all(workDir); }

    std::string writeLocal(const std::string& name, const std::string& content) {
        fs::path path = workDir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    TransferOutcome backup(const ShareConfig& config, const std::string& localPath, const std::string& name) {
        SessionManager sessions(config, connector, logger);
        TransferEngine engine(sessions, logger, [] { return localTime(2024, 1, 1, 12, 0, 0); });
        return engine.backup(TransferRequest{localPath, name});
    }

    ShareConfig config{"backup", "secret", "nas.local", "files", 445, "/backups"};
    FakeShareState state;
    FakeConnector connector{state};
    Logger logger{"", "", false};
    fs::path workDir;
};

} // namespace

TEST(NamingTest, InsertSuffixBeforeLastExtension) {
    EXPECT_EQ(insertSuffix("report.pdf", "_20240101_120000"), "report_20240101_120000.pdf");
    EXPECT_EQ(insertSuffix("archive.tar.gz", "_20240101_120000"), "archive.tar_20240101_120000.gz");
    EXPECT_EQ(insertSuffix("notes", "_20240101_120000"), "notes_20240101_120000");
    EXPECT_EQ(insertSuffix(".bashrc", "_20240101_120000"), "_20240101_120000.bashrc");
    EXPECT_EQ(insertSuffix("trailing.", "_x"), "trailing_x.");
}

TEST(NamingTest, TimestampSuffixUsesLocalTime) {
    EXPECT_EQ(timestampSuffix(localTime(2024, 1, 1, 12, 0, 0)), "_20240101_120000");
    EXPECT_EQ(timestampSuffix(localTime(1999, 12, 31, 23, 59, 58)), "_19991231_235958");
}

TEST(NamingTest, JoinRemotePath) {
    EXPECT_EQ(joinRemotePath("/backups", "a.txt"), "/backups/a.txt");
    EXPECT_EQ(joinRemotePath("/backups/", "a.txt"), "/backups/a.txt");
    EXPECT_EQ(joinRemotePath("/", "a.txt"), "/a.txt");
    EXPECT_EQ(joinRemotePath("telegram", "a.txt"), "telegram/a.txt");
}

TEST_F(TransferEngineTest, FreshFilenameStoresExactBytes) {
    std::string content("PDF\0\x01\x02binary\xff", 13);
    auto outcome = backup(config, writeLocal("in.bin", content), "report.pdf");

    ASSERT_TRUE(outcome.success) << outcome.diagnostic;
    EXPECT_EQ(outcome.remotePath, "/backups/report.pdf");
    EXPECT_EQ(state.files["/backups/report.pdf"], content);
    EXPECT_EQ(state.closeCalls, 1);
    EXPECT_EQ(state.openSessions, 0);
}

TEST_F(TransferEngineTest, CollisionGetsTimestampBeforeExtension) {
    auto first = backup(config, writeLocal("first.pdf", "first"), "report.pdf");
    auto second = backup(config, writeLocal("second.pdf", "second"), "report.pdf");

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.remotePath, "/backups/report.pdf");
    EXPECT_EQ(second.remotePath, "/backups/report_20240101_120000.pdf");
    EXPECT_EQ(state.files["/backups/report.pdf"], "first");
    EXPECT_EQ(state.files["/backups/report_20240101_120000.pdf"], "second");
    EXPECT_EQ(state.closeCalls, 2);
}

TEST_F(TransferEngineTest, CollisionWithoutExtensionAppendsTimestamp) {
    state.files["/backups/notes"] = "old";
    auto outcome = backup(config, writeLocal("notes", "new"), "notes");

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.remotePath, "/backups/notes_20240101_120000");
    EXPECT_EQ(state.files["/backups/notes"], "old");
}

TEST_F(TransferEngineTest, CollisionSplitsOnLastDotOnly) {
    state.files["/backups/site.tar.gz"] = "old";
    auto outcome = backup(config, writeLocal("site.tar.gz", "new"), "site.tar.gz");

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.remotePath, "/backups/site.tar_20240101_120000.gz");
}

TEST_F(TransferEngineTest, RepeatedCollisionWithinOneSecondAddsCounter) {
    state.files["/backups/report.pdf"] = "one";
    state.files["/backups/report_20240101_120000.pdf"] = "two";
    auto outcome = backup(config, writeLocal("three.pdf", "three"), "report.pdf");

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.remotePath, "/backups/report_20240101_120000_2.pdf");
    EXPECT_EQ(state.files["/backups/report_20240101_120000.pdf"], "two");
}

TEST_F(TransferEngineTest, DirectoryCreationIsIdempotent) {
    auto first = backup(config, writeLocal("a.txt", "a"), "a.txt");
    auto second = backup(config, writeLocal("b.txt", "b"), "b.txt");

    EXPECT_TRUE(first.success);
    EXPECT_TRUE(second.success);
    EXPECT_EQ(state.mkdirCalls, 2);
    EXPECT_EQ(state.directories.count("/backups"), 1u);
}

TEST_F(TransferEngineTest, DirectoryCreationFailureIsNotFatal) {
    state.failMkdir = true;
    auto outcome = backup(config, writeLocal("a.txt", "a"), "a.txt");

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(state.uploadCalls, 1);
}

TEST_F(TransferEngineTest, ConnectionFailureHasNoSideEffects) {
    state.failConnect = true;
    auto outcome = backup(config, writeLocal("a.txt", "a"), "a.txt");

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.errorKind.has_value());
    EXPECT_EQ(*outcome.errorKind, TransferErrorKind::Connection);
    EXPECT_EQ(state.connectCalls, 1);
    EXPECT_EQ(state.mkdirCalls, 0);
    EXPECT_EQ(state.probeCalls, 0);
    EXPECT_EQ(state.uploadCalls, 0);
}

TEST_F(TransferEngineTest, UnreadableLocalFileFailsAndClosesSessionOnce) {
    auto outcome = backup(config, (workDir / "missing.bin").string(), "missing.bin");

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.errorKind.has_value());
    EXPECT_EQ(*outcome.errorKind, TransferErrorKind::Upload);
    EXPECT_EQ(state.uploadCalls, 0);
    EXPECT_EQ(state.closeCalls, 1);
    EXPECT_EQ(state.openSessions, 0);
}

TEST_F(TransferEngineTest, DirectoryAsLocalFileIsRejected) {
    auto outcome = backup(config, workDir.string(), "dir.bin");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(state.closeCalls, 1);
}

TEST_F(TransferEngineTest, UploadFailureClosesSession) {
    state.failUpload = true;
    auto outcome = backup(config, writeLocal("a.txt", "a"), "a.txt");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(*outcome.errorKind, TransferErrorKind::Upload);
    EXPECT_EQ(outcome.diagnostic, "disk full");
    EXPECT_EQ(state.closeCalls, 1);
    EXPECT_EQ(state.openSessions, 0);
}

TEST_F(TransferEngineTest, ProbeFailureAssumesAbsentByDefault) {
    state.probeFailures.insert("/backups/a.txt");
    auto outcome = backup(config, writeLocal("a.txt", "a"), "a.txt");

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.remotePath, "/backups/a.txt");
}

TEST_F(TransferEngineTest, ProbeFailureAbortsWhenConfigured) {
    ShareConfig strict = config.withProbeFailurePolicy(ProbeFailurePolicy::Abort);
    state.probeFailures.insert("/backups/a.txt");
    auto outcome = backup(strict, writeLocal("a.txt", "a"), "a.txt");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(*outcome.errorKind, TransferErrorKind::ExistenceCheck);
    EXPECT_EQ(state.uploadCalls, 0);
    EXPECT_EQ(state.closeCalls, 1);
}

TEST_F(TransferEngineTest, SettingsComeFromTheSessionManager) {
    ShareConfig strict("backup", "secret", "nas.local", "files", 445, "/strict");
    strict = strict.withProbeFailurePolicy(ProbeFailurePolicy::Abort);
    SessionManager sessions(strict, connector, logger);
    TransferEngine engine(sessions, logger);

    EXPECT_TRUE(engine.backupFile(writeLocal("a.txt", "a"), "a.txt"));
    EXPECT_TRUE(state.files.count("/strict/a.txt"));
    EXPECT_FALSE(state.files.count("/backups/a.txt"));

    state.probeFailures.insert("/strict/b.txt");
    auto outcome = engine.backup(TransferRequest{writeLocal("b.txt", "b"), "b.txt"});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(*outcome.errorKind, TransferErrorKind::ExistenceCheck);
}

TEST_F(TransferEngineTest, InvalidFilenamesAreRejectedBeforeConnecting) {
    std::string local = writeLocal("a.txt", "a");
    for (const std::string name : {"", ".", "..", "../escape.txt", "dir/file.txt"}) {
        auto outcome = backup(config, local, name);
        EXPECT_FALSE(outcome.success) << name;
        EXPECT_EQ(*outcome.errorKind, TransferErrorKind::InvalidRequest) << name;
    }
    EXPECT_EQ(state.connectCalls, 0);
}

TEST_F(TransferEngineTest, ShareRootDirectory) {
    ShareConfig root("backup", "secret", "nas.local", "files");
    auto outcome = backup(root, writeLocal("a.txt", "a"), "a.txt");

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.remotePath, "/a.txt");
}

TEST_F(TransferEngineTest, BackupFileReportsBoolean) {
    SessionManager sessions(config, connector, logger);
    TransferEngine engine(sessions, logger);

    EXPECT_TRUE(engine.backupFile(writeLocal("a.txt", "a"), "a.txt"));
    state.failConnect = true;
    EXPECT_FALSE(engine.backupFile(writeLocal("b.txt", "b"), "b.txt"));
}
