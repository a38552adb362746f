#include <gtest/gtest.h>
#include "fakes.hpp"
#include <transfer/streaming_download.hpp>
#include <transfer/folder_download.hpp>
#include <transfer/transfer_manager.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <iterator>

class DownloadTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeConnectionFactory> factory = std::make_shared<FakeConnectionFactory>();
    std::shared_ptr<TransferManager> transfers = std::make_shared<TransferManager>();
    std::shared_ptr<StagingArea> staging;
    ConnectionParams params;
    fs::path target;

    void SetUp() override {
        staging = std::make_shared<StagingArea>(
            platform::unique_path(platform::temp_dir(), "tb_download_test"), 1,
            std::chrono::milliseconds(0));
        target = platform::unique_path(platform::temp_dir(), "tb_download_target");
        factory->store->read_quantum = 16 * 1024;
    }

    void TearDown() override {
        staging->sweep();
        std::error_code ec;
        fs::remove_all(target, ec);
    }

    size_t staged_files() const {
        std::error_code ec;
        if (!fs::exists(staging->dir(), ec)) return 0;
        size_t n = 0;
        for (auto it = fs::directory_iterator(staging->dir(), ec); it != fs::directory_iterator(); ++it) n++;
        return n;
    }

    static std::string read_local(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    static std::string pattern(size_t n) {
        std::string s(n, '\0');
        for (size_t i = 0; i < n; i++) s[i] = static_cast<char>(i * 31 % 251);
        return s;
    }
};

// ── Single file ───────────────────────────────────────────────

TEST_F(DownloadTest, StreamsWholeFile) {
    std::string content = pattern(200 * 1024);
    factory->store->add_dir("/data");
    factory->store->add_file("/data/report.bin", content);

    StreamingDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/data/report.bin", "dl1");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.cancelled);
    EXPECT_EQ(r.value.filename, "report.bin");
    EXPECT_EQ(r.value.size, content.size());
    ASSERT_NE(r.value.stream, nullptr);

    // The SFTP connection is gone before the stream is consumed
    EXPECT_EQ(factory->store->sftp_closes, factory->store->sftp_opens);

    auto st = transfers->status("dl1");
    ASSERT_TRUE(st.has_value());
    EXPECT_DOUBLE_EQ(st->percent, 100.0);

    std::string received, chunk;
    while (r.value.stream->next(chunk)) received += chunk;
    EXPECT_EQ(received, content);
    EXPECT_FALSE(r.value.stream->failed());

    EXPECT_EQ(staged_files(), 0u);
    EXPECT_FALSE(transfers->status("dl1").has_value());
}

TEST_F(DownloadTest, EmptyFile) {
    factory->store->add_file("/empty", "");
    StreamingDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/empty", "dl0");
    ASSERT_TRUE(r.is_ok()) << r.error;
    std::string chunk;
    EXPECT_FALSE(r.value.stream->next(chunk));
    EXPECT_TRUE(chunk.empty());
}

TEST_F(DownloadTest, DroppingStreamReleasesStaging) {
    factory->store->add_file("/f", pattern(1000));
    StreamingDownloader downloader(factory, transfers, staging);
    {
        auto r = downloader.download(params, "/f", "dl2");
        ASSERT_TRUE(r.is_ok());
        EXPECT_EQ(staged_files(), 1u);
    }
    EXPECT_EQ(staged_files(), 0u);
    EXPECT_EQ(transfers->active_count(), 0u);
}

TEST_F(DownloadTest, DirectoryIsRejected) {
    factory->store->add_dir("/data");
    StreamingDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/data", "dl3");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::INVALID_INPUT);
}

TEST_F(DownloadTest, MissingFile) {
    StreamingDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/nope", "dl4");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_FOUND);
    EXPECT_EQ(transfers->active_count(), 0u);
}

TEST_F(DownloadTest, ConnectionFailure) {
    factory->fail_with("Authentication failed", ErrorKind::AUTH);
    StreamingDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/f", "dl5");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AUTH);
}

TEST_F(DownloadTest, CancelDuringPull) {
    factory->store->add_file("/big", pattern(256 * 1024));
    auto transfers_ref = transfers;
    factory->store->on_read = [transfers_ref](uint64_t offset) {
        if (offset >= 64 * 1024) transfers_ref->cancel_transfer("dl6");
    };

    StreamingDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/big", "dl6");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.cancelled);
    EXPECT_EQ(r.value.stream, nullptr);
    EXPECT_EQ(staged_files(), 0u);

    auto st = transfers->status("dl6");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->state, TransferState::CANCELLED);
    EXPECT_LT(st->transferred, 256u * 1024u);
}

TEST_F(DownloadTest, CancelWhileStreaming) {
    factory->store->add_file("/big", pattern(3 * MiB));
    StreamingDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/big", "dl7");
    ASSERT_TRUE(r.is_ok());

    std::string chunk;
    ASSERT_TRUE(r.value.stream->next(chunk));
    EXPECT_EQ(chunk.size(), static_cast<size_t>(r.value.stream->chunk_size()));
    EXPECT_TRUE(transfers->cancel_transfer("dl7"));
    EXPECT_FALSE(r.value.stream->next(chunk));
    EXPECT_TRUE(r.value.stream->cancelled());
    EXPECT_EQ(staged_files(), 0u);
    EXPECT_TRUE(transfers->is_cancelled("dl7"));
}

// ── Folder ────────────────────────────────────────────────────

class FolderDownloadTest : public DownloadTest {
protected:
    void SetUp() override {
        DownloadTest::SetUp();
        auto& store = *factory->store;
        store.add_dir("/srv");
        store.add_dir("/srv/proj");
        store.add_dir("/srv/proj/sub");
        store.add_dir("/srv/proj/sub/deeper");
        store.add_dir("/srv/proj/empty");
        store.add_file("/srv/proj/a.txt", "alpha");
        store.add_file("/srv/proj/sub/b.txt", pattern(40 * 1024));
        store.add_file("/srv/proj/sub/deeper/c.txt", "gamma");
    }
};

TEST_F(FolderDownloadTest, FolderSizeSumsFiles) {
    FakeRemoteFs remote(factory->store);
    auto size = FolderDownloader::folder_size(remote, "/srv/proj");
    ASSERT_TRUE(size.is_ok());
    EXPECT_EQ(size.value, 5u + 40u * 1024u + 5u);
}

TEST_F(FolderDownloadTest, MirrorsTree) {
    FolderDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/srv/proj", target, "fd1");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.outcome, FolderOutcome::COMPLETED);
    EXPECT_EQ(r.value.files, 3u);
    EXPECT_EQ(r.value.bytes, 5u + 40u * 1024u + 5u);
    EXPECT_EQ(r.value.local_path.string(), (target / "proj").string());

    EXPECT_EQ(read_local(target / "proj" / "a.txt"), "alpha");
    EXPECT_EQ(read_local(target / "proj" / "sub" / "b.txt"), pattern(40 * 1024));
    EXPECT_EQ(read_local(target / "proj" / "sub" / "deeper" / "c.txt"), "gamma");
    EXPECT_TRUE(fs::is_directory(target / "proj" / "empty"));

    EXPECT_EQ(staged_files(), 0u);
    EXPECT_EQ(transfers->active_count(), 0u);
}

TEST_F(FolderDownloadTest, ReplacesPreviousCopy) {
    fs::create_directories(target / "proj");
    std::ofstream(target / "proj" / "stale.txt") << "old";

    FolderDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/srv/proj", target, "fd2");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(fs::exists(target / "proj" / "stale.txt"));
    EXPECT_TRUE(fs::exists(target / "proj" / "a.txt"));
}

TEST_F(FolderDownloadTest, CancelLeavesNoPartialFolder) {
    auto transfers_ref = transfers;
    factory->store->on_read = [transfers_ref](uint64_t offset) {
        if (offset >= 16 * 1024) transfers_ref->cancel_transfer("fd3");
    };

    FolderDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/srv/proj", target, "fd3");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.outcome, FolderOutcome::CANCELLED);
    EXPECT_FALSE(fs::exists(target / "proj"));
    EXPECT_EQ(staged_files(), 0u);
    EXPECT_EQ(transfers->status("fd3")->state, TransferState::CANCELLED);
}

TEST_F(FolderDownloadTest, RootCannotBeDownloaded) {
    FolderDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/", target, "fd4");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::INVALID_INPUT);
}

TEST_F(FolderDownloadTest, MissingFolder) {
    FolderDownloader downloader(factory, transfers, staging);
    auto r = downloader.download(params, "/srv/missing", target, "fd5");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_FOUND);
    EXPECT_FALSE(fs::exists(target / "missing"));
}
