#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <core/types.hpp>
#include "staging_area.hpp"
#include "transfer_progress.hpp"

class ConnectionFactory;
class TransferManager;

// Lazy, finite, non-restartable byte stream over a completed staging file.
// Destroying (or closing) it deletes the staging file and releases the
// transfer entry.
class DownloadStream {
public:
    DownloadStream(std::unique_ptr<StagingFile> staging,
                   std::shared_ptr<TransferManager> transfers,
                   std::shared_ptr<TransferProgress> progress,
                   std::string transfer_id,
                   uint64_t size, uint64_t chunk_size);
    ~DownloadStream();

    // Next chunk of at most chunk_size() bytes. False at the end, on a read
    // error, or once the transfer has been cancelled.
    bool next(std::string& chunk);

    bool cancelled() const { return cancelled_; }
    bool failed() const { return failed_; }
    uint64_t size() const { return size_; }
    uint64_t chunk_size() const { return chunk_size_; }

    void close();

    DownloadStream(const DownloadStream&) = delete;
    DownloadStream& operator=(const DownloadStream&) = delete;

private:
    std::unique_ptr<StagingFile> staging_;
    std::shared_ptr<TransferManager> transfers_;
    std::shared_ptr<TransferProgress> progress_;
    std::string transfer_id_;
    uint64_t size_;
    uint64_t chunk_size_;
    std::ifstream in_;
    bool cancelled_ = false;
    bool failed_ = false;
    bool closed_ = false;
};

struct DownloadResult {
    bool cancelled = false;
    std::string filename;                  // basename of the remote path
    uint64_t size = 0;
    std::unique_ptr<DownloadStream> stream;  // null when cancelled
};

// Pulls a remote file into a staging file with progress and cooperative
// cancellation, then hands it out as a DownloadStream. A pull that fails or is
// cancelled never yields a stream. The SFTP connection is closed before
// download() returns.
class StreamingDownloader {
public:
    StreamingDownloader(std::shared_ptr<ConnectionFactory> factory,
                        std::shared_ptr<TransferManager> transfers,
                        std::shared_ptr<StagingArea> staging);

    Result<DownloadResult> download(const ConnectionParams& params,
                                    const std::string& remote_path,
                                    const std::string& transfer_id);

private:
    std::shared_ptr<ConnectionFactory> factory_;
    std::shared_ptr<TransferManager> transfers_;
    std::shared_ptr<StagingArea> staging_;
};
