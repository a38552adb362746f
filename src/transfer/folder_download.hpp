#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <core/types.hpp>
#include "staging_area.hpp"
#include "transfer_progress.hpp"

class ConnectionFactory;
class TransferManager;
class RemoteFileSystem;

enum class FolderOutcome { COMPLETED, CANCELLED };

struct FolderDownloadReply {
    FolderOutcome outcome = FolderOutcome::COMPLETED;
    fs::path local_path;           // target_dir/<folder name> on success
    uint64_t bytes = 0;
    size_t files = 0;
};

// Mirrors a remote directory tree into `target_dir/<folder name>`.
// The tree is first staged in its entirety, then swapped into place, so a
// failed or cancelled pull never leaves a partial folder at the target.
class FolderDownloader {
public:
    FolderDownloader(std::shared_ptr<ConnectionFactory> factory,
                     std::shared_ptr<TransferManager> transfers,
                     std::shared_ptr<StagingArea> staging);

    Result<FolderDownloadReply> download(const ConnectionParams& params,
                                         const std::string& remote_path,
                                         const fs::path& target_dir,
                                         const std::string& transfer_id);

    // Sum of regular file sizes below `remote_path`.
    static Result<uint64_t> folder_size(RemoteFileSystem& remote_fs, const std::string& remote_path);

private:
    std::shared_ptr<ConnectionFactory> factory_;
    std::shared_ptr<TransferManager> transfers_;
    std::shared_ptr<StagingArea> staging_;
};
