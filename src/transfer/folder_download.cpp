#include "folder_download.hpp"
#include "transfer_manager.hpp"
#include "transfer_sizing.hpp"
#include <ssh/connection_factory.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace {

// State shared across one recursive pull.
struct FolderWalk {
    RemoteFileSystem& remote_fs;
    TransferProgress& progress;
    uint64_t total;
    uint64_t received = 0;
    size_t files = 0;
    std::vector<char> buf;
};

// Returns true when cancelled.
Result<bool> pull_file(FolderWalk& walk, const std::string& remote, const fs::path& local) {
    auto file = walk.remote_fs.open_read(remote);
    if (file.is_err()) return Result<bool>::Err(file);

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<bool>::Err(fmt::format("Cannot create {}", local.string()), ErrorKind::IO);
    }

    while (true) {
        if (walk.progress.is_cancelled()) return Result<bool>::Ok(true);
        long n = file.value->read(walk.buf.data(), walk.buf.size());
        if (n < 0) {
            return Result<bool>::Err(fmt::format("SFTP read error on {} ({})", remote, n),
                                     ErrorKind::REMOTE);
        }
        if (n == 0) break;
        out.write(walk.buf.data(), n);
        if (!out) {
            return Result<bool>::Err(fmt::format("Writing {} failed", local.string()), ErrorKind::IO);
        }
        walk.received += static_cast<uint64_t>(n);
        walk.progress.update(std::min(walk.total, walk.received));
    }
    walk.files++;
    return Result<bool>::Ok(false);
}

Result<bool> pull_tree(FolderWalk& walk, const std::string& remote, const fs::path& local) {
    std::error_code ec;
    fs::create_directories(local, ec);
    if (ec) {
        return Result<bool>::Err(fmt::format("Cannot create {}: {}", local.string(), ec.message()),
                                 ErrorKind::IO);
    }

    auto entries = walk.remote_fs.list(remote);
    if (entries.is_err()) return Result<bool>::Err(entries);

    for (const auto& entry : entries.value) {
        if (walk.progress.is_cancelled()) return Result<bool>::Ok(true);

        std::string remote_item = join_remote_path(remote, entry.name);
        fs::path local_item = local / entry.name;
        auto pulled = entry.attrs.is_dir ? pull_tree(walk, remote_item, local_item)
                                         : pull_file(walk, remote_item, local_item);
        if (pulled.is_err() || pulled.value) return pulled;
    }
    return Result<bool>::Ok(false);
}

} // namespace

FolderDownloader::FolderDownloader(std::shared_ptr<ConnectionFactory> factory,
                                   std::shared_ptr<TransferManager> transfers,
                                   std::shared_ptr<StagingArea> staging)
    : factory_(std::move(factory)), transfers_(std::move(transfers)),
      staging_(std::move(staging)) {}

Result<uint64_t> FolderDownloader::folder_size(RemoteFileSystem& remote_fs,
                                               const std::string& remote_path) {
    auto entries = remote_fs.list(remote_path);
    if (entries.is_err()) return Result<uint64_t>::Err(entries);

    uint64_t total = 0;
    for (const auto& entry : entries.value) {
        if (entry.attrs.is_dir) {
            auto sub = folder_size(remote_fs, join_remote_path(remote_path, entry.name));
            if (sub.is_err()) return sub;
            total += sub.value;
        } else {
            total += entry.attrs.size;
        }
    }
    return Result<uint64_t>::Ok(total);
}

Result<FolderDownloadReply> FolderDownloader::download(const ConnectionParams& params,
                                                       const std::string& remote_path,
                                                       const fs::path& target_dir,
                                                       const std::string& transfer_id) {
    using R = Result<FolderDownloadReply>;
    if (transfer_id.empty()) return R::Err("Missing transfer id", ErrorKind::INVALID_INPUT);

    std::string folder_name = remote_basename(remote_path);
    if (folder_name.empty() || folder_name == "/" || folder_name == "." || folder_name == "..") {
        return R::Err(fmt::format("Cannot download {} as a folder", remote_path),
                      ErrorKind::INVALID_INPUT);
    }

    auto fs_result = factory_->open_sftp(params);
    if (fs_result.is_err()) return R::Err(fs_result);
    auto& remote_fs = *fs_result.value;

    auto total = folder_size(remote_fs, remote_path);
    if (total.is_err()) return R::Err(total);

    auto progress = transfers_->create_transfer(transfer_id, total.value,
                                                TransferDirection::FOLDER_DOWNLOAD);
    auto fail = [&](const std::string& msg, ErrorKind kind) {
        progress->fail();
        transfers_->remove_transfer(transfer_id);
        log_error(fmt::format("Folder download {} of {} failed: {}", transfer_id, remote_path, msg));
        return R::Err(msg, kind);
    };

    auto dir = staging_->allocate("folder");
    if (dir.is_err()) return fail(dir.error, dir.kind);
    StagingFile staged(staging_, dir.value);
    fs::path local_folder = dir.value / folder_name;

    remote_fs.widen_window(sizing_for(total.value).buffer);

    FolderWalk walk{remote_fs, *progress, total.value, 0, 0,
                    std::vector<char>(static_cast<size_t>(sizing_for(total.value).chunk))};
    auto pulled = pull_tree(walk, remote_path, local_folder);
    if (pulled.is_err()) return fail(pulled.error, pulled.kind);

    FolderDownloadReply reply;
    if (pulled.value) {
        log_info(fmt::format("Folder download {} of {} cancelled", transfer_id, remote_path));
        staged.release();
        transfers_->remove_transfer(transfer_id);
        reply.outcome = FolderOutcome::CANCELLED;
        return R::Ok(reply);
    }

    // Replace any previous copy at the target
    fs::path target = target_dir / folder_name;
    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (!ec) fs::remove_all(target, ec);
    if (!ec) fs::rename(local_folder, target, ec);
    if (ec) {
        // Staging may sit on another filesystem
        ec.clear();
        fs::copy(local_folder, target, fs::copy_options::recursive, ec);
    }
    if (ec) return fail(fmt::format("Cannot place folder at {}: {}", target.string(), ec.message()),
                        ErrorKind::IO);

    staged.release();
    transfers_->remove_transfer(transfer_id);
    log_info(fmt::format("Folder download {}: {} files, {} bytes -> {}", transfer_id, walk.files,
                         walk.received, target.string()));

    reply.local_path = target;
    reply.bytes = walk.received;
    reply.files = walk.files;
    return R::Ok(reply);
}
