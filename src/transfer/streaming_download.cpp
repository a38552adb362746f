#include "streaming_download.hpp"
#include "transfer_manager.hpp"
#include "transfer_sizing.hpp"
#include <ssh/connection_factory.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <vector>

// ── DownloadStream ────────────────────────────────────────────

DownloadStream::DownloadStream(std::unique_ptr<StagingFile> staging,
                               std::shared_ptr<TransferManager> transfers,
                               std::shared_ptr<TransferProgress> progress,
                               std::string transfer_id,
                               uint64_t size, uint64_t chunk_size)
    : staging_(std::move(staging)), transfers_(std::move(transfers)),
      progress_(std::move(progress)), transfer_id_(std::move(transfer_id)),
      size_(size), chunk_size_(chunk_size > 0 ? chunk_size : MiB),
      in_(staging_->path(), std::ios::binary) {
    if (!in_) {
        log_error(fmt::format("Download {}: cannot reopen staging file", transfer_id_));
        failed_ = true;
    }
}

DownloadStream::~DownloadStream() {
    close();
}

bool DownloadStream::next(std::string& chunk) {
    chunk.clear();
    if (closed_ || failed_ || cancelled_) return false;

    if (progress_->is_cancelled()) {
        cancelled_ = true;
        log_info(fmt::format("Download {} cancelled while streaming", transfer_id_));
        close();
        return false;
    }

    chunk.resize(static_cast<size_t>(chunk_size_));
    in_.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<size_t>(in_.gcount()));
    if (in_.bad()) {
        failed_ = true;
        chunk.clear();
        log_error(fmt::format("Download {}: reading staging file failed", transfer_id_));
        close();
        return false;
    }
    if (chunk.empty()) {
        close();
        return false;
    }
    return true;
}

void DownloadStream::close() {
    if (closed_) return;
    closed_ = true;
    in_.close();
    staging_->release();
    transfers_->remove_transfer(transfer_id_);
}

// ── StreamingDownloader ───────────────────────────────────────

StreamingDownloader::StreamingDownloader(std::shared_ptr<ConnectionFactory> factory,
                                         std::shared_ptr<TransferManager> transfers,
                                         std::shared_ptr<StagingArea> staging)
    : factory_(std::move(factory)), transfers_(std::move(transfers)),
      staging_(std::move(staging)) {}

Result<DownloadResult> StreamingDownloader::download(const ConnectionParams& params,
                                                     const std::string& remote_path,
                                                     const std::string& transfer_id) {
    using R = Result<DownloadResult>;
    if (transfer_id.empty()) return R::Err("Missing transfer id", ErrorKind::INVALID_INPUT);

    auto fs_result = factory_->open_sftp(params);
    if (fs_result.is_err()) {
        log_warn(fmt::format("Download {}: SFTP connect failed: {}", transfer_id, fs_result.error));
        return R::Err(fs_result);
    }
    auto remote_fs = std::move(fs_result.value);

    auto st = remote_fs->stat(remote_path);
    if (st.is_err()) return R::Err(st);
    if (st.value.is_dir) {
        return R::Err(fmt::format("{} is a directory", remote_path), ErrorKind::INVALID_INPUT);
    }
    uint64_t size = st.value.size;
    TransferSizing sizing = sizing_for(size);

    auto progress = transfers_->create_transfer(transfer_id, size, TransferDirection::DOWNLOAD);
    auto fail = [&](const std::string& msg, ErrorKind kind) {
        progress->fail();
        transfers_->remove_transfer(transfer_id);
        log_error(fmt::format("Download {} of {} failed: {}", transfer_id, remote_path, msg));
        return R::Err(msg, kind);
    };

    auto path = staging_->allocate("download");
    if (path.is_err()) return fail(path.error, path.kind);
    auto staging = std::make_unique<StagingFile>(staging_, path.value);

    remote_fs->widen_window(sizing.buffer);

    bool cancelled = false;
    {
        auto file = remote_fs->open_read(remote_path);
        if (file.is_err()) return fail(file.error, file.kind);

        std::ofstream out(staging->path(), std::ios::binary | std::ios::trunc);
        if (!out) return fail("Cannot create staging file", ErrorKind::IO);

        std::vector<char> buf(static_cast<size_t>(sizing.chunk));
        uint64_t received = 0;
        while (true) {
            if (progress->is_cancelled()) {
                cancelled = true;
                break;
            }
            long n = file.value->read(buf.data(), buf.size());
            if (n < 0) return fail(fmt::format("SFTP read error ({})", n), ErrorKind::REMOTE);
            if (n == 0) break;
            out.write(buf.data(), n);
            if (!out) return fail("Writing staging file failed", ErrorKind::IO);
            received += static_cast<uint64_t>(n);
            progress->update(received);
        }
        out.flush();
        if (!cancelled && !out) return fail("Flushing staging file failed", ErrorKind::IO);
    }
    remote_fs.reset();

    DownloadResult result;
    result.filename = remote_basename(remote_path);
    result.size = size;

    if (cancelled) {
        log_info(fmt::format("Download {} of {} cancelled", transfer_id, remote_path));
        staging->release();
        transfers_->remove_transfer(transfer_id);
        result.cancelled = true;
        return R::Ok(std::move(result));
    }

    log_info(fmt::format("Download {} pulled {} ({} bytes)", transfer_id, remote_path, size));
    result.stream = std::make_unique<DownloadStream>(std::move(staging), transfers_, progress,
                                                     transfer_id, size, sizing.chunk);
    return R::Ok(std::move(result));
}
