#include "chunked_upload.hpp"
#include "transfer_manager.hpp"
#include "transfer_sizing.hpp"
#include <ssh/connection_factory.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

const char* upload_outcome_name(UploadOutcome outcome) {
    switch (outcome) {
    case UploadOutcome::CHUNK_ACCEPTED: return "chunk_uploaded";
    case UploadOutcome::COMPLETED:      return "success";
    case UploadOutcome::CANCELLED:      return "cancelled";
    }
    return "unknown";
}

ChunkedUploadAssembler::ChunkedUploadAssembler(std::shared_ptr<ConnectionFactory> factory,
                                               std::shared_ptr<TransferManager> transfers,
                                               std::shared_ptr<StagingArea> staging)
    : factory_(std::move(factory)), transfers_(std::move(transfers)),
      staging_(std::move(staging)) {}

ChunkedUploadAssembler::~ChunkedUploadAssembler() {
    abort_all();
}

// ── Entry point ───────────────────────────────────────────────

Result<UploadReply> ChunkedUploadAssembler::accept(const ConnectionParams& params,
                                                   const UploadChunk& chunk) {
    using R = Result<UploadReply>;

    auto pending = begin(chunk);
    if (pending.is_err()) return R::Err(pending);
    auto up = pending.value;
    if (!up) {
        // Late chunk for a transfer that was cancelled and already released
        UploadReply reply;
        reply.outcome = UploadOutcome::CANCELLED;
        return R::Ok(reply);
    }

    std::lock_guard<std::mutex> lock(up->op);
    if (up->finished) {
        if (transfers_->is_cancelled(chunk.transfer_id)) {
            UploadReply reply;
            reply.outcome = UploadOutcome::CANCELLED;
            return R::Ok(reply);
        }
        return R::Err(fmt::format("Upload {} is no longer pending", chunk.transfer_id),
                      ErrorKind::NOT_FOUND);
    }
    if (up->progress->is_cancelled()) return cancelled_reply(chunk.transfer_id, *up);

    if (chunk.chunk_index < up->next_index) {
        log_debug(fmt::format("Upload {}: chunk {} already stored, ignoring",
                              chunk.transfer_id, chunk.chunk_index));
        UploadReply reply;
        reply.next_index = up->next_index;
        std::error_code ec;
        auto size = fs::file_size(up->staging->path(), ec);
        reply.staged_bytes = ec ? 0 : size;
        return R::Ok(reply);
    }
    if (chunk.chunk_index > up->next_index) {
        return R::Err(fmt::format("Upload {}: expected chunk {}, got {}", chunk.transfer_id,
                                  up->next_index, chunk.chunk_index),
                      ErrorKind::OUT_OF_ORDER);
    }

    auto appended = append(chunk, *up);
    if (appended.is_err()) return appended;
    if (appended.value.outcome == UploadOutcome::CANCELLED) return appended;

    if (!chunk.is_last_chunk) {
        // A cancel that raced this chunk is honoured before acknowledging
        if (up->progress->is_cancelled()) return cancelled_reply(chunk.transfer_id, *up);
        return appended;
    }
    return push(params, chunk, *up);
}

Result<std::shared_ptr<ChunkedUploadAssembler::PendingUpload>>
ChunkedUploadAssembler::begin(const UploadChunk& chunk) {
    using R = Result<std::shared_ptr<PendingUpload>>;
    const std::string& id = chunk.transfer_id;
    if (id.empty()) return R::Err("Missing transfer id", ErrorKind::INVALID_INPUT);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(id);
    if (it != uploads_.end()) return R::Ok(it->second);

    if (chunk.chunk_index != 0) {
        if (transfers_->is_cancelled(id)) return R::Ok(nullptr);
        return R::Err(fmt::format("Upload {} has no chunk 0", id), ErrorKind::NOT_FOUND);
    }

    auto path = staging_->allocate("upload");
    if (path.is_err()) return R::Err(path);

    auto up = std::make_shared<PendingUpload>();
    up->staging = std::make_unique<StagingFile>(staging_, path.value);
    up->progress = transfers_->create_transfer(id, chunk.total_size, TransferDirection::UPLOAD);
    uploads_[id] = up;
    log_info(fmt::format("Upload {} started: {} ({} bytes) -> {}", id, chunk.filename,
                         chunk.total_size, chunk.remote_dir));
    return R::Ok(up);
}

// ── Staging ───────────────────────────────────────────────────

Result<UploadReply> ChunkedUploadAssembler::append(const UploadChunk& chunk, PendingUpload& up) {
    using R = Result<UploadReply>;
    const std::string& id = chunk.transfer_id;

    auto bytes = base64_decode(chunk.data_base64);
    if (!bytes) {
        up.progress->fail();
        finish(id, up);
        return R::Err(fmt::format("Upload {}: chunk {} is not valid base64", id, chunk.chunk_index),
                      ErrorKind::INVALID_INPUT);
    }

    int err = platform::append_durable(up.staging->path(), bytes->data(), bytes->size());
    if (err != 0) {
        up.progress->fail();
        finish(id, up);
        return R::Err(fmt::format("Upload {}: writing staging file failed: {}", id,
                                  std::strerror(err)),
                      ErrorKind::IO);
    }

    // On-disk size, not a running counter
    std::error_code ec;
    uint64_t staged = fs::file_size(up.staging->path(), ec);
    if (ec) {
        up.progress->fail();
        finish(id, up);
        return R::Err(fmt::format("Upload {}: cannot stat staging file: {}", id, ec.message()),
                      ErrorKind::IO);
    }
    up.progress->update(staged);
    up.next_index = chunk.chunk_index + 1;

    if (up.progress->is_cancelled()) return cancelled_reply(id, up);

    UploadReply reply;
    reply.next_index = up.next_index;
    reply.staged_bytes = staged;
    return R::Ok(reply);
}

// ── Final push ────────────────────────────────────────────────

Result<UploadReply> ChunkedUploadAssembler::push(const ConnectionParams& params,
                                                 const UploadChunk& chunk, PendingUpload& up) {
    using R = Result<UploadReply>;
    const std::string& id = chunk.transfer_id;
    std::string remote_path = join_remote_path(chunk.remote_dir, chunk.filename);

    std::error_code ec;
    uint64_t size = fs::file_size(up.staging->path(), ec);
    if (ec) {
        up.progress->fail();
        finish(id, up);
        return R::Err(fmt::format("Upload {}: staging file vanished", id), ErrorKind::IO);
    }

    auto fs_result = factory_->open_sftp(params);
    if (fs_result.is_err()) {
        log_warn(fmt::format("Upload {}: SFTP connect failed: {}", id, fs_result.error));
        up.progress->fail();
        finish(id, up);
        return R::Err(fs_result);
    }
    auto& remote_fs = fs_result.value;

    TransferSizing sizing = sizing_for(size);
    remote_fs->widen_window(sizing.buffer);
    up.progress->set_total(size);

    bool cancelled = false;
    Result<void> failure = Result<void>::Ok();
    {
        auto file = remote_fs->open_write(remote_path);
        if (file.is_err()) {
            failure = Result<void>::Err(file);
        } else {
            std::ifstream in(up.staging->path(), std::ios::binary);
            std::vector<char> buf(static_cast<size_t>(sizing.chunk));
            uint64_t sent = 0;
            up.progress->update(0);

            while (in) {
                if (up.progress->is_cancelled()) {
                    cancelled = true;
                    break;
                }
                in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                auto n = static_cast<size_t>(in.gcount());
                if (n == 0) break;
                auto written = file.value->write_all(buf.data(), n);
                if (written.is_err()) {
                    failure = written;
                    break;
                }
                sent += n;
                up.progress->update(sent);
            }
            if (!cancelled && failure.is_ok() && in.bad()) {
                failure = Result<void>::Err("Reading staging file failed", ErrorKind::IO);
            }
        }
    }

    if (cancelled || failure.is_err()) {
        // Do not leave a partial file behind on the remote side
        auto removed = remote_fs->remove(remote_path);
        if (removed.is_err() && removed.kind != ErrorKind::NOT_FOUND) {
            log_warn(fmt::format("Upload {}: removing partial {} failed: {}", id, remote_path,
                                 removed.error));
        }
    }

    if (cancelled) return cancelled_reply(id, up);
    if (failure.is_err()) {
        log_error(fmt::format("Upload {} to {} failed: {}", id, remote_path, failure.error));
        up.progress->fail();
        finish(id, up);
        return R::Err(failure);
    }

    log_info(fmt::format("Upload {} complete: {} ({} bytes)", id, remote_path, size));
    finish(id, up);

    UploadReply reply;
    reply.outcome = UploadOutcome::COMPLETED;
    reply.next_index = up.next_index;
    reply.staged_bytes = size;
    reply.remote_path = remote_path;
    return R::Ok(reply);
}

// ── Cleanup ───────────────────────────────────────────────────

Result<UploadReply> ChunkedUploadAssembler::cancelled_reply(const std::string& transfer_id,
                                                            PendingUpload& up) {
    log_info(fmt::format("Upload {} cancelled at chunk {}", transfer_id, up.next_index));
    finish(transfer_id, up);
    UploadReply reply;
    reply.outcome = UploadOutcome::CANCELLED;
    reply.next_index = up.next_index;
    return Result<UploadReply>::Ok(reply);
}

void ChunkedUploadAssembler::finish(const std::string& transfer_id, PendingUpload& up) {
    if (up.finished) return;
    up.finished = true;
    up.staging->release();
    transfers_->remove_transfer(transfer_id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(transfer_id);
    if (it != uploads_.end() && it->second.get() == &up) uploads_.erase(it);
}

bool ChunkedUploadAssembler::discard(const std::string& transfer_id) {
    std::shared_ptr<PendingUpload> up;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(transfer_id);
        if (it == uploads_.end()) return false;
        up = it->second;
    }
    std::unique_lock<std::mutex> op(up->op, std::try_to_lock);
    if (!op.owns_lock()) return false;
    if (up->finished) return false;
    finish(transfer_id, *up);
    return true;
}

void ChunkedUploadAssembler::abort_all() {
    std::map<std::string, std::shared_ptr<PendingUpload>> uploads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads = uploads_;
    }
    // Cancel before locking so a push in flight stops at its next write quantum
    for (auto& kv : uploads) kv.second->progress->cancel();
    for (auto& kv : uploads) {
        std::lock_guard<std::mutex> op(kv.second->op);
        if (kv.second->finished) continue;
        finish(kv.first, *kv.second);
    }
}

size_t ChunkedUploadAssembler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
}
