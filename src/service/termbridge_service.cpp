#include "termbridge_service.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

static PumpOptions pump_options_from(const EngineSettings& s) {
    PumpOptions opts;
    opts.poll = s.pump_poll;
    opts.keepalive_interval = s.keepalive_interval;
    opts.read_quantum = s.pump_read_quantum > 0 ? static_cast<size_t>(s.pump_read_quantum)
                                                : PUMP_READ_QUANTUM;
    return opts;
}

static std::shared_ptr<ConnectionFactory> factory_or_default(std::shared_ptr<ConnectionFactory> f,
                                                             const EngineSettings& s) {
    if (f) return f;
    return std::make_shared<Libssh2ConnectionFactory>(s.connect_timeout);
}

TermbridgeService::TermbridgeService(const Config& config, std::shared_ptr<EventSink> sink,
                                     std::shared_ptr<ConnectionFactory> factory)
    : factory_(factory_or_default(std::move(factory), config.engine())),
      registry_(std::make_shared<SessionRegistry>()),
      transfers_(std::make_shared<TransferManager>()),
      staging_(std::make_shared<StagingArea>(config.engine().staging_dir,
                                             config.engine().delete_retries,
                                             config.engine().delete_backoff)),
      lifecycle_(factory_, registry_, std::move(sink), pump_options_from(config.engine()),
                 config.engine().pump_join_timeout),
      uploads_(factory_, transfers_, staging_),
      downloads_(factory_, transfers_, staging_),
      folders_(factory_, transfers_, staging_),
      files_(factory_) {
    if (!config.engine().log_path.empty()) {
        set_log_path(config.engine().log_path);
    }
    log_info(fmt::format("Engine started, staging in {}", staging_->dir().string()));
}

TermbridgeService::~TermbridgeService() {
    shutdown();
}

// ── Interactive sessions ──────────────────────────────────────

Result<void> TermbridgeService::open_session(const std::string& session_id,
                                             const std::string& client_id,
                                             const ConnectionParams& params) {
    return lifecycle_.open(session_id, client_id, params);
}

Result<void> TermbridgeService::send_input(const std::string& session_id,
                                           const std::string& client_id,
                                           const std::string& data, bool pasted,
                                           bool is_last_line) {
    return lifecycle_.input(session_id, client_id, data, pasted, is_last_line);
}

std::optional<TerminalSize> TermbridgeService::resize(const std::string& session_id,
                                                      int cols, int rows) {
    return lifecycle_.resize(session_id, cols, rows);
}

Result<ResourceUsage> TermbridgeService::resource_usage(const std::string& session_id) {
    return lifecycle_.resource_usage(session_id);
}

Result<void> TermbridgeService::close_session(const std::string& session_id,
                                              const std::string& client_id) {
    return lifecycle_.close(session_id, client_id);
}

size_t TermbridgeService::disconnect_client(const std::string& client_id) {
    return lifecycle_.disconnect_client(client_id);
}

// ── Transfers ─────────────────────────────────────────────────

Result<UploadReply> TermbridgeService::upload_chunk(const ConnectionParams& params,
                                                    const UploadChunk& chunk) {
    return uploads_.accept(params, chunk);
}

Result<DownloadResult> TermbridgeService::download_file(const ConnectionParams& params,
                                                        const std::string& remote_path,
                                                        const std::string& transfer_id) {
    return downloads_.download(params, remote_path, transfer_id);
}

Result<FolderDownloadReply> TermbridgeService::download_folder(const ConnectionParams& params,
                                                               const std::string& remote_path,
                                                               const fs::path& target_dir,
                                                               const std::string& transfer_id) {
    return folders_.download(params, remote_path, target_dir, transfer_id);
}

std::optional<TransferStatus> TermbridgeService::get_progress(const std::string& transfer_id) const {
    return transfers_->status(transfer_id);
}

bool TermbridgeService::cancel_transfer(const std::string& transfer_id) {
    if (!transfers_->cancel_transfer(transfer_id)) return false;
    // An upload waiting for its next chunk would otherwise keep its staging file
    uploads_.discard(transfer_id);
    return true;
}

// ── Shutdown ──────────────────────────────────────────────────

void TermbridgeService::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    lifecycle_.shutdown();
    uploads_.abort_all();
    staging_->sweep();
    log_info("Engine stopped");
}
