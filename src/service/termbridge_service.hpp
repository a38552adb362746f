#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/connection_factory.hpp>
#include <session/event_sink.hpp>
#include <session/session_lifecycle.hpp>
#include <session/session_registry.hpp>
#include <transfer/chunked_upload.hpp>
#include <transfer/folder_download.hpp>
#include <transfer/remote_file_ops.hpp>
#include <transfer/staging_area.hpp>
#include <transfer/streaming_download.hpp>
#include <transfer/transfer_manager.hpp>

// Headless facade over the session and transfer engine. The request layer
// maps its endpoints onto these calls and forwards events from `sink`.
class TermbridgeService {
public:
    // A null factory selects the libssh2 implementation.
    TermbridgeService(const Config& config, std::shared_ptr<EventSink> sink,
                      std::shared_ptr<ConnectionFactory> factory = nullptr);
    ~TermbridgeService();

    // ── Interactive sessions ──────────────────────────────────

    Result<void> open_session(const std::string& session_id, const std::string& client_id,
                              const ConnectionParams& params);
    Result<void> send_input(const std::string& session_id, const std::string& client_id,
                            const std::string& data, bool pasted, bool is_last_line);
    // No-op (nullopt) for an unknown session.
    std::optional<TerminalSize> resize(const std::string& session_id, int cols, int rows);
    Result<void> close_session(const std::string& session_id, const std::string& client_id);
    size_t disconnect_client(const std::string& client_id);
    // CPU and memory load of the host behind a live session.
    Result<ResourceUsage> resource_usage(const std::string& session_id);

    // ── Transfers ─────────────────────────────────────────────

    Result<UploadReply> upload_chunk(const ConnectionParams& params, const UploadChunk& chunk);
    Result<DownloadResult> download_file(const ConnectionParams& params,
                                         const std::string& remote_path,
                                         const std::string& transfer_id);
    Result<FolderDownloadReply> download_folder(const ConnectionParams& params,
                                                const std::string& remote_path,
                                                const fs::path& target_dir,
                                                const std::string& transfer_id);
    std::optional<TransferStatus> get_progress(const std::string& transfer_id) const;
    // True if a live transfer was found.
    bool cancel_transfer(const std::string& transfer_id);

    // ── Remote file operations ────────────────────────────────

    RemoteFileOps& files() { return files_; }

    // ── Shutdown ──────────────────────────────────────────────

    // Close every session, drop pending uploads, sweep the staging directory.
    // Safe to call more than once.
    void shutdown();

    SessionRegistry& sessions() { return *registry_; }
    TransferManager& transfers() { return *transfers_; }
    StagingArea& staging() { return *staging_; }

    TermbridgeService(const TermbridgeService&) = delete;
    TermbridgeService& operator=(const TermbridgeService&) = delete;

private:
    std::shared_ptr<ConnectionFactory> factory_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<TransferManager> transfers_;
    std::shared_ptr<StagingArea> staging_;
    SessionLifecycle lifecycle_;
    ChunkedUploadAssembler uploads_;
    StreamingDownloader downloads_;
    FolderDownloader folders_;
    RemoteFileOps files_;
    bool shut_down_ = false;
};
