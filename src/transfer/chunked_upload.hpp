#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "staging_area.hpp"
#include "transfer_progress.hpp"

class ConnectionFactory;
class TransferManager;

struct UploadChunk {
    std::string transfer_id;
    uint64_t chunk_index = 0;
    bool is_last_chunk = true;
    uint64_t total_size = 0;       // declared by the client on chunk 0
    std::string remote_dir;
    std::string filename;
    std::string data_base64;
};

enum class UploadOutcome { CHUNK_ACCEPTED, COMPLETED, CANCELLED };

const char* upload_outcome_name(UploadOutcome outcome);

struct UploadReply {
    UploadOutcome outcome = UploadOutcome::CHUNK_ACCEPTED;
    uint64_t next_index = 0;       // index the assembler expects next
    uint64_t staged_bytes = 0;
    std::string remote_path;       // set on COMPLETED
};

// Reassembles an upload sent as ordered base64 chunks into a staging file,
// then pushes it to `remote_dir/filename` over SFTP on the last chunk.
//
// Chunk indices are strictly sequential. An index below the next expected one
// is a re-delivery and is acknowledged without touching the staging file; an
// index above it is rejected with OUT_OF_ORDER and changes nothing.
//
// The staging file and the transfer entry are released on every exit path.
class ChunkedUploadAssembler {
public:
    ChunkedUploadAssembler(std::shared_ptr<ConnectionFactory> factory,
                           std::shared_ptr<TransferManager> transfers,
                           std::shared_ptr<StagingArea> staging);
    ~ChunkedUploadAssembler();

    // Errors: NOT_FOUND, OUT_OF_ORDER, INVALID_INPUT, IO, plus connection
    // and remote errors from the final push.
    Result<UploadReply> accept(const ConnectionParams& params, const UploadChunk& chunk);

    // Drop a pending upload unless a chunk is being processed right now (that
    // chunk notices the cancellation itself). Returns true if it was dropped.
    bool discard(const std::string& transfer_id);

    // Drop every pending upload.
    void abort_all();

    size_t pending() const;

    ChunkedUploadAssembler(const ChunkedUploadAssembler&) = delete;
    ChunkedUploadAssembler& operator=(const ChunkedUploadAssembler&) = delete;

private:
    struct PendingUpload {
        std::mutex op;
        std::unique_ptr<StagingFile> staging;
        std::shared_ptr<TransferProgress> progress;
        uint64_t next_index = 0;
        bool finished = false;
    };

    std::shared_ptr<ConnectionFactory> factory_;
    std::shared_ptr<TransferManager> transfers_;
    std::shared_ptr<StagingArea> staging_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PendingUpload>> uploads_;

    Result<std::shared_ptr<PendingUpload>> begin(const UploadChunk& chunk);
    Result<UploadReply> append(const UploadChunk& chunk, PendingUpload& up);
    Result<UploadReply> push(const ConnectionParams& params, const UploadChunk& chunk,
                             PendingUpload& up);

    // Caller holds up.op.
    void finish(const std::string& transfer_id, PendingUpload& up);
    Result<UploadReply> cancelled_reply(const std::string& transfer_id, PendingUpload& up);
};
