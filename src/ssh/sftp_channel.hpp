#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "remote_fs.hpp"
#include "ssh_session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

// SFTP subsystem plus the connection it runs on. Shared between the
// channel and every file it opened so handles close before shutdown.
struct SftpLink {
    LIBSSH2_SFTP* sftp = nullptr;
    std::shared_ptr<SshSession> ssh;

    ~SftpLink();
    std::shared_ptr<std::mutex> io_mutex() const { return ssh->io_mutex(); }
    // Map the last SFTP status to an error for `op` on `path`.
    Result<void> last_error(const std::string& op, const std::string& path) const;
};

class SftpFile : public RemoteFile {
public:
    SftpFile(LIBSSH2_SFTP_HANDLE* handle, std::shared_ptr<SftpLink> link, std::string path);
    ~SftpFile() override;

    long read(char* buf, size_t len) override;
    Result<void> write_all(const char* data, size_t len) override;

    SftpFile(const SftpFile&) = delete;
    SftpFile& operator=(const SftpFile&) = delete;

private:
    LIBSSH2_SFTP_HANDLE* handle_;
    std::shared_ptr<SftpLink> link_;
    std::string path_;
};

// Blocking SFTP channel on a dedicated connection.
class SftpChannel : public RemoteFileSystem {
public:
    static Result<std::unique_ptr<SftpChannel>> open(std::shared_ptr<SshSession> ssh);

    Result<RemoteStat> stat(const std::string& path) override;
    Result<std::vector<RemoteEntry>> list(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path) override;
    Result<void> remove(const std::string& path) override;
    Result<void> rmdir(const std::string& path) override;
    Result<void> mkdir(const std::string& path) override;
    Result<void> rename(const std::string& from, const std::string& to) override;
    void widen_window(uint64_t bytes) override;

private:
    explicit SftpChannel(std::shared_ptr<SftpLink> link);

    Result<std::unique_ptr<RemoteFile>> open_file(const std::string& path,
                                                  unsigned long flags, long mode);

    std::shared_ptr<SftpLink> link_;
};
