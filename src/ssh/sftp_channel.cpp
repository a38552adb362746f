#include "sftp_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>
#include <vector>

static RemoteStat to_remote_stat(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteStat st;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        st.permissions = static_cast<uint32_t>(attrs.permissions);
        st.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) st.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) st.mtime = static_cast<int64_t>(attrs.mtime);
    return st;
}

// ── SftpLink ──────────────────────────────────────────────────

SftpLink::~SftpLink() {
    if (sftp) {
        std::lock_guard<std::mutex> lock(*io_mutex());
        libssh2_sftp_shutdown(sftp);
        sftp = nullptr;
    }
    if (ssh) ssh->close();
}

Result<void> SftpLink::last_error(const std::string& op, const std::string& path) const {
    unsigned long code;
    {
        std::lock_guard<std::mutex> lock(*io_mutex());
        code = libssh2_sftp_last_error(sftp);
    }
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return Result<void>::Err(fmt::format("{}: no such file: {}", op, path), ErrorKind::NOT_FOUND);
    case LIBSSH2_FX_PERMISSION_DENIED:
        return Result<void>::Err(fmt::format("{}: permission denied: {}", op, path), ErrorKind::REMOTE);
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return Result<void>::Err(fmt::format("{}: already exists: {}", op, path), ErrorKind::REMOTE);
    case LIBSSH2_FX_DIR_NOT_EMPTY:
        return Result<void>::Err(fmt::format("{}: directory not empty: {}", op, path), ErrorKind::REMOTE);
    default:
        return Result<void>::Err(fmt::format("{} failed for {} (sftp status {})", op, path, code),
                                 ErrorKind::REMOTE);
    }
}

// ── SftpFile ──────────────────────────────────────────────────

SftpFile::SftpFile(LIBSSH2_SFTP_HANDLE* handle, std::shared_ptr<SftpLink> link, std::string path)
    : handle_(handle), link_(std::move(link)), path_(std::move(path)) {}

SftpFile::~SftpFile() {
    if (handle_) {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        libssh2_sftp_close(handle_);
        handle_ = nullptr;
    }
}

long SftpFile::read(char* buf, size_t len) {
    std::lock_guard<std::mutex> lock(*link_->io_mutex());
    ssize_t n = libssh2_sftp_read(handle_, buf, len);
    return static_cast<long>(n);
}

Result<void> SftpFile::write_all(const char* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*link_->io_mutex());
            w = libssh2_sftp_write(handle_, data + written, len - written);
        }
        if (w < 0) {
            return Result<void>::Err(fmt::format("SFTP write to {} failed ({})", path_, w),
                                     ErrorKind::REMOTE);
        }
        written += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

// ── SftpChannel ───────────────────────────────────────────────

SftpChannel::SftpChannel(std::shared_ptr<SftpLink> link) : link_(std::move(link)) {}

Result<std::unique_ptr<SftpChannel>> SftpChannel::open(std::shared_ptr<SshSession> ssh) {
    using R = Result<std::unique_ptr<SftpChannel>>;

    auto link = std::make_shared<SftpLink>();
    link->ssh = std::move(ssh);
    {
        std::lock_guard<std::mutex> lock(*link->io_mutex());
        link->sftp = libssh2_sftp_init(link->ssh->raw());
    }
    if (!link->sftp) {
        // link destructor closes the connection
        return R::Err("Failed to start SFTP subsystem", ErrorKind::UNKNOWN);
    }
    return R::Ok(std::unique_ptr<SftpChannel>(new SftpChannel(link)));
}

Result<RemoteStat> SftpChannel::stat(const std::string& path) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    int rc;
    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        rc = libssh2_sftp_stat_ex(link_->sftp, path.c_str(), static_cast<unsigned>(path.size()),
                                  LIBSSH2_SFTP_STAT, &attrs);
    }
    if (rc != 0) return Result<RemoteStat>::Err(link_->last_error("stat", path));
    return Result<RemoteStat>::Ok(to_remote_stat(attrs));
}

Result<std::vector<RemoteEntry>> SftpChannel::list(const std::string& path) {
    using R = Result<std::vector<RemoteEntry>>;
    std::string dir_path = path.empty() ? "/" : path;

    LIBSSH2_SFTP_HANDLE* dir;
    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        dir = libssh2_sftp_open_ex(link_->sftp, dir_path.c_str(),
                                   static_cast<unsigned>(dir_path.size()), 0, 0,
                                   LIBSSH2_SFTP_OPENDIR);
    }
    if (!dir) return R::Err(link_->last_error("opendir", dir_path));

    std::vector<RemoteEntry> out;
    std::vector<char> filename(SFTP_NAME_BUFFER);
    std::vector<char> longentry(SFTP_LONGENTRY_BUFFER);
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    size_t skipped = 0;

    Result<void> failure = Result<void>::Ok();
    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc;
        {
            std::lock_guard<std::mutex> lock(*link_->io_mutex());
            rc = libssh2_sftp_readdir_ex(dir, filename.data(), filename.size(),
                                         longentry.data(), longentry.size(), &attrs);
        }
        if (rc == 0) break;
        if (rc == LIBSSH2_ERROR_BUFFER_TOO_SMALL) {
            // libssh2 has already moved past the oversized entry
            skipped++;
            continue;
        }
        if (rc < 0) {
            failure = link_->last_error("readdir", dir_path);
            break;
        }
        std::string name(filename.data(), static_cast<size_t>(rc));
        if (name == "." || name == "..") continue;
        out.push_back(RemoteEntry{name, to_remote_stat(attrs)});
    }

    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        libssh2_sftp_close_handle(dir);
    }
    if (failure.is_err()) return R::Err(failure);
    if (skipped > 0) {
        log_warn(fmt::format("Listing {}: skipped {} entries with names over {} bytes", dir_path,
                             skipped, SFTP_NAME_BUFFER - 1));
    }
    return R::Ok(std::move(out));
}

Result<std::unique_ptr<RemoteFile>> SftpChannel::open_file(const std::string& path,
                                                           unsigned long flags, long mode) {
    using R = Result<std::unique_ptr<RemoteFile>>;
    LIBSSH2_SFTP_HANDLE* handle;
    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        handle = libssh2_sftp_open_ex(link_->sftp, path.c_str(), static_cast<unsigned>(path.size()),
                                      flags, mode, LIBSSH2_SFTP_OPENFILE);
    }
    if (!handle) return R::Err(link_->last_error("open", path));
    return R::Ok(std::unique_ptr<RemoteFile>(std::make_unique<SftpFile>(handle, link_, path)));
}

Result<std::unique_ptr<RemoteFile>> SftpChannel::open_read(const std::string& path) {
    return open_file(path, LIBSSH2_FXF_READ, 0);
}

Result<std::unique_ptr<RemoteFile>> SftpChannel::open_write(const std::string& path) {
    return open_file(path, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                     LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                     LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
}

Result<void> SftpChannel::remove(const std::string& path) {
    int rc;
    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        rc = libssh2_sftp_unlink_ex(link_->sftp, path.c_str(), static_cast<unsigned>(path.size()));
    }
    if (rc != 0) return link_->last_error("unlink", path);
    return Result<void>::Ok();
}

Result<void> SftpChannel::rmdir(const std::string& path) {
    int rc;
    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        rc = libssh2_sftp_rmdir_ex(link_->sftp, path.c_str(), static_cast<unsigned>(path.size()));
    }
    if (rc != 0) return link_->last_error("rmdir", path);
    return Result<void>::Ok();
}

Result<void> SftpChannel::mkdir(const std::string& path) {
    int rc;
    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        rc = libssh2_sftp_mkdir_ex(link_->sftp, path.c_str(), static_cast<unsigned>(path.size()),
                                   LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP |
                                   LIBSSH2_SFTP_S_IXGRP | LIBSSH2_SFTP_S_IROTH |
                                   LIBSSH2_SFTP_S_IXOTH);
    }
    if (rc != 0) return link_->last_error("mkdir", path);
    return Result<void>::Ok();
}

Result<void> SftpChannel::rename(const std::string& from, const std::string& to) {
    int rc;
    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        rc = libssh2_sftp_rename_ex(link_->sftp,
                                    from.c_str(), static_cast<unsigned>(from.size()),
                                    to.c_str(), static_cast<unsigned>(to.size()),
                                    LIBSSH2_SFTP_RENAME_OVERWRITE |
                                    LIBSSH2_SFTP_RENAME_ATOMIC |
                                    LIBSSH2_SFTP_RENAME_NATIVE);
    }
    if (rc != 0) return link_->last_error("rename", from);
    return Result<void>::Ok();
}

void SftpChannel::widen_window(uint64_t bytes) {
    unsigned long adjust = static_cast<unsigned long>(std::min<uint64_t>(bytes, SSH_MAX_WINDOW));
    unsigned int window = 0;
    {
        std::lock_guard<std::mutex> lock(*link_->io_mutex());
        LIBSSH2_CHANNEL* ch = libssh2_sftp_get_channel(link_->sftp);
        if (!ch) return;
        libssh2_channel_receive_window_adjust2(ch, adjust, 1, &window);
    }
    log_debug(fmt::format("SFTP receive window now {} bytes", window));
}
