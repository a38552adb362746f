#include "shell_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <utility>
#include <vector>

ShellChannel::ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<SshSession> ssh)
    : ch_(ch), ssh_(std::move(ssh)), io_mutex_(ssh_->io_mutex()) {}

ShellChannel::~ShellChannel() {
    close();
}

Result<std::unique_ptr<ShellChannel>> ShellChannel::open(std::shared_ptr<SshSession> ssh,
                                                         TerminalSize initial) {
    using R = Result<std::unique_ptr<ShellChannel>>;
    LIBSSH2_SESSION* session = ssh->raw();

    // Still in blocking mode from establish()
    static const char kSession[] = "session";
    LIBSSH2_CHANNEL* ch = libssh2_channel_open_ex(session, kSession, sizeof(kSession) - 1,
                                                  SSH_MAX_WINDOW, SSH_MAX_PACKET, nullptr, 0);
    if (!ch) {
        ssh->close();
        return R::Err("Failed to open SSH channel", ErrorKind::UNKNOWN);
    }

    std::unique_ptr<ShellChannel> shell(new ShellChannel(ch, ssh));

    std::vector<std::pair<std::string, std::string>> env{
        {"TERM", TERM_TYPE},
        {"COLORTERM", "truecolor"},
        {"TERM_PROGRAM", "xterm"},
        {"LANG", "en_US.UTF-8"},
        {"LC_ALL", "en_US.UTF-8"},
        {"FORCE_COLOR", "true"},
        {"COLUMNS", std::to_string(initial.cols)},
        {"LINES", std::to_string(initial.rows)},
    };
    for (const auto& kv : env) {
        shell->set_env(kv.first, kv.second);
    }

    int rc = libssh2_channel_request_pty_ex(ch, TERM_TYPE,
                                            static_cast<unsigned>(std::strlen(TERM_TYPE)),
                                            nullptr, 0, initial.cols, initial.rows, 0, 0);
    if (rc != 0) {
        shell->close();
        return R::Err(fmt::format("Failed to request PTY ({})", rc), ErrorKind::UNKNOWN);
    }

    rc = libssh2_channel_shell(ch);
    if (rc != 0) {
        shell->close();
        return R::Err("Failed to request shell", ErrorKind::UNKNOWN);
    }

    ssh->set_blocking(false);
    return R::Ok(std::move(shell));
}

void ShellChannel::set_env(const std::string& name, const std::string& value) {
    int rc;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(CHANNEL_WRITE_STALL_MS);
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_setenv_ex(ch_, name.c_str(), static_cast<unsigned>(name.size()),
                                           value.c_str(), static_cast<unsigned>(value.size()));
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(10);
    } while (std::chrono::steady_clock::now() < deadline);

    if (rc != 0) {
        log_debug(fmt::format("setenv {} refused by server ({})", name, rc));
    }
}

long ShellChannel::read(char* buf, size_t len) {
    if (!ch_) return -1;

    std::lock_guard<std::mutex> lock(*io_mutex_);
    ssize_t n = libssh2_channel_read(ch_, buf, len);
    if (n > 0) return static_cast<long>(n);

    if (n == LIBSSH2_ERROR_EAGAIN || n == 0) {
        if (libssh2_channel_eof(ch_)) return -1;
        // Drive transport keepalives while idle
        int next = 0;
        if (libssh2_keepalive_send(ssh_->raw(), &next) != 0 &&
            libssh2_session_last_errno(ssh_->raw()) != LIBSSH2_ERROR_EAGAIN) {
            return -1;
        }
        return 0;
    }
    return -1;
}

Result<void> ShellChannel::write(const std::string& data) {
    if (!ch_) return Result<void>::Err("Channel is closed", ErrorKind::IO);

    size_t sent = 0;
    auto stall_start = std::chrono::steady_clock::now();
    while (sent < data.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(ch_, data.data() + sent, data.size() - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            auto stalled = std::chrono::steady_clock::now() - stall_start;
            if (stalled > std::chrono::milliseconds(CHANNEL_WRITE_STALL_MS)) {
                return Result<void>::Err("Write stalled (EAGAIN for too long)", ErrorKind::IO);
            }
            platform::sleep_ms(10);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(fmt::format("Channel write error ({})", w), ErrorKind::IO);
        }
        sent += static_cast<size_t>(w);
        stall_start = std::chrono::steady_clock::now();
    }
    return Result<void>::Ok();
}

Result<void> ShellChannel::resize(int cols, int rows) {
    if (!ch_) return Result<void>::Err("Channel is closed", ErrorKind::IO);

    int rc;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(CHANNEL_WRITE_STALL_MS);
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_request_pty_size_ex(ch_, cols, rows, 0, 0);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(10);
    } while (std::chrono::steady_clock::now() < deadline);

    if (rc != 0) {
        return Result<void>::Err(fmt::format("PTY resize failed ({})", rc), ErrorKind::IO);
    }

    set_env("COLUMNS", std::to_string(cols));
    set_env("LINES", std::to_string(rows));
    return Result<void>::Ok();
}

Result<std::string> ShellChannel::exec(const std::string& command, int timeout_ms) {
    using R = Result<std::string>;
    if (!ch_ || !ssh_ || !ssh_->is_active()) return R::Err("Channel is closed", ErrorKind::IO);

    LIBSSH2_SESSION* session = ssh_->raw();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    auto timed_out = [&] { return std::chrono::steady_clock::now() >= deadline; };

    // The transport is non-blocking here, so every step retries on EAGAIN
    LIBSSH2_CHANNEL* exec_ch = nullptr;
    while (!exec_ch) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            exec_ch = libssh2_channel_open_session(session);
            if (!exec_ch && libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) {
                return R::Err("Failed to open exec channel", ErrorKind::REMOTE);
            }
        }
        if (exec_ch) break;
        if (timed_out()) return R::Err("Timed out opening exec channel", ErrorKind::NETWORK);
        platform::sleep_ms(10);
    }

    auto release = [&] {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_close(exec_ch);
        libssh2_channel_free(exec_ch);
    };

    int rc;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(exec_ch, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN || timed_out()) break;
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        release();
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return R::Err("Timed out starting remote command", ErrorKind::NETWORK);
        }
        return R::Err(fmt::format("Remote command refused ({})", rc), ErrorKind::REMOTE);
    }

    std::string output;
    char buf[SSH_READ_BUF_SIZE];
    for (;;) {
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(exec_ch, buf, sizeof(buf));
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) eof = libssh2_channel_eof(exec_ch) != 0;
        }
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            release();
            return R::Err(fmt::format("Reading command output failed ({})", n), ErrorKind::REMOTE);
        }
        if (eof) break;
        if (timed_out()) {
            release();
            return R::Err(fmt::format("'{}' did not finish within {} ms", command, timeout_ms),
                          ErrorKind::NETWORK);
        }
        platform::sleep_ms(10);
    }

    release();
    return R::Ok(std::move(output));
}

bool ShellChannel::is_open() {
    if (!ch_ || !ssh_ || !ssh_->is_active()) return false;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (libssh2_channel_eof(ch_)) return false;
    }
    return ssh_->transport_alive();
}

void ShellChannel::close() {
    if (ch_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_close(ch_);
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_free(ch_);
        }
        ch_ = nullptr;
    }
    if (ssh_) {
        ssh_->close();
        ssh_.reset();
    }
}
