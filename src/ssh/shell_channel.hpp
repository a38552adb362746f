#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "remote_shell.hpp"
#include "ssh_session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Interactive shell on its own SSH connection.
// Owns the channel and the connection; both are released by close() or
// on destruction. All libssh2 calls are protected by brief io_mutex holds.
class ShellChannel : public RemoteShell {
public:
    // Open a session channel with a maximal window, request a PTY of
    // `initial` size with the colour/locale environment, start a shell,
    // then switch the transport to non-blocking.
    static Result<std::unique_ptr<ShellChannel>> open(std::shared_ptr<SshSession> ssh,
                                                      TerminalSize initial);
    ~ShellChannel() override;

    long read(char* buf, size_t len) override;
    Result<void> write(const std::string& data) override;
    Result<void> resize(int cols, int rows) override;
    bool is_open() override;
    Result<std::string> exec(const std::string& command, int timeout_ms) override;
    void close() override;

    // Non-copyable
    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

private:
    ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<SshSession> ssh);

    // Best effort: most servers only accept variables listed in AcceptEnv.
    void set_env(const std::string& name, const std::string& value);

    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<SshSession> ssh_;
    std::shared_ptr<std::mutex> io_mutex_;
};
