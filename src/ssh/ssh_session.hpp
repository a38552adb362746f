#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Transport tuning applied to every connection.
struct TransportTuning {
    bool compress = true;
    int keepalive_secs = 60;
};

// One authenticated SSH transport: socket plus libssh2 session.
// Shared by the channels opened on it; the last owner disconnects.
// All libssh2 calls are protected by brief io_mutex holds.
class SshSession {
public:
    static Result<std::shared_ptr<SshSession>> establish(const ConnectionParams& params,
                                                         int timeout_secs,
                                                         const TransportTuning& tuning);
    ~SshSession();

    void close();
    bool is_active() const { return session_ != nullptr; }
    // Socket still connected (no HUP/ERR pending).
    bool transport_alive() const;
    void set_blocking(bool blocking);

    LIBSSH2_SESSION* raw() const { return session_; }
    std::shared_ptr<std::mutex> io_mutex() const { return io_mutex_; }
    const std::string& target() const { return target_; }

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

private:
    SshSession(socket_t sock, LIBSSH2_SESSION* session, std::string target);

    Result<void> authenticate(const ConnectionParams& params);

    socket_t sock_;
    LIBSSH2_SESSION* session_;
    std::string target_;
    std::shared_ptr<std::mutex> io_mutex_;
};
