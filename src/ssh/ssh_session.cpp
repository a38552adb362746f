#include "ssh_session.hpp"
#include "connection_factory.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>
#include <mutex>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback. Every prompt gets the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static void init_libssh2_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (libssh2_init(0) != 0) {
            log_error("libssh2_init failed");
        }
    });
}

static void free_session(LIBSSH2_SESSION* session, socket_t sock, const char* reason) {
    if (session) {
        libssh2_session_disconnect(session, reason);
        libssh2_session_free(session);
    }
    if (sock != TERMBRIDGE_INVALID_SOCKET) {
        platform::close_socket(sock);
    }
}

SshSession::SshSession(socket_t sock, LIBSSH2_SESSION* session, std::string target)
    : sock_(sock), session_(session), target_(std::move(target)),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SshSession::~SshSession() {
    close();
}

Result<std::shared_ptr<SshSession>> SshSession::establish(const ConnectionParams& params,
                                                          int timeout_secs,
                                                          const TransportTuning& tuning) {
    using R = Result<std::shared_ptr<SshSession>>;

    auto cred = check_credentials(params);
    if (cred.is_err()) return R::Err(cred);

    init_libssh2_once();

    std::string target = fmt::format("{}@{}:{}", params.user, params.host, params.port);
    log_debug(fmt::format("Connecting to {}", target));

    auto conn = platform::connect_tcp(params.host, params.port, timeout_secs * 1000);
    if (conn.is_err()) return R::Err(conn);
    socket_t sock = conn.value;

    LIBSSH2_SESSION* session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session) {
        platform::close_socket(sock);
        return R::Err("Failed to create SSH session", ErrorKind::UNKNOWN);
    }

    // Compression must be negotiated during the handshake
    if (tuning.compress) {
        libssh2_session_flag(session, LIBSSH2_FLAG_COMPRESS, 1);
    }

    // Blocking with a bounded timeout until authenticated
    libssh2_session_set_blocking(session, 1);
    libssh2_session_set_timeout(session, static_cast<long>(timeout_secs) * 1000);

    int rc = libssh2_session_handshake(session, sock);
    if (rc != 0) {
        free_session(session, sock, "Handshake failed");
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            return R::Err(fmt::format("SSH handshake with {} timed out", params.host),
                          ErrorKind::NETWORK);
        }
        return R::Err(fmt::format("SSH handshake with {} failed ({})", params.host, rc),
                      ErrorKind::NETWORK);
    }

    platform::enable_tcp_keepalive(sock);
    libssh2_keepalive_config(session, 1, static_cast<unsigned>(tuning.keepalive_secs));

    std::shared_ptr<SshSession> ssh(new SshSession(sock, session, target));
    auto auth = ssh->authenticate(params);
    if (auth.is_err()) {
        log_warn(fmt::format("Authentication to {} failed: {}", target, auth.error));
        ssh->close();
        return R::Err(auth);
    }

    log_info(fmt::format("Connected to {}", target));
    return R::Ok(std::move(ssh));
}

Result<void> SshSession::authenticate(const ConnectionParams& params) {
    int rc;

    if (params.auth_type == "key") {
        const char* passphrase = params.passphrase && !params.passphrase->empty()
                                     ? params.passphrase->c_str() : nullptr;
        rc = libssh2_userauth_publickey_fromfile_ex(
            session_, params.user.c_str(), static_cast<unsigned>(params.user.length()),
            nullptr, params.private_key_path.c_str(), passphrase);
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_FILE) {
            return Result<void>::Err("Invalid private key format or passphrase required",
                                     ErrorKind::KEY);
        }
        if (rc == LIBSSH2_ERROR_TIMEOUT || rc == LIBSSH2_ERROR_SOCKET_RECV ||
            rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_DISCONNECT) {
            return Result<void>::Err("Connection lost during authentication", ErrorKind::NETWORK);
        }
        return Result<void>::Err("Authentication failed (key rejected)", ErrorKind::AUTH);
    }

    std::string password = decode_password(params.password);

    char* auth_list = libssh2_userauth_list(session_, params.user.c_str(),
                                            static_cast<unsigned>(params.user.length()));
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        // Server accepted "none" auth
        return Result<void>::Ok();
    }
    std::string methods = auth_list ? auth_list : "";

    if (methods.empty() || methods.find("password") != std::string::npos) {
        rc = libssh2_userauth_password(session_, params.user.c_str(), password.c_str());
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            return Result<void>::Err("Connection timed out during authentication",
                                     ErrorKind::NETWORK);
        }
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data;
        kbd_data.password = password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(session_) = &kbd_data;

        rc = libssh2_userauth_keyboard_interactive(session_, params.user.c_str(), kbd_callback);
        *libssh2_session_abstract(session_) = nullptr;
        if (rc == 0) return Result<void>::Ok();
    }

    return Result<void>::Err("Authentication failed (check username/password)", ErrorKind::AUTH);
}

void SshSession::close() {
    // Each libssh2 call gets its own brief lock
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
        log_debug(fmt::format("Disconnected from {}", target_));
    }

    if (sock_ != TERMBRIDGE_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = TERMBRIDGE_INVALID_SOCKET;
    }
}

bool SshSession::transport_alive() const {
    if (!session_ || sock_ == TERMBRIDGE_INVALID_SOCKET) return false;
    int revents = platform::poll_socket(sock_, POLLIN, 0);
    return (revents & (POLLERR | POLLHUP | POLLNVAL)) == 0;
}

void SshSession::set_blocking(bool blocking) {
    if (!session_) return;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_session_set_blocking(session_, blocking ? 1 : 0);
}
