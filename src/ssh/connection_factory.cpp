#include "connection_factory.hpp"
#include "ssh_session.hpp"
#include "shell_channel.hpp"
#include "sftp_channel.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

std::string decode_password(const std::string& encoded) {
    auto decoded = base64_decode(encoded);
    if (!decoded || !is_valid_utf8(*decoded)) {
        return encoded;
    }
    return *decoded;
}

Result<void> check_credentials(const ConnectionParams& params) {
    if (params.auth_type == "key") {
        if (params.private_key_path.empty()) {
            return Result<void>::Err("Private key path is required", ErrorKind::CREDENTIAL);
        }
        std::ifstream in(params.private_key_path, std::ios::binary);
        if (!in) {
            return Result<void>::Err("Failed to read private key file", ErrorKind::KEY);
        }
        std::string contents((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
        if (contents.find("PRIVATE KEY") == std::string::npos) {
            return Result<void>::Err("Invalid private key format or passphrase required",
                                     ErrorKind::KEY);
        }
        return Result<void>::Ok();
    }
    if (params.auth_type != "password") {
        return Result<void>::Err(fmt::format("Unknown auth type '{}'", params.auth_type),
                                 ErrorKind::CREDENTIAL);
    }
    if (params.password.empty()) {
        return Result<void>::Err("Password is required", ErrorKind::CREDENTIAL);
    }
    return Result<void>::Ok();
}

Libssh2ConnectionFactory::Libssh2ConnectionFactory(int connect_timeout_secs)
    : connect_timeout_secs_(connect_timeout_secs) {}

Result<std::unique_ptr<RemoteShell>> Libssh2ConnectionFactory::open_shell(
        const ConnectionParams& params) {
    using R = Result<std::unique_ptr<RemoteShell>>;

    TransportTuning tuning;
    tuning.compress = true;
    tuning.keepalive_secs = TRANSPORT_KEEPALIVE_SECS;

    auto ssh = SshSession::establish(params, connect_timeout_secs_, tuning);
    if (ssh.is_err()) return R::Err(ssh);

    auto shell = ShellChannel::open(ssh.value, {TERM_INITIAL_COLS, TERM_INITIAL_ROWS});
    if (shell.is_err()) {
        log_warn(fmt::format("Shell setup on {} failed: {}", ssh.value->target(), shell.error));
        return R::Err(shell);
    }
    return R::Ok(std::move(shell.value));
}

Result<std::unique_ptr<RemoteFileSystem>> Libssh2ConnectionFactory::open_sftp(
        const ConnectionParams& params) {
    using R = Result<std::unique_ptr<RemoteFileSystem>>;

    TransportTuning tuning;
    tuning.compress = true;
    tuning.keepalive_secs = TRANSPORT_KEEPALIVE_SECS;

    auto ssh = SshSession::establish(params, connect_timeout_secs_, tuning);
    if (ssh.is_err()) return R::Err(ssh);

    auto sftp = SftpChannel::open(ssh.value);
    if (sftp.is_err()) {
        log_warn(fmt::format("SFTP setup on {} failed: {}", ssh.value->target(), sftp.error));
        return R::Err(sftp);
    }
    return R::Ok(std::move(sftp.value));
}
