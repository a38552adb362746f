#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "remote_shell.hpp"
#include "remote_fs.hpp"

// Opens authenticated connections and the channels built on them.
// Any failure closes whatever was partially opened before returning.
class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    // Errors: NETWORK, AUTH, KEY, CREDENTIAL, UNKNOWN.
    virtual Result<std::unique_ptr<RemoteShell>> open_shell(const ConnectionParams& params) = 0;
    virtual Result<std::unique_ptr<RemoteFileSystem>> open_sftp(const ConnectionParams& params) = 0;
};

// libssh2-backed factory. Every call opens its own connection.
class Libssh2ConnectionFactory : public ConnectionFactory {
public:
    explicit Libssh2ConnectionFactory(int connect_timeout_secs = CONNECT_TIMEOUT_SECS);

    Result<std::unique_ptr<RemoteShell>> open_shell(const ConnectionParams& params) override;
    Result<std::unique_ptr<RemoteFileSystem>> open_sftp(const ConnectionParams& params) override;

private:
    int connect_timeout_secs_;
};

// Passwords travel base64-encoded. Anything that does not decode to valid
// UTF-8 is taken as a cleartext password.
std::string decode_password(const std::string& encoded);

// Check that the credential the auth type needs is present and, for key
// auth, that the key file is readable and looks like a private key.
Result<void> check_credentials(const ConnectionParams& params);
