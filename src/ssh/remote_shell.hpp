#pragma once

#include <cstddef>
#include <string>
#include <core/types.hpp>

// An interactive shell channel with a pseudo-terminal attached.
// Implementations are not required to be thread-safe; callers serialize
// access through the owning session's lock.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    // Non-blocking read. Returns the byte count (> 0), 0 when nothing is
    // pending, or a negative value once the channel or transport is closed.
    virtual long read(char* buf, size_t len) = 0;

    // Write all of `data`, retrying on flow-control back-pressure.
    virtual Result<void> write(const std::string& data) = 0;

    // Apply a new PTY size and update COLUMNS/LINES on the remote side.
    virtual Result<void> resize(int cols, int rows) = 0;

    virtual bool is_open() = 0;

    // Run `command` on a separate exec channel of the same connection and
    // return its standard output once the command exits. REMOTE on failure,
    // NETWORK if it has not finished within `timeout_ms`.
    virtual Result<std::string> exec(const std::string& command, int timeout_ms) = 0;

    // Close channel, then connection. Best effort, never fails.
    virtual void close() = 0;
};
