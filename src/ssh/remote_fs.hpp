#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

struct RemoteStat {
    bool is_dir = false;
    uint64_t size = 0;
    int64_t mtime = 0;          // epoch seconds
    uint32_t permissions = 0;
};

struct RemoteEntry {
    std::string name;
    RemoteStat attrs;
};

// An open remote file. Closed on destruction.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns bytes read (> 0), 0 at end of file, negative on error.
    virtual long read(char* buf, size_t len) = 0;
    virtual Result<void> write_all(const char* data, size_t len) = 0;
};

// File-transfer channel on an authenticated connection.
// Releasing the object closes the channel and its connection.
class RemoteFileSystem {
public:
    virtual ~RemoteFileSystem() = default;

    virtual Result<RemoteStat> stat(const std::string& path) = 0;
    // Entries of `path`, without "." and "..".
    virtual Result<std::vector<RemoteEntry>> list(const std::string& path) = 0;

    virtual Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) = 0;
    // Create or truncate.
    virtual Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path) = 0;

    virtual Result<void> remove(const std::string& path) = 0;
    virtual Result<void> rmdir(const std::string& path) = 0;
    virtual Result<void> mkdir(const std::string& path) = 0;
    virtual Result<void> rename(const std::string& from, const std::string& to) = 0;

    // Widen the flow-control window ahead of a bulk transfer.
    virtual void widen_window(uint64_t bytes) = 0;
};
