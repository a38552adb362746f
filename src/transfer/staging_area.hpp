#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>

namespace fs = std::filesystem;

// Dedicated temp directory for upload/download staging files.
// Swept as a whole on shutdown.
class StagingArea {
public:
    explicit StagingArea(fs::path dir,
                         int delete_retries = STAGING_DELETE_RETRIES,
                         std::chrono::milliseconds delete_backoff =
                             std::chrono::milliseconds(STAGING_DELETE_BACKOFF_MS));

    const fs::path& dir() const { return dir_; }

    // Fresh unique path inside the staging directory (directory created on demand).
    Result<fs::path> allocate(const std::string& prefix);

    // Remove a file or directory tree, retrying with a fixed backoff.
    // Failures are logged, never propagated. Returns true if nothing remains.
    bool remove_with_retry(const fs::path& path) const;

    // Remove the whole staging directory.
    void sweep() const;

private:
    fs::path dir_;
    int delete_retries_;
    std::chrono::milliseconds delete_backoff_;
};

// Owns one staging path and deletes it exactly once.
class StagingFile {
public:
    StagingFile(std::shared_ptr<StagingArea> area, fs::path path);
    ~StagingFile();

    const fs::path& path() const { return path_; }

    // Delete now. Later calls (and the destructor) do nothing.
    void release();

    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

private:
    std::shared_ptr<StagingArea> area_;
    fs::path path_;
    bool released_ = false;
};
