#include "staging_area.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <system_error>

StagingArea::StagingArea(fs::path dir, int delete_retries, std::chrono::milliseconds delete_backoff)
    : dir_(std::move(dir)), delete_retries_(delete_retries > 0 ? delete_retries : 1),
      delete_backoff_(delete_backoff) {}

Result<fs::path> StagingArea::allocate(const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result<fs::path>::Err(
            fmt::format("Cannot create staging directory {}: {}", dir_.string(), ec.message()),
            ErrorKind::IO);
    }
    return Result<fs::path>::Ok(platform::unique_path(dir_, prefix));
}

bool StagingArea::remove_with_retry(const fs::path& path) const {
    for (int attempt = 1; attempt <= delete_retries_; attempt++) {
        std::error_code ec;
        fs::remove_all(path, ec);
        if (!ec && !fs::exists(path, ec)) return true;

        log_warn(fmt::format("Removing {} failed (attempt {}/{}): {}", path.string(),
                             attempt, delete_retries_, ec ? ec.message() : "still present"));
        if (attempt < delete_retries_) {
            platform::sleep_ms(static_cast<int>(delete_backoff_.count()));
        }
    }
    log_error(fmt::format("Giving up on staging path {}", path.string()));
    return false;
}

void StagingArea::sweep() const {
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return;
    if (remove_with_retry(dir_)) {
        log_info(fmt::format("Swept staging directory {}", dir_.string()));
    }
}

// ── StagingFile ───────────────────────────────────────────────

StagingFile::StagingFile(std::shared_ptr<StagingArea> area, fs::path path)
    : area_(std::move(area)), path_(std::move(path)) {}

StagingFile::~StagingFile() {
    release();
}

void StagingFile::release() {
    if (released_) return;
    released_ = true;
    area_->remove_with_retry(path_);
}
