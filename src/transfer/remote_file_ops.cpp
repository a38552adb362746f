#include "remote_file_ops.hpp"
#include <ssh/connection_factory.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <set>

static std::string extension_of(const std::string& path) {
    std::string name = remote_basename(path);
    auto dot = name.rfind('.');
    if (dot == std::string::npos) return "";
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

RemoteFileOps::RemoteFileOps(std::shared_ptr<ConnectionFactory> factory)
    : factory_(std::move(factory)) {}

bool RemoteFileOps::is_image_extension(const std::string& ext) {
    static const std::set<std::string> kImages{"png", "jpg", "jpeg", "gif", "bmp", "webp", "svg"};
    return kImages.count(ext) > 0;
}

Result<std::vector<DirEntry>> RemoteFileOps::list_directory(const ConnectionParams& params,
                                                            const std::string& path,
                                                            bool show_hidden) {
    using R = Result<std::vector<DirEntry>>;
    auto remote_fs = factory_->open_sftp(params);
    if (remote_fs.is_err()) return R::Err(remote_fs);

    auto entries = remote_fs.value->list(path);
    if (entries.is_err()) return R::Err(entries);

    std::vector<DirEntry> items;
    items.reserve(entries.value.size());
    for (const auto& e : entries.value) {
        bool hidden = !e.name.empty() && e.name[0] == '.';
        if (hidden && !show_hidden) continue;
        DirEntry item;
        item.name = e.name;
        item.path = join_remote_path(path, e.name);
        item.is_directory = e.attrs.is_dir;
        item.size = e.attrs.size;
        item.mod_time = e.attrs.mtime;
        item.is_hidden = hidden;
        items.push_back(std::move(item));
    }
    return R::Ok(std::move(items));
}

Result<void> RemoteFileOps::remove_recursive(RemoteFileSystem& remote_fs, const std::string& path) {
    auto st = remote_fs.stat(path);
    if (st.is_err()) return Result<void>::Err(st);

    if (!st.value.is_dir) return remote_fs.remove(path);

    auto entries = remote_fs.list(path);
    if (entries.is_err()) return Result<void>::Err(entries);
    for (const auto& e : entries.value) {
        auto removed = remove_recursive(remote_fs, join_remote_path(path, e.name));
        if (removed.is_err()) return removed;
    }
    return remote_fs.rmdir(path);
}

Result<void> RemoteFileOps::delete_item(const ConnectionParams& params, const std::string& path) {
    auto remote_fs = factory_->open_sftp(params);
    if (remote_fs.is_err()) return Result<void>::Err(remote_fs);

    auto removed = remove_recursive(*remote_fs.value, path);
    if (removed.is_err()) {
        log_error(fmt::format("Delete {} failed: {}", path, removed.error));
        return removed;
    }
    log_info(fmt::format("Deleted {}", path));
    return removed;
}

Result<void> RemoteFileOps::rename_item(const ConnectionParams& params,
                                        const std::string& old_path, const std::string& new_path) {
    auto remote_fs = factory_->open_sftp(params);
    if (remote_fs.is_err()) return Result<void>::Err(remote_fs);

    auto renamed = remote_fs.value->rename(old_path, new_path);
    if (renamed.is_ok()) log_info(fmt::format("Renamed {} to {}", old_path, new_path));
    return renamed;
}

Result<void> RemoteFileOps::create_folder(const ConnectionParams& params, const std::string& path) {
    auto remote_fs = factory_->open_sftp(params);
    if (remote_fs.is_err()) return Result<void>::Err(remote_fs);

    auto made = remote_fs.value->mkdir(path);
    if (made.is_ok()) log_info(fmt::format("Created folder {}", path));
    return made;
}

Result<FilePreview> RemoteFileOps::read_file(const ConnectionParams& params, const std::string& path) {
    using R = Result<FilePreview>;
    auto remote_fs = factory_->open_sftp(params);
    if (remote_fs.is_err()) return R::Err(remote_fs);

    auto st = remote_fs.value->stat(path);
    if (st.is_err()) return R::Err(st);
    if (st.value.is_dir) return R::Err(fmt::format("{} is a directory", path), ErrorKind::INVALID_INPUT);
    if (st.value.size > PREVIEW_MAX_BYTES) {
        return R::Err(fmt::format("File too large to preview ({} bytes)", st.value.size),
                      ErrorKind::TOO_LARGE);
    }

    auto file = remote_fs.value->open_read(path);
    if (file.is_err()) return R::Err(file);

    std::string raw;
    raw.reserve(static_cast<size_t>(st.value.size));
    char buf[SSH_READ_BUF_SIZE * 8];
    while (true) {
        long n = file.value->read(buf, sizeof(buf));
        if (n < 0) return R::Err(fmt::format("SFTP read error on {} ({})", path, n), ErrorKind::REMOTE);
        if (n == 0) break;
        raw.append(buf, static_cast<size_t>(n));
        if (raw.size() > PREVIEW_MAX_BYTES) {
            return R::Err("File too large to preview", ErrorKind::TOO_LARGE);
        }
    }

    FilePreview preview;
    preview.size = st.value.size;
    preview.extension = extension_of(path);
    if (is_image_extension(preview.extension)) {
        preview.type = PreviewType::IMAGE;
        preview.content = base64_encode(raw);
    } else {
        preview.type = PreviewType::TEXT;
        preview.content = utf8_replace_invalid(raw);
    }
    return R::Ok(std::move(preview));
}
