#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

class ConnectionFactory;
class RemoteFileSystem;

struct DirEntry {
    std::string name;
    std::string path;
    bool is_directory = false;
    uint64_t size = 0;
    int64_t mod_time = 0;          // epoch seconds
    bool is_hidden = false;
};

enum class PreviewType { TEXT, IMAGE };

struct FilePreview {
    PreviewType type = PreviewType::TEXT;
    std::string content;           // UTF-8 text, or base64 for images
    uint64_t size = 0;
    std::string extension;         // lowercase, without the dot
};

// One-shot file management requests. Each call opens its own SFTP
// connection and closes it before returning.
class RemoteFileOps {
public:
    explicit RemoteFileOps(std::shared_ptr<ConnectionFactory> factory);

    Result<std::vector<DirEntry>> list_directory(const ConnectionParams& params,
                                                 const std::string& path, bool show_hidden = true);
    // Directories are removed recursively.
    Result<void> delete_item(const ConnectionParams& params, const std::string& path);
    Result<void> rename_item(const ConnectionParams& params,
                             const std::string& old_path, const std::string& new_path);
    Result<void> create_folder(const ConnectionParams& params, const std::string& path);

    // Files above PREVIEW_MAX_BYTES fail with TOO_LARGE.
    Result<FilePreview> read_file(const ConnectionParams& params, const std::string& path);

    static Result<void> remove_recursive(RemoteFileSystem& remote_fs, const std::string& path);
    static bool is_image_extension(const std::string& ext);

private:
    std::shared_ptr<ConnectionFactory> factory_;
};
