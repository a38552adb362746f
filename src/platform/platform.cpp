#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <random>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#else
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path unique_path(const fs::path& dir, const std::string& prefix) {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng(std::random_device{}());
    static const char HEX[] = "0123456789abcdef";

    for (;;) {
        std::string name = prefix + "_";
        {
            std::lock_guard<std::mutex> lock(rng_mutex);
            uint64_t bits = rng();
            for (int i = 0; i < 16; ++i) {
                name += HEX[bits & 0xF];
                bits >>= 4;
            }
        }
        fs::path p = dir / name;
        std::error_code ec;
        if (!fs::exists(p, ec)) return p;
    }
}

int append_durable(const fs::path& path, const char* data, size_t len) {
#ifdef _WIN32
    int fd = _open(path.string().c_str(), _O_WRONLY | _O_APPEND | _O_CREAT | _O_BINARY, 0600);
#else
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0600);
#endif
    if (fd < 0) return errno;

    size_t written = 0;
    int err = 0;
    while (written < len) {
#ifdef _WIN32
        int n = _write(fd, data + written, static_cast<unsigned>(len - written));
#else
        ssize_t n = ::write(fd, data + written, len - written);
#endif
        if (n < 0) {
            if (errno == EINTR) continue;
            err = errno;
            break;
        }
        written += static_cast<size_t>(n);
    }

#ifdef _WIN32
    if (err == 0 && _commit(fd) != 0) err = errno;
    _close(fd);
#else
    if (err == 0 && ::fsync(fd) != 0) err = errno;
    if (::close(fd) != 0 && err == 0) err = errno;
#endif
    return err;
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
