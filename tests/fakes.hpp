#pragma once

// In-memory stand-ins for the SSH layer, shared by the engine tests.

#include <ssh/connection_factory.hpp>
#include <session/event_sink.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// ── Shell ─────────────────────────────────────────────────────

class FakeShell : public RemoteShell {
public:
    // Queue bytes for the next read() calls. Each push is returned by one read.
    void push_output(const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_.push_back(data);
    }

    // Remote end hangs up: read() reports closed once queued output drains.
    void hang_up() { remote_closed_ = true; }

    // Make close() block until open_gate() is called.
    void hold_close() { gate_closed_ = true; }
    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_closed_ = false;
        }
        gate_.notify_all();
    }
    bool close_entered() const { return close_entered_; }

    long read(char* buf, size_t len) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return -1;
        if (output_.empty()) return remote_closed_ ? -1 : 0;
        std::string& front = output_.front();
        size_t n = std::min(len, front.size());
        std::copy(front.begin(), front.begin() + static_cast<long>(n), buf);
        front.erase(0, n);
        if (front.empty()) output_.pop_front();
        return static_cast<long>(n);
    }

    Result<void> write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return Result<void>::Err("channel closed", ErrorKind::IO);
        writes_.push_back(data);
        return Result<void>::Ok();
    }

    Result<void> resize(int cols, int rows) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sizes_.push_back(TerminalSize{cols, rows});
        return Result<void>::Ok();
    }

    bool is_open() override { return !closed_ && !(remote_closed_ && pending_empty()); }

    // Output returned by exec() for `command`; unknown commands fail.
    void on_exec(const std::string& command, const std::string& output) {
        std::lock_guard<std::mutex> lock(mutex_);
        exec_outputs_[command] = output;
    }

    Result<std::string> exec(const std::string& command, int) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return Result<std::string>::Err("channel closed", ErrorKind::IO);
        execs_.push_back(command);
        auto it = exec_outputs_.find(command);
        if (it == exec_outputs_.end()) {
            return Result<std::string>::Err("exec refused", ErrorKind::REMOTE);
        }
        return Result<std::string>::Ok(it->second);
    }

    std::vector<std::string> execs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return execs_;
    }

    void close() override {
        close_entered_ = true;
        std::unique_lock<std::mutex> lock(mutex_);
        gate_.wait(lock, [this] { return !gate_closed_; });
        closed_ = true;
        close_calls_++;
    }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }
    std::vector<TerminalSize> sizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sizes_;
    }
    int close_calls() const { return close_calls_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable gate_;
    std::deque<std::string> output_;
    std::vector<std::string> writes_;
    std::vector<TerminalSize> sizes_;
    std::map<std::string, std::string> exec_outputs_;
    std::vector<std::string> execs_;
    std::atomic<bool> remote_closed_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> close_entered_{false};
    bool gate_closed_ = false;
    std::atomic<int> close_calls_{0};

    bool pending_empty() {
        std::lock_guard<std::mutex> lock(mutex_);
        return output_.empty();
    }
};

// Forwards to a FakeShell the test keeps a handle on.
class SharedShell : public RemoteShell {
public:
    explicit SharedShell(std::shared_ptr<FakeShell> shell) : shell_(std::move(shell)) {}

    long read(char* buf, size_t len) override { return shell_->read(buf, len); }
    Result<void> write(const std::string& data) override { return shell_->write(data); }
    Result<void> resize(int cols, int rows) override { return shell_->resize(cols, rows); }
    bool is_open() override { return shell_->is_open(); }
    Result<std::string> exec(const std::string& command, int timeout_ms) override {
        return shell_->exec(command, timeout_ms);
    }
    void close() override { shell_->close(); }

private:
    std::shared_ptr<FakeShell> shell_;
};

// ── File system ───────────────────────────────────────────────

// Remote tree shared by every connection the fake factory opens.
struct FakeStore {
    std::mutex mutex;
    std::map<std::string, std::string> files;
    std::set<std::string> dirs{"/"};
    size_t read_quantum = 64 * 1024;
    bool fail_writes = false;
    // Runs after every successful write_all with the bytes written so far.
    std::function<void(uint64_t)> on_write;
    // Runs after every read that returned data, with the file offset reached.
    std::function<void(uint64_t)> on_read;
    int sftp_opens = 0;
    int sftp_closes = 0;

    void add_dir(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        dirs.insert(path);
    }
    void add_file(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex);
        files[path] = content;
    }
    bool has_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        return files.count(path) > 0;
    }
    std::string file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = files.find(path);
        return it == files.end() ? std::string() : it->second;
    }
    bool has_dir(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        return dirs.count(path) > 0;
    }
};

inline std::string fake_parent(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

class FakeRemoteFile : public RemoteFile {
public:
    FakeRemoteFile(std::shared_ptr<FakeStore> store, std::string path)
        : store_(std::move(store)), path_(std::move(path)) {}

    long read(char* buf, size_t len) override {
        size_t n;
        {
            std::lock_guard<std::mutex> lock(store_->mutex);
            const std::string& data = store_->files[path_];
            if (offset_ >= data.size()) return 0;
            n = std::min({len, store_->read_quantum, data.size() - offset_});
            std::copy(data.begin() + static_cast<long>(offset_),
                      data.begin() + static_cast<long>(offset_ + n), buf);
            offset_ += n;
        }
        if (store_->on_read) store_->on_read(offset_);
        return static_cast<long>(n);
    }

    Result<void> write_all(const char* data, size_t len) override {
        uint64_t written;
        {
            std::lock_guard<std::mutex> lock(store_->mutex);
            if (store_->fail_writes) return Result<void>::Err("write failed", ErrorKind::REMOTE);
            store_->files[path_].append(data, len);
            written = store_->files[path_].size();
        }
        if (store_->on_write) store_->on_write(written);
        return Result<void>::Ok();
    }

private:
    std::shared_ptr<FakeStore> store_;
    std::string path_;
    size_t offset_ = 0;
};

class FakeRemoteFs : public RemoteFileSystem {
public:
    explicit FakeRemoteFs(std::shared_ptr<FakeStore> store) : store_(std::move(store)) {}
    ~FakeRemoteFs() override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->sftp_closes++;
    }

    Result<RemoteStat> stat(const std::string& path) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        RemoteStat st;
        if (store_->dirs.count(path)) {
            st.is_dir = true;
            return Result<RemoteStat>::Ok(st);
        }
        auto it = store_->files.find(path);
        if (it == store_->files.end()) return Result<RemoteStat>::Err("No such file", ErrorKind::NOT_FOUND);
        st.size = it->second.size();
        st.mtime = 1700000000;
        return Result<RemoteStat>::Ok(st);
    }

    Result<std::vector<RemoteEntry>> list(const std::string& path) override {
        using R = Result<std::vector<RemoteEntry>>;
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (!store_->dirs.count(path)) return R::Err("No such directory", ErrorKind::NOT_FOUND);
        std::vector<RemoteEntry> out;
        for (const auto& d : store_->dirs) {
            if (d != path && fake_parent(d) == path) {
                RemoteEntry e;
                e.name = d.substr(d.rfind('/') + 1);
                e.attrs.is_dir = true;
                out.push_back(e);
            }
        }
        for (const auto& f : store_->files) {
            if (fake_parent(f.first) == path) {
                RemoteEntry e;
                e.name = f.first.substr(f.first.rfind('/') + 1);
                e.attrs.size = f.second.size();
                out.push_back(e);
            }
        }
        return R::Ok(out);
    }

    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override {
        using R = Result<std::unique_ptr<RemoteFile>>;
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (!store_->files.count(path)) return R::Err("No such file", ErrorKind::NOT_FOUND);
        return R::Ok(std::unique_ptr<RemoteFile>(new FakeRemoteFile(store_, path)));
    }

    Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path) override {
        using R = Result<std::unique_ptr<RemoteFile>>;
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (!store_->dirs.count(fake_parent(path))) return R::Err("No such directory", ErrorKind::NOT_FOUND);
        store_->files[path].clear();
        return R::Ok(std::unique_ptr<RemoteFile>(new FakeRemoteFile(store_, path)));
    }

    Result<void> remove(const std::string& path) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (store_->files.erase(path) == 0) return Result<void>::Err("No such file", ErrorKind::NOT_FOUND);
        return Result<void>::Ok();
    }

    Result<void> rmdir(const std::string& path) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        for (const auto& f : store_->files) {
            if (fake_parent(f.first) == path) return Result<void>::Err("Not empty", ErrorKind::REMOTE);
        }
        if (store_->dirs.erase(path) == 0) return Result<void>::Err("No such directory", ErrorKind::NOT_FOUND);
        return Result<void>::Ok();
    }

    Result<void> mkdir(const std::string& path) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (store_->dirs.count(path) || store_->files.count(path)) {
            return Result<void>::Err("Already exists", ErrorKind::REMOTE);
        }
        store_->dirs.insert(path);
        return Result<void>::Ok();
    }

    Result<void> rename(const std::string& from, const std::string& to) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->files.find(from);
        if (it == store_->files.end()) return Result<void>::Err("No such file", ErrorKind::NOT_FOUND);
        store_->files[to] = it->second;
        store_->files.erase(from);
        return Result<void>::Ok();
    }

    void widen_window(uint64_t bytes) override { widened_ = bytes; }

private:
    std::shared_ptr<FakeStore> store_;
    uint64_t widened_ = 0;
};

// ── Factory ───────────────────────────────────────────────────

class FakeConnectionFactory : public ConnectionFactory {
public:
    std::shared_ptr<FakeStore> store = std::make_shared<FakeStore>();

    // Shells handed out by open_shell, in order. An empty queue yields a fresh one.
    void queue_shell(std::shared_ptr<FakeShell> shell) {
        std::lock_guard<std::mutex> lock(mutex_);
        shells_.push_back(std::move(shell));
    }

    void fail_with(const std::string& error, ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = error;
        kind_ = kind;
    }

    std::shared_ptr<FakeShell> last_shell() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }
    int shell_opens() const { return shell_opens_; }

    Result<std::unique_ptr<RemoteShell>> open_shell(const ConnectionParams&) override {
        using R = Result<std::unique_ptr<RemoteShell>>;
        std::lock_guard<std::mutex> lock(mutex_);
        if (kind_ != ErrorKind::NONE) return R::Err(error_, kind_);
        shell_opens_++;
        std::shared_ptr<FakeShell> shell;
        if (!shells_.empty()) {
            shell = shells_.front();
            shells_.pop_front();
        } else {
            shell = std::make_shared<FakeShell>();
        }
        last_ = shell;
        return R::Ok(std::unique_ptr<RemoteShell>(new SharedShell(shell)));
    }

    Result<std::unique_ptr<RemoteFileSystem>> open_sftp(const ConnectionParams&) override {
        using R = Result<std::unique_ptr<RemoteFileSystem>>;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (kind_ != ErrorKind::NONE) return R::Err(error_, kind_);
        }
        {
            std::lock_guard<std::mutex> lock(store->mutex);
            store->sftp_opens++;
        }
        return R::Ok(std::unique_ptr<RemoteFileSystem>(new FakeRemoteFs(store)));
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<FakeShell>> shells_;
    std::shared_ptr<FakeShell> last_;
    std::string error_;
    ErrorKind kind_ = ErrorKind::NONE;
    std::atomic<int> shell_opens_{0};
};

// ── Events ────────────────────────────────────────────────────

class RecordingSink : public EventSink {
public:
    struct Closed {
        std::string session_id;
        std::string reason;
    };

    // Slows on_connected down to widen open/close interleavings.
    std::atomic<int> connect_delay_ms{0};

    void on_connected(const std::string& session_id) override {
        if (int delay = connect_delay_ms.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        connected_.push_back(session_id);
        events_.push_back("connected:" + session_id);
    }

    void on_output(const std::string& session_id, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        output_[session_id].push_back(text);
    }

    void on_closed(const std::string& session_id, const std::string& reason) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_.push_back(Closed{session_id, reason});
            events_.push_back("closed:" + session_id);
        }
        cv_.notify_all();
    }

    std::vector<std::string> connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }
    // Connected and closed notices in arrival order, as "connected:<id>" / "closed:<id>".
    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    std::vector<std::string> output(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = output_.find(session_id);
        return it == output_.end() ? std::vector<std::string>() : it->second;
    }
    std::string joined_output(const std::string& session_id) const {
        std::string all;
        for (const auto& s : output(session_id)) all += s;
        return all;
    }
    std::vector<Closed> closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }
    size_t closed_count(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(closed_.begin(), closed_.end(),
            [&](const Closed& c) { return c.session_id == session_id; }));
    }

    bool wait_closed(const std::string& session_id, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            return std::any_of(closed_.begin(), closed_.end(),
                               [&](const Closed& c) { return c.session_id == session_id; });
        });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<std::string> connected_;
    std::map<std::string, std::vector<std::string>> output_;
    std::vector<Closed> closed_;
    std::vector<std::string> events_;
};

// Poll `pred` until it holds or `timeout` passes.
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
