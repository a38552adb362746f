#include "termbridge_cli.hpp"
#include "theme.hpp"
#include <service/termbridge_service.hpp>
#include <core/constants.hpp>
#include <core/format_units.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

namespace {

constexpr char kEscapeKey = 0x1d;  // Ctrl-]
const std::string kSessionId = "cli";
const std::string kClientId = "local";

// Writes remote output straight to the terminal.
class TerminalSink : public EventSink {
public:
    void on_connected(const std::string&) override {}

    void on_output(const std::string&, const std::string& text) override {
        std::cout << text << std::flush;
    }

    void on_closed(const std::string&, const std::string& reason) override {
        reason_ = reason;
        closed_ = true;
    }

    bool closed() const { return closed_.load(); }
    const std::string& reason() const { return reason_; }

private:
    std::atomic<bool> closed_{false};
    std::string reason_;
};

// Nothing to report for one-shot commands.
class NullSink : public EventSink {
public:
    void on_connected(const std::string&) override {}
    void on_output(const std::string&, const std::string&) override {}
    void on_closed(const std::string&, const std::string&) override {}
};

std::string new_transfer_id(const char* kind) {
    auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
    return fmt::format("cli-{}-{}", kind, ticks);
}

void print_progress(const TransferStatus& st) {
    std::cout << fmt::format("\r    {:6.2f}%  {} / {}  {}  ETA {}   ", st.percent,
                             st.transferred_text, st.total_text, st.speed_text, st.eta_text)
              << std::flush;
}

} // namespace

TermbridgeCLI::TermbridgeCLI(Config config) : config_(std::move(config)) {}

bool TermbridgeCLI::resolve(const std::string& profile, ConnectionParams& params) const {
    auto found = config_.connection(profile);
    if (found.is_err()) {
        std::cout << theme::fail(found.error);
        std::cout << theme::step(fmt::format("Define it under 'connections:' in {}",
                                             get_global_config_path().string()));
        return false;
    }
    params = found.value;
    return true;
}

// ── shell ─────────────────────────────────────────────────────

int TermbridgeCLI::run_shell(const std::string& profile) {
    ConnectionParams params;
    if (!resolve(profile, params)) return 1;

    auto sink = std::make_shared<TerminalSink>();
    TermbridgeService service(config_, sink);

    std::cout << theme::info(fmt::format("Connecting to {}@{}...", params.user, params.host));
    auto opened = service.open_session(kSessionId, kClientId, params);
    if (opened.is_err()) {
        std::cout << theme::fail(fmt::format("{} ({})", opened.error, error_kind_name(opened.kind)));
        return 1;
    }
    std::cout << theme::ok("Connected. Press Ctrl-] to leave.");
    auto size = platform::terminal_size();
    service.resize(kSessionId, size.cols, size.rows);

    {
        platform::RelayTerminal terminal;
        std::string data;
        while (!sink->closed()) {
            if (terminal.take_resize()) {
                size = platform::terminal_size();
                service.resize(kSessionId, size.cols, size.rows);
            }
            data.clear();
            if (!terminal.read_input(data, 50)) break;
            if (data.empty()) continue;

            auto esc = data.find(kEscapeKey);
            if (esc != std::string::npos) {
                if (esc > 0) service.send_input(kSessionId, kClientId, data.substr(0, esc), false, false);
                break;
            }
            auto sent = service.send_input(kSessionId, kClientId, data, false, false);
            if (sent.is_err()) break;
        }
    }

    if (!sink->closed()) {
        service.close_session(kSessionId, kClientId);
    }
    std::cout << "\r\n" << theme::info(sink->reason().empty() ? "Session closed" : sink->reason());
    return 0;
}

// ── ls ────────────────────────────────────────────────────────

int TermbridgeCLI::run_ls(const std::string& profile, const std::string& path) {
    ConnectionParams params;
    if (!resolve(profile, params)) return 1;

    TermbridgeService service(config_, std::make_shared<NullSink>());
    auto listed = service.files().list_directory(params, path, true);
    if (listed.is_err()) {
        std::cout << theme::fail(listed.error);
        return 1;
    }

    std::cout << theme::section(path);
    for (const auto& e : listed.value) {
        std::string size = e.is_directory ? "<dir>" : format_size(e.size);
        std::cout << theme::kv(size, e.is_directory ? e.name + "/" : e.name);
    }
    return 0;
}

// ── get ───────────────────────────────────────────────────────

int TermbridgeCLI::run_get(const std::string& profile, const std::string& remote,
                           const std::string& local) {
    ConnectionParams params;
    if (!resolve(profile, params)) return 1;

    TermbridgeService service(config_, std::make_shared<NullSink>());
    std::string transfer_id = new_transfer_id("get");

    std::atomic<bool> pulling{true};
    std::thread reporter([&] {
        while (pulling) {
            if (auto st = service.get_progress(transfer_id)) print_progress(*st);
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });
    auto result = service.download_file(params, remote, transfer_id);
    pulling = false;
    reporter.join();
    std::cout << "\n";

    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    if (result.value.cancelled) {
        std::cout << theme::info("Download cancelled");
        return 1;
    }

    std::string target = local;
    if (target.empty() || fs::is_directory(target)) {
        target = (fs::path(target.empty() ? "." : target) / result.value.filename).string();
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cout << theme::fail(fmt::format("Cannot write {}", target));
        return 1;
    }

    std::string chunk;
    auto& stream = *result.value.stream;
    while (stream.next(chunk)) {
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    }
    if (stream.failed() || !out) {
        std::cout << theme::fail(fmt::format("Writing {} failed", target));
        return 1;
    }
    std::cout << theme::ok(fmt::format("{} -> {} ({})", remote, target,
                                       format_size(result.value.size)));
    return 0;
}

// ── put ───────────────────────────────────────────────────────

int TermbridgeCLI::run_put(const std::string& profile, const std::string& local,
                           const std::string& remote_dir) {
    ConnectionParams params;
    if (!resolve(profile, params)) return 1;

    std::error_code ec;
    uint64_t total = fs::file_size(local, ec);
    if (ec) {
        std::cout << theme::fail(fmt::format("Cannot read {}: {}", local, ec.message()));
        return 1;
    }
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        std::cout << theme::fail(fmt::format("Cannot open {}", local));
        return 1;
    }

    TermbridgeService service(config_, std::make_shared<NullSink>());

    UploadChunk chunk;
    chunk.transfer_id = new_transfer_id("put");
    chunk.total_size = total;
    chunk.remote_dir = remote_dir;
    chunk.filename = fs::path(local).filename().string();

    std::vector<char> buf(static_cast<size_t>(MiB));
    uint64_t sent = 0;
    do {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = static_cast<size_t>(in.gcount());
        sent += n;
        chunk.data_base64 = base64_encode(std::string(buf.data(), n));
        chunk.is_last_chunk = sent >= total || !in;

        auto reply = service.upload_chunk(params, chunk);
        if (reply.is_err()) {
            std::cout << "\n" << theme::fail(reply.error);
            return 1;
        }
        if (reply.value.outcome == UploadOutcome::CANCELLED) {
            std::cout << "\n" << theme::info("Upload cancelled");
            return 1;
        }
        if (reply.value.outcome == UploadOutcome::COMPLETED) {
            std::cout << "\n" << theme::ok(fmt::format("{} -> {} ({})", local,
                                                       reply.value.remote_path, format_size(total)));
            return 0;
        }
        if (auto st = service.get_progress(chunk.transfer_id)) print_progress(*st);
        chunk.chunk_index++;
    } while (true);
}
