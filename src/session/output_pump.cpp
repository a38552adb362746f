#include "output_pump.hpp"
#include "event_sink.hpp"
#include "session.hpp"
#include "session_registry.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <condition_variable>
#include <future>
#include <mutex>
#include <vector>

struct OutputPump::State {
    std::string session_id;
    std::weak_ptr<Session> session;
    std::shared_ptr<SessionRegistry> registry;
    std::shared_ptr<EventSink> sink;
    PumpOptions options;
    ExitCallback on_exit;

    std::atomic<bool> stop{false};
    std::mutex wake_mutex;
    std::condition_variable wake;
    std::promise<void> done;
    std::shared_future<void> done_future;
};

OutputPump::OutputPump(std::shared_ptr<Session> session,
                       std::shared_ptr<SessionRegistry> registry,
                       std::shared_ptr<EventSink> sink,
                       PumpOptions options,
                       ExitCallback on_exit)
    : state_(std::make_shared<State>()) {
    state_->session_id = session->id;
    state_->session = session;
    state_->registry = std::move(registry);
    state_->sink = std::move(sink);
    state_->options = options;
    state_->on_exit = std::move(on_exit);
    state_->done_future = state_->done.get_future().share();
}

OutputPump::~OutputPump() {
    if (thread_.joinable()) {
        request_stop();
        stop_and_join(std::chrono::milliseconds(PUMP_JOIN_TIMEOUT_MS));
    }
}

void OutputPump::start() {
    thread_ = std::thread(run, state_);
}

void OutputPump::request_stop() {
    {
        std::lock_guard<std::mutex> lock(state_->wake_mutex);
        state_->stop = true;
    }
    state_->wake.notify_all();
}

bool OutputPump::stop_and_join(std::chrono::milliseconds timeout) {
    request_stop();
    if (!thread_.joinable()) return true;

    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
        return false;
    }
    if (state_->done_future.wait_for(timeout) != std::future_status::ready) {
        log_warn(fmt::format("Output pump for {} did not stop within {} ms, detaching",
                             state_->session_id, timeout.count()));
        thread_.detach();
        return false;
    }
    thread_.join();
    return true;
}

bool OutputPump::finished() const {
    return state_->done_future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// ── Pump thread ───────────────────────────────────────────

void OutputPump::run(std::shared_ptr<State> st) {
    const std::string& id = st->session_id;
    std::vector<char> buf(st->options.read_quantum > 0 ? st->options.read_quantum : PUMP_READ_QUANTUM);
    std::string pending;
    auto last_activity = std::chrono::steady_clock::now();
    std::string reason = "Connection closed";

    try {
        while (!st->stop) {
            auto session = st->registry->get(id);
            if (!session || !session->is_active()) {
                reason = "Session closed";
                break;
            }

            long n;
            {
                std::lock_guard<std::mutex> lock(session->lock);
                n = session->shell->read(buf.data(), buf.size());
            }

            if (n > 0) {
                pending.append(buf.data(), static_cast<size_t>(n));
                std::string text = take_utf8_prefix(pending);
                if (!text.empty()) st->sink->on_output(id, text);
                last_activity = std::chrono::steady_clock::now();
            } else if (n == 0) {
                auto now = std::chrono::steady_clock::now();
                if (now - last_activity >= st->options.keepalive_interval) {
                    Result<void> sent = Result<void>::Ok();
                    {
                        std::lock_guard<std::mutex> lock(session->lock);
                        sent = session->shell->write(std::string(1, '\0'));
                    }
                    if (sent.is_err()) {
                        log_warn(fmt::format("Keepalive on {} failed: {}", id, sent.error));
                    }
                    last_activity = now;
                }
                std::unique_lock<std::mutex> lock(st->wake_mutex);
                st->wake.wait_for(lock, st->options.poll, [&] { return st->stop.load(); });
            } else {
                reason = "Connection closed by remote host";
                break;
            }

            bool open;
            {
                std::lock_guard<std::mutex> lock(session->lock);
                open = session->shell->is_open();
            }
            if (!open) {
                reason = "Connection closed by remote host";
                break;
            }
        }
    } catch (const std::exception& e) {
        reason = fmt::format("Output reader failed: {}", e.what());
        log_error(fmt::format("Output pump for {}: {}", id, e.what()));
    }

    finish(st, reason);
}

void OutputPump::finish(const std::shared_ptr<State>& st, const std::string& reason) {
    const std::string& id = st->session_id;
    log_debug(fmt::format("Output pump for {} exiting: {}", id, reason));

    // A requested stop means teardown is in progress and reports the close itself
    bool stopped = st->stop.load();

    if (auto session = st->session.lock()) {
        session->mark_closing();
        if (!stopped && session->claim_close_notice()) {
            try {
                st->sink->on_closed(id, reason);
            } catch (const std::exception& e) {
                log_error(fmt::format("Closed event for {} failed: {}", id, e.what()));
            }
        }
    }

    st->done.set_value();

    if (!stopped && st->on_exit) {
        st->on_exit(id, reason);
    }
}
