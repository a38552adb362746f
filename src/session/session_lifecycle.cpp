#include "session_lifecycle.hpp"
#include "event_sink.hpp"
#include "session.hpp"
#include "session_registry.hpp"
#include <ssh/connection_factory.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

SessionLifecycle::SessionLifecycle(std::shared_ptr<ConnectionFactory> factory,
                                   std::shared_ptr<SessionRegistry> registry,
                                   std::shared_ptr<EventSink> sink,
                                   PumpOptions pump_options,
                                   std::chrono::milliseconds join_timeout)
    : factory_(std::move(factory)), registry_(std::move(registry)), sink_(std::move(sink)),
      pump_options_(pump_options), join_timeout_(join_timeout) {}

SessionLifecycle::~SessionLifecycle() {
    shutdown();
}

TerminalSize SessionLifecycle::clamp_size(int cols, int rows) {
    return TerminalSize{std::max(TERM_MIN_COLS, std::min(cols, TERM_MAX_COLS)),
                        std::max(TERM_MIN_ROWS, std::min(rows, TERM_MAX_ROWS))};
}

// ── Open ──────────────────────────────────────────────────

Result<void> SessionLifecycle::open(const std::string& session_id, const std::string& client_id,
                                    const ConnectionParams& params) {
    if (registry_->contains(session_id)) {
        return Result<void>::Err(fmt::format("Session {} already exists", session_id),
                                 ErrorKind::DUPLICATE);
    }

    auto shell = factory_->open_shell(params);
    if (shell.is_err()) {
        log_warn(fmt::format("Open {} for {} failed [{}]: {}", session_id, client_id,
                             error_kind_name(shell.kind), shell.error));
        return Result<void>::Err(shell);
    }

    auto session = std::make_shared<Session>(session_id, client_id, std::move(shell.value));

    // The pump may outlive this object, so its exit hook holds its own handles
    auto registry = registry_;
    auto sink = sink_;
    auto join_timeout = join_timeout_;
    session->pump = std::make_unique<OutputPump>(
        session, registry_, sink_, pump_options_,
        [registry, sink, join_timeout](const std::string& id, const std::string& reason) {
            if (auto s = registry->get(id)) teardown(*registry, *sink, join_timeout, s, reason);
        });
    session->state = SessionState::ACTIVE;

    std::lock_guard<std::mutex> started(session->start_lock);
    if (!registry_->add(session)) {
        // Lost a race with a concurrent open of the same id
        session->state = SessionState::CLOSED;
        session->shell->close();
        return Result<void>::Err(fmt::format("Session {} already exists", session_id),
                                 ErrorKind::DUPLICATE);
    }

    log_info(fmt::format("Session {} opened for client {}", session_id, client_id));
    sink_->on_connected(session_id);
    session->pump->start();
    return Result<void>::Ok();
}

// ── Input / resize ────────────────────────────────────────

Result<void> SessionLifecycle::input(const std::string& session_id, const std::string& caller,
                                     const std::string& data, bool pasted, bool is_last_line) {
    auto session = registry_->get(session_id);
    if (!session) {
        return Result<void>::Err(fmt::format("Session {} not found", session_id),
                                 ErrorKind::NOT_FOUND);
    }
    if (session->client_id != caller) {
        return Result<void>::Err(fmt::format("Session {} is not owned by {}", session_id, caller),
                                 ErrorKind::NOT_OWNER);
    }
    if (!session->is_active()) {
        return Result<void>::Err(fmt::format("Session {} is not active", session_id),
                                 ErrorKind::NOT_FOUND);
    }

    std::string payload = data;
    if (pasted && !is_last_line) payload += "\n";

    std::lock_guard<std::mutex> lock(session->lock);
    auto written = session->shell->write(payload);
    if (written.is_err()) {
        log_warn(fmt::format("Input to {} failed: {}", session_id, written.error));
        return Result<void>::Err(written.error, ErrorKind::IO);
    }
    return Result<void>::Ok();
}

std::optional<TerminalSize> SessionLifecycle::resize(const std::string& session_id,
                                                     int cols, int rows) {
    auto session = registry_->get(session_id);
    if (!session || !session->is_active()) return std::nullopt;

    TerminalSize size = clamp_size(cols, rows);
    Result<void> applied = Result<void>::Ok();
    {
        std::lock_guard<std::mutex> lock(session->lock);
        applied = session->shell->resize(size.cols, size.rows);
    }
    if (applied.is_err()) {
        log_warn(fmt::format("Resize of {} to {}x{} failed: {}", session_id,
                             size.cols, size.rows, applied.error));
    }
    return size;
}

// ── Resource usage ────────────────────────────────────────

Result<ResourceUsage> SessionLifecycle::resource_usage(const std::string& session_id,
                                                       std::chrono::milliseconds timeout) {
    auto session = registry_->get(session_id);
    if (!session || !session->is_active()) {
        return Result<ResourceUsage>::Err(fmt::format("Session {} not found", session_id),
                                          ErrorKind::NOT_FOUND);
    }

    Result<ResourceUsage> usage = [&] {
        std::lock_guard<std::mutex> lock(session->lock);
        return sample_resource_usage(*session->shell, static_cast<int>(timeout.count()));
    }();
    if (usage.is_err()) {
        log_warn(fmt::format("Resource usage for {} failed: {}", session_id, usage.error));
        return usage;
    }
    log_debug(fmt::format("Resource usage for {}: cpu {}%, memory {}%", session_id,
                          usage.value.cpu, usage.value.memory));
    return usage;
}

// ── Close ─────────────────────────────────────────────────

Result<void> SessionLifecycle::close(const std::string& session_id, const std::string& caller) {
    auto session = registry_->get(session_id);
    if (!session) {
        return Result<void>::Err(fmt::format("Session {} not found", session_id),
                                 ErrorKind::NOT_FOUND);
    }
    if (session->client_id != caller) {
        return Result<void>::Err(fmt::format("Session {} is not owned by {}", session_id, caller),
                                 ErrorKind::NOT_OWNER);
    }
    if (!teardown(*registry_, *sink_, join_timeout_, session, "Closed by client")) {
        return Result<void>::Err(fmt::format("Session {} is already closing", session_id),
                                 ErrorKind::NOT_FOUND);
    }
    return Result<void>::Ok();
}

size_t SessionLifecycle::disconnect_client(const std::string& client_id) {
    size_t closed = 0;
    for (const auto& id : registry_->sessions_for(client_id)) {
        auto session = registry_->get(id);
        if (session && teardown(*registry_, *sink_, join_timeout_, session, "Client disconnected")) closed++;
    }
    if (closed > 0) {
        log_info(fmt::format("Client {} disconnected, closed {} session(s)", client_id, closed));
    }
    return closed;
}

void SessionLifecycle::shutdown() {
    auto ids = registry_->all();
    for (const auto& id : ids) {
        if (auto session = registry_->get(id)) {
            teardown(*registry_, *sink_, join_timeout_, session, "Server shutting down");
        }
    }
    if (!ids.empty()) {
        log_info(fmt::format("Shutdown closed {} session(s)", ids.size()));
    }
}

bool SessionLifecycle::teardown(SessionRegistry& registry, EventSink& sink,
                                std::chrono::milliseconds join_timeout,
                                const std::shared_ptr<Session>& session, const std::string& reason) {
    if (session->teardown_started.exchange(true)) return false;

    {
        // An open still registering this session finishes starting its pump first
        std::lock_guard<std::mutex> started(session->start_lock);
        if (session->pump) session->pump->request_stop();
        session->state = SessionState::CLOSING;
    }

    {
        std::lock_guard<std::mutex> lock(session->lock);
        session->shell->close();
    }

    registry.remove(session->id);

    if (session->pump) session->pump->stop_and_join(join_timeout);

    session->state = SessionState::CLOSED;
    log_info(fmt::format("Session {} closed: {}", session->id, reason));

    if (session->claim_close_notice()) {
        try {
            sink.on_closed(session->id, reason);
        } catch (const std::exception& e) {
            log_error(fmt::format("Closed event for {} failed: {}", session->id, e.what()));
        }
    }
    return true;
}
