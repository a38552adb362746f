#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <ssh/remote_shell.hpp>

class OutputPump;

enum class SessionState { OPENING, ACTIVE, CLOSING, CLOSED };

const char* session_state_name(SessionState state);

// One interactive shell owned by one client.
// `lock` serializes channel I/O; registry membership is the registry's concern.
struct Session {
    Session(std::string session_id, std::string owner, std::unique_ptr<RemoteShell> remote);
    ~Session();

    const std::string id;
    const std::string client_id;
    std::unique_ptr<RemoteShell> shell;
    std::unique_ptr<OutputPump> pump;

    std::mutex lock;
    // Held by open from registration until the pump runs; teardown waits on it.
    std::mutex start_lock;
    std::atomic<SessionState> state{SessionState::OPENING};
    std::atomic<bool> teardown_started{false};

    bool is_active() const { return state.load() == SessionState::ACTIVE; }

    // ACTIVE -> CLOSING. False if the session was not active.
    bool mark_closing();

    // True for exactly one caller over the session's lifetime.
    bool claim_close_notice() { return !close_notified_.exchange(true); }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

private:
    std::atomic<bool> close_notified_{false};
};
