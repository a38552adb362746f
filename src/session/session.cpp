#include "session.hpp"
#include "output_pump.hpp"

const char* session_state_name(SessionState state) {
    switch (state) {
    case SessionState::OPENING: return "opening";
    case SessionState::ACTIVE:  return "active";
    case SessionState::CLOSING: return "closing";
    case SessionState::CLOSED:  return "closed";
    }
    return "unknown";
}

Session::Session(std::string session_id, std::string owner, std::unique_ptr<RemoteShell> remote)
    : id(std::move(session_id)), client_id(std::move(owner)), shell(std::move(remote)) {}

// Out of line so OutputPump is complete here
Session::~Session() = default;

bool Session::mark_closing() {
    SessionState expected = SessionState::ACTIVE;
    return state.compare_exchange_strong(expected, SessionState::CLOSING);
}
