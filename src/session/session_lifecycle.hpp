#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "output_pump.hpp"
#include "resource_monitor.hpp"

class ConnectionFactory;
class SessionRegistry;
class EventSink;
struct Session;

// Wires ConnectionFactory, SessionRegistry and OutputPump together.
// Every exit path (client close, remote close, client disconnect, shutdown)
// goes through the same teardown, which runs at most once per session.
class SessionLifecycle {
public:
    SessionLifecycle(std::shared_ptr<ConnectionFactory> factory,
                     std::shared_ptr<SessionRegistry> registry,
                     std::shared_ptr<EventSink> sink,
                     PumpOptions pump_options = {},
                     std::chrono::milliseconds join_timeout =
                         std::chrono::milliseconds(PUMP_JOIN_TIMEOUT_MS));
    ~SessionLifecycle();

    // Errors: DUPLICATE, or whatever the factory reports.
    Result<void> open(const std::string& session_id, const std::string& client_id,
                      const ConnectionParams& params);

    // Errors: NOT_FOUND, NOT_OWNER, IO.
    Result<void> input(const std::string& session_id, const std::string& caller,
                       const std::string& data, bool pasted, bool is_last_line);

    // Returns the applied size, or nullopt when the session is unknown.
    std::optional<TerminalSize> resize(const std::string& session_id, int cols, int rows);

    // CPU and memory load of the session's host, sampled over its connection.
    // Terminal I/O for the session waits while the commands run.
    // Errors: NOT_FOUND, plus REMOTE/NETWORK/IO from running the commands.
    Result<ResourceUsage> resource_usage(const std::string& session_id,
                                         std::chrono::milliseconds timeout =
                                             std::chrono::milliseconds(RESOURCE_COMMAND_TIMEOUT_MS));

    // Errors: NOT_FOUND, NOT_OWNER.
    Result<void> close(const std::string& session_id, const std::string& caller);

    // Close every session owned by `client_id`. Returns how many were closed.
    size_t disconnect_client(const std::string& client_id);

    // Close every registered session without ownership checks.
    void shutdown();

    static TerminalSize clamp_size(int cols, int rows);

    SessionLifecycle(const SessionLifecycle&) = delete;
    SessionLifecycle& operator=(const SessionLifecycle&) = delete;

private:
    std::shared_ptr<ConnectionFactory> factory_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<EventSink> sink_;
    PumpOptions pump_options_;
    std::chrono::milliseconds join_timeout_;

    // False if another caller already started tearing this session down.
    static bool teardown(SessionRegistry& registry, EventSink& sink,
                         std::chrono::milliseconds join_timeout,
                         const std::shared_ptr<Session>& session, const std::string& reason);
};
