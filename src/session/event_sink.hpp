#pragma once

#include <string>

// Event-emission boundary towards connected clients.
// Called from request threads and from output pump threads.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_connected(const std::string& session_id) = 0;
    virtual void on_output(const std::string& session_id, const std::string& text) = 0;
    // Emitted exactly once per session.
    virtual void on_closed(const std::string& session_id, const std::string& reason) = 0;
};
