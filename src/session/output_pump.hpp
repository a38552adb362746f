#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <core/constants.hpp>

struct Session;
class SessionRegistry;
class EventSink;

struct PumpOptions {
    std::chrono::milliseconds poll{PUMP_POLL_MS};
    std::chrono::milliseconds keepalive_interval{PUMP_IDLE_KEEPALIVE_SECS * 1000};
    size_t read_quantum = PUMP_READ_QUANTUM;
};

// Background reader for one interactive session.
//
// Each iteration looks the session up in the registry and stops unless it is
// still there and ACTIVE. Output is decoded as UTF-8 (an incomplete trailing
// sequence waits for the next read) and emitted as one event per read. After
// `keepalive_interval` without output a single zero byte is written.
//
// On exit for any reason the session is marked CLOSING. Unless a stop was
// requested (teardown then reports the close), the closed event is emitted
// and `on_exit` runs on the pump thread so the owner can reap the session.
class OutputPump {
public:
    using ExitCallback = std::function<void(const std::string& session_id,
                                            const std::string& reason)>;

    OutputPump(std::shared_ptr<Session> session,
               std::shared_ptr<SessionRegistry> registry,
               std::shared_ptr<EventSink> sink,
               PumpOptions options,
               ExitCallback on_exit = nullptr);
    ~OutputPump();

    void start();
    void request_stop();

    // Wait up to `timeout` for the pump thread to finish. Detaches instead
    // when called from the pump thread itself or when the wait times out.
    // Returns true if the thread was joined.
    bool stop_and_join(std::chrono::milliseconds timeout);

    bool finished() const;

    // Non-copyable, non-movable (thread + shared state)
    OutputPump(const OutputPump&) = delete;
    OutputPump& operator=(const OutputPump&) = delete;

private:
    struct State;
    std::shared_ptr<State> state_;
    std::thread thread_;

    static void run(std::shared_ptr<State> st);
    static void finish(const std::shared_ptr<State>& st, const std::string& reason);
};
