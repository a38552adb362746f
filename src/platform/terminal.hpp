#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>

namespace platform {

// Window size of the local terminal, 80x24 when it cannot be queried.
TerminalSize terminal_size();

// Local side of an interactive relay. While alive, stdin is in raw mode and
// window size changes are recorded; both are undone on destruction.
// Only one may exist at a time.
class RelayTerminal {
public:
    RelayTerminal();
    ~RelayTerminal();

    // Wait up to `timeout_ms` for keystrokes and append them to `out` as
    // bytes. Returns false once stdin is closed or unreadable.
    bool read_input(std::string& out, int timeout_ms);

    // True if the window was resized since the previous call.
    bool take_resize();

    RelayTerminal(const RelayTerminal&) = delete;
    RelayTerminal& operator=(const RelayTerminal&) = delete;

private:
    struct Saved;
    std::unique_ptr<Saved> saved_;
};

} // namespace platform
