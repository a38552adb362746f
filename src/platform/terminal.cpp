#include "terminal.hpp"

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#else
#  include <sys/ioctl.h>
#  include <termios.h>
#  include <unistd.h>
#  include <poll.h>
#  include <signal.h>
#  include <cerrno>
#endif

namespace platform {

TerminalSize terminal_size() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi)) {
        return TerminalSize{csbi.srWindow.Right - csbi.srWindow.Left + 1,
                            csbi.srWindow.Bottom - csbi.srWindow.Top + 1};
    }
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        return TerminalSize{ws.ws_col, ws.ws_row};
    }
#endif
    return TerminalSize{80, 24};
}

#ifdef _WIN32

// Console input arrives as records: key presses carry the characters and
// WINDOW_BUFFER_SIZE_EVENT reports resizes, so no signal is involved.
struct RelayTerminal::Saved {
    HANDLE in;
    DWORD mode = 0;
    bool resized = false;
};

RelayTerminal::RelayTerminal() : saved_(std::make_unique<Saved>()) {
    saved_->in = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(saved_->in, &saved_->mode);
    DWORD raw = saved_->mode & ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT | ENABLE_PROCESSED_INPUT);
    SetConsoleMode(saved_->in, raw | ENABLE_WINDOW_INPUT | ENABLE_VIRTUAL_TERMINAL_INPUT);
}

RelayTerminal::~RelayTerminal() {
    SetConsoleMode(saved_->in, saved_->mode);
}

bool RelayTerminal::read_input(std::string& out, int timeout_ms) {
    DWORD wait = WaitForSingleObject(saved_->in, static_cast<DWORD>(timeout_ms));
    if (wait == WAIT_TIMEOUT) return true;
    if (wait != WAIT_OBJECT_0) return false;

    INPUT_RECORD records[64];
    DWORD count = 0;
    if (!ReadConsoleInputW(saved_->in, records, 64, &count)) return false;
    for (DWORD i = 0; i < count; i++) {
        const INPUT_RECORD& rec = records[i];
        if (rec.EventType == WINDOW_BUFFER_SIZE_EVENT) {
            saved_->resized = true;
        } else if (rec.EventType == KEY_EVENT && rec.Event.KeyEvent.bKeyDown) {
            WCHAR wc = rec.Event.KeyEvent.uChar.UnicodeChar;
            if (wc == 0) continue;
            char utf8[8];
            int n = WideCharToMultiByte(CP_UTF8, 0, &wc, 1, utf8, sizeof(utf8), nullptr, nullptr);
            if (n <= 0) continue;
            for (WORD r = 0; r < rec.Event.KeyEvent.wRepeatCount; r++) out.append(utf8, static_cast<size_t>(n));
        }
    }
    return true;
}

bool RelayTerminal::take_resize() {
    bool resized = saved_->resized;
    saved_->resized = false;
    return resized;
}

#else

static volatile sig_atomic_t g_window_changed = 0;

static void on_sigwinch(int) {
    g_window_changed = 1;
}

struct RelayTerminal::Saved {
    struct termios term;
    struct sigaction winch;
};

RelayTerminal::RelayTerminal() : saved_(std::make_unique<Saved>()) {
    tcgetattr(STDIN_FILENO, &saved_->term);
    struct termios raw = saved_->term;
    cfmakeraw(&raw);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);

    g_window_changed = 0;
    struct sigaction sa;
    sa.sa_handler = on_sigwinch;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGWINCH, &sa, &saved_->winch);
}

RelayTerminal::~RelayTerminal() {
    sigaction(SIGWINCH, &saved_->winch, nullptr);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_->term);
}

bool RelayTerminal::read_input(std::string& out, int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready == 0) return true;
    if (ready < 0) return errno == EINTR;
    if (!(pfd.revents & POLLIN)) return false;

    char buf[1024];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0) return errno == EINTR || errno == EAGAIN;
    if (n == 0) return false;
    out.append(buf, static_cast<size_t>(n));
    return true;
}

bool RelayTerminal::take_resize() {
    if (!g_window_changed) return false;
    g_window_changed = 0;
    return true;
}

#endif

} // namespace platform
