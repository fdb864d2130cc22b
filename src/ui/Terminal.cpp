#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <csignal>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <format>

namespace sextant::ui {

// Use volatile sig_atomic_t for signal flag - NEVER call ioctl in a handler!
static volatile std::sig_atomic_t g_resize_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

static int env_dimension(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return 0;

    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || parsed <= 0 || parsed > 100000) {
        return 0;
    }
    return static_cast<int>(parsed);
}

TerminalSize TtySizeSource::query() const {
    winsize w{};
    errno = 0;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return {w.ws_col, w.ws_row, true};
    }
    if (errno != ENOTTY && errno != 0) {
        util::Logger::debug(std::format("Terminal: TIOCGWINSZ failed ({})", std::strerror(errno)));
    }

    int cols = env_dimension("COLUMNS");
    int rows = env_dimension("LINES");
    if (cols > 0) {
        return {cols, rows, true};
    }
    return {};
}

void ResizeSignal::install() {
#ifdef SIGWINCH
    std::signal(SIGWINCH, sigwinch_handler);
#endif
}

void ResizeSignal::raise() {
    g_resize_pending = 1;
}

bool ResizeSignal::consume() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return true;
    }
    return false;
}

}  // namespace sextant::ui
