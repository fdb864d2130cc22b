#pragma once

namespace sextant::ui {

/**
 * Raw terminal size as reported by the host.
 * is_available is false when the host could not tell.
 */
struct TerminalSize {
    int width = 0;
    int height = 0;
    bool is_available = false;
};

/**
 * Where terminal dimensions come from.
 */
class SizeSource {
public:
    virtual ~SizeSource() = default;
    virtual TerminalSize query() const = 0;
};

/**
 * Queries the controlling terminal with TIOCGWINSZ on stdout, falling back
 * to the COLUMNS and LINES environment variables.
 */
class TtySizeSource : public SizeSource {
public:
    TerminalSize query() const override;
};

/**
 * Size set by the caller. Used by tests and by hosts that render off-screen.
 */
class FixedSizeSource : public SizeSource {
public:
    FixedSizeSource() = default;
    FixedSizeSource(int width, int height) : size_{width, height, true} {}

    void set(int width, int height) { size_ = {width, height, true}; }
    void set_unavailable() { size_ = {}; }

    TerminalSize query() const override { return size_; }

private:
    TerminalSize size_;
};

/**
 * SIGWINCH notification. The handler only raises a flag; the host loop
 * calls consume() and resamples on its own schedule.
 */
class ResizeSignal {
public:
    static void install();
    static void raise();

    // True once per resize since the last call
    static bool consume();
};

}  // namespace sextant::ui
