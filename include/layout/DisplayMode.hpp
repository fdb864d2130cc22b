#pragma once

#include <string_view>

namespace sextant::layout {

/**
 * Display density. As a user preference it is the requested mode; after
 * reconciliation with the breakpoint (see LayoutModeSelector) it is the
 * effective mode every downstream decision uses.
 */
enum class DisplayMode {
    Compact,
    Normal,
    Verbose
};

using EffectiveMode = DisplayMode;

const char* to_string(DisplayMode mode);

/**
 * Lenient parse of a user-typed mode name.
 * Accepts "compact"/"c"/"mini"/"minimal", "verbose"/"v"/"debug"/"detailed"
 * and "normal"/"n", case-insensitive, surrounding whitespace ignored.
 * Anything else yields Normal.
 */
DisplayMode parse_display_mode(std::string_view text);

/**
 * The user's requested density, changed by explicit commands.
 */
class DisplayModeState {
public:
    DisplayModeState() = default;
    explicit DisplayModeState(DisplayMode initial) : mode_(initial) {}

    DisplayMode mode() const { return mode_; }

    void set(DisplayMode mode);

    // Compact <-> Normal; Verbose -> Compact
    DisplayMode toggle_compact();

    // Verbose <-> Normal; Compact -> Verbose
    DisplayMode toggle_verbose();

private:
    DisplayMode mode_ = DisplayMode::Normal;
};

}  // namespace sextant::layout
