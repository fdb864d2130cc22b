#pragma once

#include "layout/Breakpoint.hpp"
#include "ui/Terminal.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace sextant::layout {

/**
 * Immutable view of the terminal at one sampling tick.
 */
struct DimensionSnapshot {
    int width = 80;
    int height = 24;
    Breakpoint breakpoint = Breakpoint::Compact;
    bool is_available = false;
    bool is_narrow = false;
    bool is_compact = true;
    bool is_normal = false;
    bool is_wide = false;
};

DimensionSnapshot make_snapshot(const ui::TerminalSize& size, const ThresholdTable& table);

struct ObserverSettings {
    int fallback_width = 80;
    int fallback_height = 24;
    std::optional<int> width_override;
    std::chrono::milliseconds poll_interval{100};
};

/**
 * Owns the last sampled terminal size.
 *
 * The host calls refresh() from its loop, either on the poll_interval tick
 * or after a resize notification. Every refresh publishes a new snapshot;
 * snapshots handed out earlier are never modified.
 */
class DimensionObserver {
public:
    DimensionObserver(const ui::SizeSource& source, ThresholdTable table,
                      ObserverSettings settings = ObserverSettings{});

    /**
     * Current size from the source, with fallbacks applied.
     * Never throws; is_available is false when fallbacks were used.
     */
    ui::TerminalSize sample() const;

    /**
     * Resample and publish a new snapshot.
     * Returns true when width, height, availability or breakpoint changed.
     */
    bool refresh();

    std::shared_ptr<const DimensionSnapshot> snapshot() const { return current_; }

    Breakpoint classify(int width) const { return table_.classify(width); }

    const ThresholdTable& thresholds() const { return table_; }
    const ObserverSettings& settings() const { return settings_; }

private:
    const ui::SizeSource& source_;
    ThresholdTable table_;
    ObserverSettings settings_;
    std::shared_ptr<const DimensionSnapshot> current_;
};

}  // namespace sextant::layout
