#include "layout/DimensionObserver.hpp"
#include "util/Logger.hpp"
#include <format>

namespace sextant::layout {

DimensionSnapshot make_snapshot(const ui::TerminalSize& size, const ThresholdTable& table) {
    DimensionSnapshot snap;
    snap.width = size.width;
    snap.height = size.height;
    snap.is_available = size.is_available;
    snap.breakpoint = table.classify(size.width);
    snap.is_narrow = snap.breakpoint == Breakpoint::Narrow;
    snap.is_compact = snap.breakpoint == Breakpoint::Compact;
    snap.is_normal = snap.breakpoint == Breakpoint::Normal;
    snap.is_wide = snap.breakpoint == Breakpoint::Wide;
    return snap;
}

DimensionObserver::DimensionObserver(const ui::SizeSource& source, ThresholdTable table,
                                     ObserverSettings settings)
    : source_(source), table_(std::move(table)), settings_(std::move(settings)) {
    current_ = std::make_shared<const DimensionSnapshot>(make_snapshot(sample(), table_));
    util::Logger::info(std::format("DimensionObserver: {}x{} ({}){}",
                                   current_->width, current_->height,
                                   to_string(current_->breakpoint),
                                   current_->is_available ? "" : " fallback"));
}

ui::TerminalSize DimensionObserver::sample() const {
    ui::TerminalSize size = source_.query();

    if (!size.is_available || size.width <= 0) {
        size = {settings_.fallback_width, settings_.fallback_height, false};
    } else if (size.height <= 0) {
        size.height = settings_.fallback_height;
    }

    if (settings_.width_override) {
        size.width = *settings_.width_override;
    }
    return size;
}

bool DimensionObserver::refresh() {
    auto next = std::make_shared<const DimensionSnapshot>(make_snapshot(sample(), table_));

    bool changed = next->width != current_->width ||
                   next->height != current_->height ||
                   next->is_available != current_->is_available ||
                   next->breakpoint != current_->breakpoint;

    if (next->breakpoint != current_->breakpoint) {
        util::Logger::info(std::format("DimensionObserver: breakpoint {} -> {} at {} cols",
                                       to_string(current_->breakpoint),
                                       to_string(next->breakpoint), next->width));
    }

    current_ = std::move(next);
    return changed;
}

}  // namespace sextant::layout
