#pragma once

#include "config/LayoutConfig.hpp"
#include "layout/DimensionObserver.hpp"
#include "layout/PriorityAllocator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sextant::layout {

/**
 * Everything the renderer needs for one frame.
 */
struct LayoutFrame {
    std::shared_ptr<const DimensionSnapshot> dimensions;
    DisplayMode requested = DisplayMode::Normal;
    EffectiveMode mode = DisplayMode::Normal;
    bool abbreviate = false;
    LayoutBudget budget;
    AllocationResult allocation;
    int subtask_limit = 0;
    std::string status_line;
};

/**
 * One layout pass over the current snapshot: mode reconciliation, segment
 * allocation, status line composition and subtask limit.
 *
 * The engine holds a validated config and a reference to the observer; the
 * host keeps both alive and calls compute() once per frame.
 */
class LayoutEngine {
public:
    LayoutEngine(const config::LayoutConfig& config, const DimensionObserver& observer);

    LayoutFrame compute(const std::vector<Segment>& segments, DisplayMode requested) const;

    int max_length(const LayoutFrame& frame, const std::vector<int>& reserved_widths) const;

    // Truncate `text` to the field width max_length() gives
    std::string fit(const LayoutFrame& frame, const std::string& text,
                    const std::vector<int>& reserved_widths) const;

    const config::LayoutConfig& config() const { return config_; }

private:
    config::LayoutConfig config_;
    const DimensionObserver& observer_;
};

}  // namespace sextant::layout
