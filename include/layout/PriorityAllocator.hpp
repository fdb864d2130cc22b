#pragma once

#include "layout/DisplayMode.hpp"
#include "layout/Segment.hpp"
#include <vector>

namespace sextant::layout {

/**
 * Outcome of one allocation pass.
 * `kept` keeps input order; `dropped` lists segments in removal order
 * (tier-filtered first, then evictions).
 */
struct AllocationResult {
    std::vector<Segment> kept;
    std::vector<Segment> dropped;
    int used_width = 0;     // fixed padding + min widths + gaps of `kept`, capped at INT_MAX
    bool overflow = false;  // kept width > budget after eviction stopped
};

/**
 * Width the given segments need in one line:
 * padding + sum of min widths + gap between neighbours.
 * Left and right sides share the line, so all segments count together.
 * Saturates at INT_MAX.
 */
int required_width(const std::vector<Segment>& segments, const LayoutBudget& budget);

/**
 * Chooses which status segments fit in a single line.
 *
 * 1. Tier filter: segments less important than the breakpoint ceiling go.
 * 2. Eviction: while the line is over budget, the least important
 *    non-critical survivor goes. Ties go to the right side first, then to
 *    the most recently added segment.
 *
 * Verbose skips both steps and keeps everything, overflowing if needed.
 * Critical segments are never evicted; when they alone exceed the budget
 * the result is flagged with `overflow`.
 */
class PriorityAllocator {
public:
    PriorityAllocator() = default;
    explicit PriorityAllocator(const LayoutBudget& budget) : budget_(budget) {}

    void add_segment(Segment segment);

    void set_budget(const LayoutBudget& budget) { budget_ = budget; }
    const LayoutBudget& budget() const { return budget_; }

    AllocationResult allocate(PriorityTier ceiling, EffectiveMode mode) const;

    void clear() { segments_.clear(); }
    size_t segment_count() const { return segments_.size(); }

private:
    std::vector<Segment> segments_;
    LayoutBudget budget_;
};

AllocationResult allocate(
    const std::vector<Segment>& segments,
    const LayoutBudget& budget,
    PriorityTier ceiling,
    EffectiveMode mode
);

}  // namespace sextant::layout
