#include "layout/PriorityAllocator.hpp"
#include <algorithm>
#include <climits>

namespace sextant::layout {

namespace {

long long width_of(const std::vector<const Segment*>& segments, const LayoutBudget& budget) {
    long long total = std::max(0, budget.fixed_padding);
    for (const Segment* s : segments) {
        total += std::max(0, s->min_width);
    }
    if (segments.size() > 1) {
        total += static_cast<long long>(std::max(0, budget.inter_segment_gap)) *
                 static_cast<long long>(segments.size() - 1);
    }
    return total;
}

int saturate(long long width) {
    return static_cast<int>(std::min<long long>(width, INT_MAX));
}

// Position in `survivors` of the next segment to evict, or -1 if only
// critical segments remain
int pick_victim(const std::vector<const Segment*>& survivors) {
    int victim = -1;
    for (int i = 0; i < static_cast<int>(survivors.size()); ++i) {
        const Segment* s = survivors[i];
        if (s->tier == PriorityTier::Critical) continue;
        if (victim < 0) {
            victim = i;
            continue;
        }

        const Segment* v = survivors[victim];
        if (ordinal(s->tier) != ordinal(v->tier)) {
            if (ordinal(s->tier) > ordinal(v->tier)) victim = i;
            continue;
        }
        if (s->side != v->side) {
            if (s->side == Side::Right) victim = i;
            continue;
        }
        // Same tier and side: later in input order was added more recently
        victim = i;
    }
    return victim;
}

} // namespace

int required_width(const std::vector<Segment>& segments, const LayoutBudget& budget) {
    std::vector<const Segment*> ptrs;
    ptrs.reserve(segments.size());
    for (const auto& s : segments) ptrs.push_back(&s);
    return saturate(width_of(ptrs, budget));
}

void PriorityAllocator::add_segment(Segment segment) {
    segments_.push_back(std::move(segment));
}

AllocationResult PriorityAllocator::allocate(PriorityTier ceiling, EffectiveMode mode) const {
    AllocationResult result;
    std::vector<const Segment*> survivors;
    survivors.reserve(segments_.size());

    if (mode == DisplayMode::Verbose) {
        result.kept = segments_;
        for (const auto& s : segments_) survivors.push_back(&s);
        long long used = width_of(survivors, budget_);
        result.used_width = saturate(used);
        result.overflow = used > budget_.total_width;
        return result;
    }

    // 1. Tier filter
    for (const auto& s : segments_) {
        if (ordinal(s.tier) > ordinal(ceiling)) {
            result.dropped.push_back(s);
        } else {
            survivors.push_back(&s);
        }
    }

    // 2-3. Progressive eviction
    long long used = width_of(survivors, budget_);
    while (used > budget_.total_width) {
        int victim = pick_victim(survivors);
        if (victim < 0) break;

        result.dropped.push_back(*survivors[victim]);
        survivors.erase(survivors.begin() + victim);
        used = width_of(survivors, budget_);
    }

    result.kept.reserve(survivors.size());
    for (const Segment* s : survivors) result.kept.push_back(*s);
    result.used_width = saturate(used);
    result.overflow = used > budget_.total_width;
    return result;
}

AllocationResult allocate(
    const std::vector<Segment>& segments,
    const LayoutBudget& budget,
    PriorityTier ceiling,
    EffectiveMode mode
) {
    PriorityAllocator allocator(budget);
    for (const auto& s : segments) allocator.add_segment(s);
    return allocator.allocate(ceiling, mode);
}

}  // namespace sextant::layout
