#pragma once

#include "layout/Breakpoint.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace sextant::layout {

/**
 * Importance of a segment. Lower ordinal = more important.
 * Critical segments are never evicted for width.
 */
enum class PriorityTier {
    Critical = 0,
    High = 1,
    Medium = 2,
    Low = 3
};

inline constexpr int kTierCount = 4;

inline int ordinal(PriorityTier tier) { return static_cast<int>(tier); }

const char* to_string(PriorityTier tier);
std::optional<PriorityTier> tier_from_string(std::string_view name);

enum class Side {
    Left,
    Right
};

/**
 * One displayable unit of status content, rebuilt on every layout pass.
 */
struct Segment {
    std::string id;
    Side side = Side::Left;
    PriorityTier tier = PriorityTier::Medium;
    int min_width = 0;
    std::string full_text;
    std::optional<std::string> abbreviated_text;
};

/**
 * Width available to one status line.
 */
struct LayoutBudget {
    int total_width = 0;
    int fixed_padding = 0;
    int inter_segment_gap = 1;
};

/**
 * Least important tier allowed at each breakpoint.
 *
 * Built through create() (validated, throws config::ConfigError) or
 * standard(): narrow -> high, compact -> medium, normal -> medium, wide -> low.
 */
class TierCeilings {
public:
    static TierCeilings standard();
    static TierCeilings create(const std::array<PriorityTier, kBreakpointCount>& ceilings);

    PriorityTier ceiling_for(Breakpoint bp) const {
        return ceilings_[static_cast<size_t>(ordinal(bp))];
    }

private:
    explicit TierCeilings(const std::array<PriorityTier, kBreakpointCount>& ceilings)
        : ceilings_(ceilings) {}

    std::array<PriorityTier, kBreakpointCount> ceilings_;
};

}  // namespace sextant::layout
