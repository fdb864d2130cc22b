#include "layout/Segment.hpp"
#include "config/ConfigError.hpp"
#include "util/Logger.hpp"
#include <format>

namespace sextant::layout {

const char* to_string(PriorityTier tier) {
    switch (tier) {
        case PriorityTier::Critical: return "critical";
        case PriorityTier::High:     return "high";
        case PriorityTier::Medium:   return "medium";
        case PriorityTier::Low:      return "low";
    }
    return "low";
}

std::optional<PriorityTier> tier_from_string(std::string_view name) {
    if (name == "critical" || name == "0") return PriorityTier::Critical;
    if (name == "high" || name == "1") return PriorityTier::High;
    if (name == "medium" || name == "2") return PriorityTier::Medium;
    if (name == "low" || name == "3") return PriorityTier::Low;
    return std::nullopt;
}

TierCeilings TierCeilings::standard() {
    return TierCeilings({
        PriorityTier::High,    // narrow
        PriorityTier::Medium,  // compact
        PriorityTier::Medium,  // normal
        PriorityTier::Low,     // wide
    });
}

TierCeilings TierCeilings::create(const std::array<PriorityTier, kBreakpointCount>& ceilings) {
    for (size_t i = 0; i < ceilings.size(); ++i) {
        int tier = ordinal(ceilings[i]);
        auto bp = to_string(static_cast<Breakpoint>(i));
        if (tier < 0 || tier >= kTierCount) {
            util::Logger::error(std::format("TierCeilings: '{}' has invalid tier {}", bp, tier));
            throw config::ConfigError(std::format("invalid priority ceiling for '{}': {}", bp, tier));
        }
        // A wider terminal must never show less than a narrower one
        if (i > 0 && tier < ordinal(ceilings[i - 1])) {
            util::Logger::error(std::format("TierCeilings: '{}' is below the previous breakpoint", bp));
            throw config::ConfigError(std::format(
                "priority ceiling for '{}' ({}) is lower than for '{}' ({})",
                bp, to_string(ceilings[i]),
                to_string(static_cast<Breakpoint>(i - 1)), to_string(ceilings[i - 1])));
        }
    }
    return TierCeilings(ceilings);
}

}  // namespace sextant::layout
