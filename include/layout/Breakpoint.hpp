#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace sextant::layout {

/**
 * Terminal width class, ordered from narrowest to widest.
 */
enum class Breakpoint {
    Narrow = 0,
    Compact = 1,
    Normal = 2,
    Wide = 3
};

inline constexpr int kBreakpointCount = 4;

const char* to_string(Breakpoint bp);
std::optional<Breakpoint> breakpoint_from_string(std::string_view name);

inline int ordinal(Breakpoint bp) { return static_cast<int>(bp); }

struct Threshold {
    Breakpoint breakpoint = Breakpoint::Narrow;
    int lower_bound = 0;
};

/**
 * Ordered lower bounds, one per breakpoint.
 *
 * Built once through create() (which validates and throws
 * config::ConfigError) and immutable afterwards. The first entry is
 * Narrow at 0, so classify() is defined for every width.
 */
class ThresholdTable {
public:
    // narrow >= 0, compact >= 60, normal >= 100, wide >= 160
    static ThresholdTable standard();

    static ThresholdTable create(std::vector<Threshold> entries);

    /**
     * Breakpoint whose lower bound is the greatest bound <= width.
     * Widths below zero classify as Narrow.
     */
    Breakpoint classify(int width) const;

    int lower_bound(Breakpoint bp) const;
    const std::vector<Threshold>& entries() const { return entries_; }

private:
    explicit ThresholdTable(std::vector<Threshold> entries);

    std::vector<Threshold> entries_;
};

Breakpoint classify(int width, const ThresholdTable& table);

}  // namespace sextant::layout
