#pragma once

#include "layout/Breakpoint.hpp"
#include "layout/DisplayMode.hpp"
#include <array>
#include <string>
#include <vector>

namespace sextant::layout {

/**
 * Constants behind compute_max_length() and truncate().
 * All lengths are terminal display columns.
 */
struct TruncationPolicy {
    int compact_floor = 15;
    int fixed_overhead = 20;
    int readability_ceiling = 120;  // applied at the widest breakpoint only
    std::array<int, kBreakpointCount> floors{20, 30, 40, 60};
    int word_boundary_percent = 60;
    std::string ellipsis = "...";

    int floor_for(Breakpoint bp) const { return floors[static_cast<size_t>(ordinal(bp))]; }
};

struct TruncationConfig {
    int max_length = 0;
    std::string ellipsis = "...";
};

/**
 * Longest text a field may show.
 *
 * Compact: max(compact_floor, total_width - sum(reserved)).
 * Normal/Verbose: max(floor for bp, total_width - fixed_overhead - sum(reserved)),
 * capped at readability_ceiling when bp is Wide.
 * Negative reserved widths count as zero.
 */
int compute_max_length(
    int total_width,
    Breakpoint bp,
    EffectiveMode mode,
    const std::vector<int>& reserved_widths,
    const TruncationPolicy& policy = TruncationPolicy{}
);

TruncationConfig make_truncation_config(
    int total_width,
    Breakpoint bp,
    EffectiveMode mode,
    const std::vector<int>& reserved_widths,
    const TruncationPolicy& policy = TruncationPolicy{}
);

/**
 * Shorten `text` to at most `max_length` display columns.
 *
 * Text that fits is returned unchanged. Otherwise the text is cut at
 * max_length - width(ellipsis); if the last whitespace before that point
 * lies beyond `word_boundary_percent` of it, the cut moves back to the
 * whitespace. Trailing whitespace is dropped and the ellipsis appended.
 * When max_length cannot hold the ellipsis the text is hard-cut without it.
 *
 * The result never exceeds max_length, and truncating it again with the
 * same arguments returns it unchanged.
 */
std::string truncate(
    const std::string& text,
    int max_length,
    const std::string& ellipsis = "...",
    int word_boundary_percent = 60
);

std::string truncate(const std::string& text, const TruncationConfig& config);

/**
 * How many subtask rows a progress view should list.
 * Verbose: clamp(height / 3, 3, 15). Compact, or the narrowest breakpoint: 0.
 * Otherwise clamp(height / 4, 2, 5).
 */
int compute_subtask_limit(int height, EffectiveMode mode, Breakpoint bp);

}  // namespace sextant::layout
