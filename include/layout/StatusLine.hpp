#pragma once

#include "layout/Segment.hpp"
#include <string>
#include <vector>

namespace sextant::layout {

/**
 * Text a segment shows: the abbreviated form when asked for and present.
 */
const std::string& choose_text(const Segment& segment, bool abbreviate);

/**
 * Lay kept segments out on one line of budget.total_width columns.
 * Left segments start after the fixed padding, right segments sit flush
 * right, both joined with the inter-segment gap. On overflow the left side
 * is shortened and marked with `ellipsis`; the line is wider than the
 * budget only when the right side alone is.
 */
std::string compose_status_line(
    const std::vector<Segment>& kept,
    const LayoutBudget& budget,
    bool abbreviate,
    const std::string& ellipsis = "..."
);

}  // namespace sextant::layout
