#include "layout/StatusLine.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>

namespace sextant::layout {

const std::string& choose_text(const Segment& segment, bool abbreviate) {
    if (abbreviate && segment.abbreviated_text) {
        return *segment.abbreviated_text;
    }
    return segment.full_text;
}

std::string compose_status_line(
    const std::vector<Segment>& kept,
    const LayoutBudget& budget,
    bool abbreviate,
    const std::string& ellipsis
) {
    if (budget.total_width <= 0) return "";

    std::string gap(static_cast<size_t>(std::max(0, budget.inter_segment_gap)), ' ');
    std::string left;
    std::string right;

    for (const auto& segment : kept) {
        const std::string& text = choose_text(segment, abbreviate);
        if (text.empty()) continue;

        std::string& side = segment.side == Side::Left ? left : right;
        if (!side.empty()) side += gap;
        side += text;
    }

    int padding = std::clamp(budget.fixed_padding, 0, budget.total_width);
    int inner = budget.total_width - padding;
    std::string line(static_cast<size_t>(padding), ' ');

    if (right.empty()) {
        return line + ui::trunc_pad(left, inner, ellipsis);
    }
    if (left.empty()) {
        int rvis = ui::display_cols(right);
        return line + std::string(static_cast<size_t>(std::max(0, inner - rvis)), ' ') + right;
    }
    return line + ui::lr_align(inner, left, right, ellipsis);
}

}  // namespace sextant::layout
