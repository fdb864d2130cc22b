#include "layout/Truncation.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <climits>
#include <numeric>

namespace sextant::layout {

namespace {

long long reserved_total(const std::vector<int>& reserved_widths) {
    return std::accumulate(reserved_widths.begin(), reserved_widths.end(), 0LL,
                           [](long long acc, int w) { return acc + std::max(0, w); });
}

int saturate(long long value) {
    return static_cast<int>(std::clamp<long long>(value, INT_MIN, INT_MAX));
}

} // namespace

int compute_max_length(
    int total_width,
    Breakpoint bp,
    EffectiveMode mode,
    const std::vector<int>& reserved_widths,
    const TruncationPolicy& policy
) {
    long long reserved = reserved_total(reserved_widths);

    if (mode == DisplayMode::Compact) {
        return saturate(std::max<long long>(policy.compact_floor, total_width - reserved));
    }

    long long available = static_cast<long long>(total_width) - policy.fixed_overhead - reserved;
    long long max_length = std::max<long long>(policy.floor_for(bp), available);
    if (bp == Breakpoint::Wide) {
        max_length = std::min<long long>(max_length, policy.readability_ceiling);
    }
    return saturate(max_length);
}

TruncationConfig make_truncation_config(
    int total_width,
    Breakpoint bp,
    EffectiveMode mode,
    const std::vector<int>& reserved_widths,
    const TruncationPolicy& policy
) {
    TruncationConfig config;
    config.max_length = compute_max_length(total_width, bp, mode, reserved_widths, policy);
    config.ellipsis = policy.ellipsis;
    return config;
}

std::string truncate(
    const std::string& text,
    int max_length,
    const std::string& ellipsis,
    int word_boundary_percent
) {
    if (max_length <= 0) return "";
    if (ui::display_cols(text) <= max_length) return text;

    int ellipsis_cols = ui::display_cols(ellipsis);
    if (max_length <= ellipsis_cols) {
        return ui::take_cols(text, max_length);
    }

    int cut = max_length - ellipsis_cols;
    std::string head = ui::take_cols(text, cut);

    int space = ui::last_space_col(head);
    if (space > 0 && space * 100 > cut * word_boundary_percent) {
        head = ui::take_cols(head, space);
    }

    return ui::trim_right(head) + ellipsis;
}

std::string truncate(const std::string& text, const TruncationConfig& config) {
    return truncate(text, config.max_length, config.ellipsis);
}

int compute_subtask_limit(int height, EffectiveMode mode, Breakpoint bp) {
    if (mode == DisplayMode::Verbose) {
        return std::clamp(height / 3, 3, 15);
    }
    if (mode == DisplayMode::Compact || bp == Breakpoint::Narrow) {
        return 0;
    }
    return std::clamp(height / 4, 2, 5);
}

}  // namespace sextant::layout
