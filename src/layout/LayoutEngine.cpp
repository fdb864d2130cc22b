#include "layout/LayoutEngine.hpp"
#include "layout/LayoutModeSelector.hpp"
#include "layout/StatusLine.hpp"
#include "layout/Truncation.hpp"

namespace sextant::layout {

LayoutEngine::LayoutEngine(const config::LayoutConfig& config, const DimensionObserver& observer)
    : config_(config), observer_(observer) {}

LayoutFrame LayoutEngine::compute(const std::vector<Segment>& segments, DisplayMode requested) const {
    LayoutFrame frame;
    frame.dimensions = observer_.snapshot();
    const auto& dims = *frame.dimensions;

    frame.requested = requested;
    frame.mode = resolve_effective_mode(dims.breakpoint, requested);
    frame.abbreviate = use_abbreviations(frame.mode, dims.width, config_.display.abbreviation_width);

    frame.budget.total_width = dims.width;
    frame.budget.fixed_padding = config_.status.fixed_padding;
    frame.budget.inter_segment_gap = config_.status.gap;

    frame.allocation = allocate(segments, frame.budget,
                                config_.ceilings.ceiling_for(dims.breakpoint), frame.mode);
    frame.status_line = compose_status_line(frame.allocation.kept, frame.budget, frame.abbreviate,
                                            config_.truncation.ellipsis);
    frame.subtask_limit = compute_subtask_limit(dims.height, frame.mode, dims.breakpoint);
    return frame;
}

int LayoutEngine::max_length(const LayoutFrame& frame, const std::vector<int>& reserved_widths) const {
    return compute_max_length(frame.dimensions->width, frame.dimensions->breakpoint, frame.mode,
                              reserved_widths, config_.truncation);
}

std::string LayoutEngine::fit(const LayoutFrame& frame, const std::string& text,
                              const std::vector<int>& reserved_widths) const {
    const auto& policy = config_.truncation;
    return truncate(text, max_length(frame, reserved_widths), policy.ellipsis,
                    policy.word_boundary_percent);
}

}  // namespace sextant::layout
