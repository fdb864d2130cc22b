#include "layout/LayoutModeSelector.hpp"

namespace sextant::layout {

EffectiveMode resolve_effective_mode(Breakpoint bp, DisplayMode requested) {
    if (bp == Breakpoint::Narrow && requested != DisplayMode::Verbose) {
        return DisplayMode::Compact;
    }
    return requested;
}

bool use_abbreviations(EffectiveMode mode, int width, int threshold) {
    switch (mode) {
        case DisplayMode::Compact: return true;
        case DisplayMode::Verbose: return false;
        case DisplayMode::Normal:  return width < threshold;
    }
    return false;
}

}  // namespace sextant::layout
