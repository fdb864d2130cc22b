#pragma once

#include "layout/Breakpoint.hpp"
#include "layout/DisplayMode.hpp"

namespace sextant::layout {

/**
 * Reconcile the requested density with the current breakpoint.
 * At the narrowest breakpoint anything but Verbose is forced to Compact;
 * an explicit Verbose request is honored even if the line overflows.
 */
EffectiveMode resolve_effective_mode(Breakpoint bp, DisplayMode requested);

/**
 * Whether segment labels should use their abbreviated form.
 * Compact always abbreviates, Verbose never does, Normal abbreviates
 * below `threshold` columns.
 */
bool use_abbreviations(EffectiveMode mode, int width, int threshold = 80);

}  // namespace sextant::layout
