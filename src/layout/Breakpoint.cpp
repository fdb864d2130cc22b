#include "layout/Breakpoint.hpp"
#include "config/ConfigError.hpp"
#include "util/Logger.hpp"
#include <format>

namespace sextant::layout {

const char* to_string(Breakpoint bp) {
    switch (bp) {
        case Breakpoint::Narrow:  return "narrow";
        case Breakpoint::Compact: return "compact";
        case Breakpoint::Normal:  return "normal";
        case Breakpoint::Wide:    return "wide";
    }
    return "narrow";
}

std::optional<Breakpoint> breakpoint_from_string(std::string_view name) {
    if (name == "narrow") return Breakpoint::Narrow;
    if (name == "compact") return Breakpoint::Compact;
    if (name == "normal") return Breakpoint::Normal;
    if (name == "wide") return Breakpoint::Wide;
    return std::nullopt;
}

ThresholdTable::ThresholdTable(std::vector<Threshold> entries)
    : entries_(std::move(entries)) {}

ThresholdTable ThresholdTable::standard() {
    return ThresholdTable({
        {Breakpoint::Narrow, 0},
        {Breakpoint::Compact, 60},
        {Breakpoint::Normal, 100},
        {Breakpoint::Wide, 160},
    });
}

ThresholdTable ThresholdTable::create(std::vector<Threshold> entries) {
    auto fail = [](const std::string& msg) -> void {
        util::Logger::error("ThresholdTable: " + msg);
        throw config::ConfigError("invalid breakpoint table: " + msg);
    };

    if (entries.size() != static_cast<size_t>(kBreakpointCount)) {
        fail(std::format("expected {} entries, got {}", kBreakpointCount, entries.size()));
    }

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (ordinal(e.breakpoint) != static_cast<int>(i)) {
            fail(std::format("entry {} is '{}', expected '{}'", i, to_string(e.breakpoint),
                             to_string(static_cast<Breakpoint>(i))));
        }
        if (i == 0 && e.lower_bound != 0) {
            fail(std::format("narrow must start at 0, got {}", e.lower_bound));
        }
        if (i > 0 && e.lower_bound <= entries[i - 1].lower_bound) {
            fail(std::format("'{}' ({}) must be greater than '{}' ({})",
                             to_string(e.breakpoint), e.lower_bound,
                             to_string(entries[i - 1].breakpoint), entries[i - 1].lower_bound));
        }
    }

    return ThresholdTable(std::move(entries));
}

Breakpoint ThresholdTable::classify(int width) const {
    Breakpoint result = Breakpoint::Narrow;
    for (const auto& e : entries_) {
        if (width < e.lower_bound) break;
        result = e.breakpoint;
    }
    return result;
}

int ThresholdTable::lower_bound(Breakpoint bp) const {
    for (const auto& e : entries_) {
        if (e.breakpoint == bp) return e.lower_bound;
    }
    return 0;
}

Breakpoint classify(int width, const ThresholdTable& table) {
    return table.classify(width);
}

}  // namespace sextant::layout
