#include "layout/DisplayMode.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace sextant::layout {

const char* to_string(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::Compact: return "compact";
        case DisplayMode::Normal:  return "normal";
        case DisplayMode::Verbose: return "verbose";
    }
    return "normal";
}

DisplayMode parse_display_mode(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return DisplayMode::Normal;
    auto end = text.find_last_not_of(" \t\r\n");
    text = text.substr(start, end - start + 1);

    // Longest alias is "detailed"
    if (text.size() > 8) return DisplayMode::Normal;

    std::string cleaned(text);
    std::transform(cleaned.begin(), cleaned.end(), cleaned.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (cleaned == "compact" || cleaned == "c" || cleaned == "mini" || cleaned == "minimal") {
        return DisplayMode::Compact;
    }
    if (cleaned == "verbose" || cleaned == "v" || cleaned == "debug" || cleaned == "detailed") {
        return DisplayMode::Verbose;
    }
    return DisplayMode::Normal;
}

void DisplayModeState::set(DisplayMode mode) {
    if (mode == mode_) return;
    util::Logger::info(std::string("DisplayMode: ") + to_string(mode_) + " -> " + to_string(mode));
    mode_ = mode;
}

DisplayMode DisplayModeState::toggle_compact() {
    set(mode_ == DisplayMode::Compact ? DisplayMode::Normal : DisplayMode::Compact);
    return mode_;
}

DisplayMode DisplayModeState::toggle_verbose() {
    set(mode_ == DisplayMode::Verbose ? DisplayMode::Normal : DisplayMode::Verbose);
    return mode_;
}

}  // namespace sextant::layout
