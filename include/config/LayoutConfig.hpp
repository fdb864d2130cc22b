#pragma once

#include "layout/Breakpoint.hpp"
#include "layout/DimensionObserver.hpp"
#include "layout/DisplayMode.hpp"
#include "layout/Segment.hpp"
#include "layout/Truncation.hpp"
#include <filesystem>
#include <istream>

namespace sextant::config {

struct DisplaySettings {
    layout::DisplayMode mode = layout::DisplayMode::Normal;
    int abbreviation_width = 80;
};

struct StatusSettings {
    int fixed_padding = 2;
    int gap = 2;
};

struct LayoutConfig {
    layout::ThresholdTable thresholds = layout::ThresholdTable::standard();
    layout::TierCeilings ceilings = layout::TierCeilings::standard();
    layout::ObserverSettings terminal;
    layout::TruncationPolicy truncation;
    DisplaySettings display;
    StatusSettings status;
};

/**
 * Loads layout.toml. Every validation happens here, so a LayoutConfig that
 * came out of the loader is safe for any number of layout passes.
 * Invalid values raise ConfigError; a missing file yields defaults.
 */
class ConfigLoader {
public:
    static LayoutConfig load_config();
    static LayoutConfig load_from_file(const std::filesystem::path& path);
    static LayoutConfig parse(std::istream& in);
    static void save_config(const LayoutConfig& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

private:
    static void validate(const LayoutConfig& cfg);
};

}  // namespace sextant::config
