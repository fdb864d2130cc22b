#include "config/LayoutConfig.hpp"
#include "config/ConfigError.hpp"
#include "util/Logger.hpp"
#include <array>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <optional>
#include <string>

namespace sextant::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

[[noreturn]] void fail(const std::string& msg) {
    util::Logger::error("Config: " + msg);
    throw ConfigError(msg);
}

int parse_int(const std::string& section, const std::string& key, const std::string& value) {
    int out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        fail(std::format("[{}] {}: expected an integer, got '{}'", section, key, value));
    }
    return out;
}

layout::PriorityTier parse_tier(const std::string& key, const std::string& value) {
    auto tier = layout::tier_from_string(value);
    if (!tier) {
        fail(std::format("[priority] {}: unknown tier '{}'", key, value));
    }
    return *tier;
}

// Values collected while reading; tables are built and validated afterwards
struct PendingTables {
    std::array<std::optional<int>, layout::kBreakpointCount> bounds;
    std::array<std::optional<layout::PriorityTier>, layout::kBreakpointCount> ceilings;
};

void apply(LayoutConfig& cfg, PendingTables& pending, const std::string& section,
           const std::string& key, const std::string& value) {
    if (section == "breakpoints") {
        auto bp = layout::breakpoint_from_string(key);
        if (!bp) fail(std::format("[breakpoints] unknown breakpoint '{}'", key));
        pending.bounds[static_cast<size_t>(layout::ordinal(*bp))] = parse_int(section, key, value);
    }
    else if (section == "priority") {
        auto bp = layout::breakpoint_from_string(key);
        if (!bp) fail(std::format("[priority] unknown breakpoint '{}'", key));
        pending.ceilings[static_cast<size_t>(layout::ordinal(*bp))] = parse_tier(key, value);
    }
    else if (section == "terminal") {
        if (key == "fallback_width") cfg.terminal.fallback_width = parse_int(section, key, value);
        else if (key == "fallback_height") cfg.terminal.fallback_height = parse_int(section, key, value);
        else if (key == "width") cfg.terminal.width_override = parse_int(section, key, value);
        else if (key == "poll_interval_ms") {
            cfg.terminal.poll_interval = std::chrono::milliseconds(parse_int(section, key, value));
        }
        else util::Logger::warn(std::format("Config: ignoring [terminal] {}", key));
    }
    else if (section == "truncation") {
        auto& t = cfg.truncation;
        if (key == "ellipsis") t.ellipsis = value;
        else if (key == "compact_floor") t.compact_floor = parse_int(section, key, value);
        else if (key == "fixed_overhead") t.fixed_overhead = parse_int(section, key, value);
        else if (key == "readability_ceiling") t.readability_ceiling = parse_int(section, key, value);
        else if (key == "word_boundary_ratio") t.word_boundary_percent = parse_int(section, key, value);
        else if (key.starts_with("floor_")) {
            auto bp = layout::breakpoint_from_string(key.substr(6));
            if (!bp) fail(std::format("[truncation] unknown breakpoint in '{}'", key));
            t.floors[static_cast<size_t>(layout::ordinal(*bp))] = parse_int(section, key, value);
        }
        else util::Logger::warn(std::format("Config: ignoring [truncation] {}", key));
    }
    else if (section == "display") {
        if (key == "mode") cfg.display.mode = layout::parse_display_mode(value);
        else if (key == "abbreviation_width") cfg.display.abbreviation_width = parse_int(section, key, value);
        else util::Logger::warn(std::format("Config: ignoring [display] {}", key));
    }
    else if (section == "status") {
        if (key == "fixed_padding") cfg.status.fixed_padding = parse_int(section, key, value);
        else if (key == "gap") cfg.status.gap = parse_int(section, key, value);
        else util::Logger::warn(std::format("Config: ignoring [status] {}", key));
    }
    else {
        util::Logger::warn(std::format("Config: ignoring unknown section [{}]", section));
    }
}

} // namespace

LayoutConfig ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    util::Logger::info("Config: " + config_file.string() + " not found, using defaults");
    return LayoutConfig{};
}

LayoutConfig ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        fail("cannot open " + path.string());
    }
    return parse(file);
}

LayoutConfig ConfigLoader::parse(std::istream& in) {
    LayoutConfig cfg;
    PendingTables pending;

    std::string line, current_section;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            fail(std::format("line {}: expected 'key = value'", line_no));
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        apply(cfg, pending, current_section, key, value);
    }

    // Unset entries keep their standard values
    auto standard_bounds = layout::ThresholdTable::standard();
    std::vector<layout::Threshold> thresholds;
    for (int i = 0; i < layout::kBreakpointCount; ++i) {
        auto bp = static_cast<layout::Breakpoint>(i);
        thresholds.push_back({bp, pending.bounds[static_cast<size_t>(i)].value_or(
                                      standard_bounds.lower_bound(bp))});
    }
    cfg.thresholds = layout::ThresholdTable::create(std::move(thresholds));

    auto standard_ceilings = layout::TierCeilings::standard();
    std::array<layout::PriorityTier, layout::kBreakpointCount> ceilings{};
    for (int i = 0; i < layout::kBreakpointCount; ++i) {
        auto bp = static_cast<layout::Breakpoint>(i);
        ceilings[static_cast<size_t>(i)] = pending.ceilings[static_cast<size_t>(i)].value_or(
            standard_ceilings.ceiling_for(bp));
    }
    cfg.ceilings = layout::TierCeilings::create(ceilings);

    validate(cfg);
    return cfg;
}

void ConfigLoader::validate(const LayoutConfig& cfg) {
    if (cfg.terminal.fallback_width <= 0 || cfg.terminal.fallback_height <= 0) {
        fail(std::format("fallback size must be positive, got {}x{}",
                         cfg.terminal.fallback_width, cfg.terminal.fallback_height));
    }
    if (cfg.terminal.width_override && *cfg.terminal.width_override <= 0) {
        fail(std::format("width override must be positive, got {}", *cfg.terminal.width_override));
    }
    if (cfg.terminal.poll_interval.count() <= 0) {
        fail(std::format("poll_interval_ms must be positive, got {}", cfg.terminal.poll_interval.count()));
    }

    const auto& t = cfg.truncation;
    if (t.compact_floor < 0 || t.fixed_overhead < 0 || t.readability_ceiling <= 0) {
        fail("truncation lengths must not be negative");
    }
    for (int floor : t.floors) {
        if (floor < 0) fail(std::format("truncation floor must not be negative, got {}", floor));
    }
    if (t.word_boundary_percent < 0 || t.word_boundary_percent > 100) {
        fail(std::format("word_boundary_ratio must be 0-100, got {}", t.word_boundary_percent));
    }

    if (cfg.status.fixed_padding < 0 || cfg.status.gap < 0) {
        fail("status padding and gap must not be negative");
    }
}

void ConfigLoader::save_config(const LayoutConfig& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: cannot write " + path.string());
        return;
    }

    file << "# sextant layout configuration\n\n";

    file << "[breakpoints]\n";
    file << "# Lower bound (columns) of each width class; must be strictly increasing\n";
    for (const auto& e : cfg.thresholds.entries()) {
        file << layout::to_string(e.breakpoint) << " = " << e.lower_bound << "\n";
    }

    file << "\n[priority]\n";
    file << "# Least important tier shown at each breakpoint: critical, high, medium, low\n";
    for (int i = 0; i < layout::kBreakpointCount; ++i) {
        auto bp = static_cast<layout::Breakpoint>(i);
        file << layout::to_string(bp) << " = \"" << layout::to_string(cfg.ceilings.ceiling_for(bp)) << "\"\n";
    }

    file << "\n[terminal]\n";
    file << "# Used when the terminal does not report its size\n";
    file << "fallback_width = " << cfg.terminal.fallback_width << "\n";
    file << "fallback_height = " << cfg.terminal.fallback_height << "\n";
    if (cfg.terminal.width_override) {
        file << "width = " << *cfg.terminal.width_override << "\n";
    } else {
        file << "# width = 120\n";
    }
    file << "poll_interval_ms = " << cfg.terminal.poll_interval.count() << "\n";

    const auto& t = cfg.truncation;
    file << "\n[truncation]\n";
    file << "ellipsis = \"" << t.ellipsis << "\"\n";
    file << "compact_floor = " << t.compact_floor << "\n";
    file << "fixed_overhead = " << t.fixed_overhead << "\n";
    file << "readability_ceiling = " << t.readability_ceiling << "\n";
    for (int i = 0; i < layout::kBreakpointCount; ++i) {
        file << "floor_" << layout::to_string(static_cast<layout::Breakpoint>(i))
             << " = " << t.floors[static_cast<size_t>(i)] << "\n";
    }
    file << "# Percent of the cut point a word boundary must lie beyond\n";
    file << "word_boundary_ratio = " << t.word_boundary_percent << "\n";

    file << "\n[display]\n";
    file << "# Mode: \"compact\", \"normal\", \"verbose\"\n";
    file << "mode = \"" << layout::to_string(cfg.display.mode) << "\"\n";
    file << "abbreviation_width = " << cfg.display.abbreviation_width << "\n";

    file << "\n[status]\n";
    file << "fixed_padding = " << cfg.status.fixed_padding << "\n";
    file << "gap = " << cfg.status.gap << "\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    if (auto override_path = std::getenv("SEXTANT_CONFIG"); override_path && *override_path) {
        return override_path;
    }
    if (auto home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "sextant" / "layout.toml";
    }
    return ".config/sextant/layout.toml";
}

}  // namespace sextant::config
