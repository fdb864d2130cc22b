#include "../framework/SimpleTest.hpp"
#include "config/LayoutConfig.hpp"
#include "events/Scheduler.hpp"
#include "layout/LayoutEngine.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using namespace sextant;
using namespace sextant::layout;

// Status bar of an agent session, ASCII only so column counts are obvious
static std::vector<Segment> session_segments() {
    return {
        {"conn",  Side::Left,  PriorityTier::Critical, 1,  "*",              std::nullopt},
        {"timer", Side::Left,  PriorityTier::Critical, 5,  "00:42",          std::nullopt},
        {"git",   Side::Left,  PriorityTier::High,     8,  "git:main",       std::nullopt},
        {"model", Side::Right, PriorityTier::High,     10, "model: opus",    "m: opus"},
        {"cost",  Side::Right, PriorityTier::Medium,   7,  "cost: $1.20",    "$1.20"},
        {"api",   Side::Right, PriorityTier::Low,      12, "api: localhost", std::nullopt},
    };
}

static std::vector<std::string> ids(const std::vector<Segment>& segments) {
    std::vector<std::string> out;
    for (const auto& s : segments) out.push_back(s.id);
    return out;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static const std::string kDescription =
    "Refactor the session persistence layer so resumed workflows keep their checkpoints intact.";

TEST_CASE(test_narrow_terminal_pass) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source(50, 24);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(session_segments(), DisplayMode::Normal);

    ASSERT_EQ(frame.dimensions->breakpoint, Breakpoint::Narrow);
    ASSERT_EQ(frame.requested, DisplayMode::Normal);
    ASSERT_EQ(frame.mode, DisplayMode::Compact);
    ASSERT_TRUE(frame.abbreviate);
    ASSERT_EQ(ids(frame.allocation.kept), (std::vector<std::string>{"conn", "timer", "git", "model"}));
    ASSERT_EQ(ids(frame.allocation.dropped), (std::vector<std::string>{"cost", "api"}));
    ASSERT_EQ(frame.allocation.used_width, 32);
    ASSERT_FALSE(frame.allocation.overflow);
    ASSERT_EQ(frame.subtask_limit, 0);

    ASSERT_EQ(ui::display_cols(frame.status_line), 50);
    ASSERT_TRUE(starts_with(frame.status_line, "  *  00:42  git:main"));
    ASSERT_TRUE(ends_with(frame.status_line, " m: opus"));

    ASSERT_EQ(engine.max_length(frame, {2, 10, 8}), 30);
    ASSERT_EQ(engine.fit(frame, kDescription, {2, 10, 8}), "Refactor the session...");
}

TEST_CASE(test_wide_terminal_pass) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source(200, 40);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(session_segments(), DisplayMode::Normal);

    ASSERT_EQ(frame.dimensions->breakpoint, Breakpoint::Wide);
    ASSERT_TRUE(frame.dimensions->is_wide);
    ASSERT_EQ(frame.mode, DisplayMode::Normal);
    ASSERT_FALSE(frame.abbreviate);
    ASSERT_EQ(frame.allocation.kept.size(), 6u);
    ASSERT_TRUE(frame.allocation.dropped.empty());
    ASSERT_EQ(frame.allocation.used_width, 55);
    ASSERT_EQ(frame.subtask_limit, 5);

    ASSERT_EQ(ui::display_cols(frame.status_line), 200);
    ASSERT_TRUE(ends_with(frame.status_line, "model: opus  cost: $1.20  api: localhost"));

    // Readability ceiling
    ASSERT_EQ(engine.max_length(frame, {}), 120);
    ASSERT_EQ(engine.fit(frame, std::string(200, 'x'), {}).size(), 120u);
}

TEST_CASE(test_normal_terminal_pass) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source(120, 40);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(session_segments(), DisplayMode::Normal);

    ASSERT_EQ(frame.dimensions->breakpoint, Breakpoint::Normal);
    ASSERT_FALSE(frame.abbreviate);
    ASSERT_EQ(ids(frame.allocation.dropped), (std::vector<std::string>{"api"}));
    ASSERT_EQ(frame.allocation.used_width, 41);
    ASSERT_TRUE(ends_with(frame.status_line, "model: opus  cost: $1.20"));
    ASSERT_EQ(engine.max_length(frame, {}), 100);
}

TEST_CASE(test_compact_terminal_abbreviates) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source(70, 24);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(session_segments(), DisplayMode::Normal);

    ASSERT_EQ(frame.dimensions->breakpoint, Breakpoint::Compact);
    ASSERT_EQ(frame.mode, DisplayMode::Normal);
    // Below the abbreviation width even outside compact mode
    ASSERT_TRUE(frame.abbreviate);
    ASSERT_EQ(ids(frame.allocation.kept), (std::vector<std::string>{"conn", "timer", "git", "model", "cost"}));
    ASSERT_TRUE(ends_with(frame.status_line, "m: opus  $1.20"));
    ASSERT_EQ(ui::display_cols(frame.status_line), 70);
    ASSERT_EQ(frame.subtask_limit, 5);
}

TEST_CASE(test_verbose_overrides_narrow) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source(30, 24);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(session_segments(), DisplayMode::Verbose);

    ASSERT_EQ(frame.dimensions->breakpoint, Breakpoint::Narrow);
    ASSERT_EQ(frame.mode, DisplayMode::Verbose);
    ASSERT_FALSE(frame.abbreviate);
    ASSERT_EQ(frame.allocation.kept.size(), 6u);
    ASSERT_TRUE(frame.allocation.overflow);
    ASSERT_EQ(frame.subtask_limit, 8);
    ASSERT_TRUE(ends_with(frame.status_line, "api: localhost"));
}

TEST_CASE(test_tight_terminal_evicts_right_first) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source(20, 10);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(session_segments(), DisplayMode::Normal);

    ASSERT_EQ(ids(frame.allocation.kept), (std::vector<std::string>{"conn", "timer", "git"}));
    ASSERT_EQ(ids(frame.allocation.dropped), (std::vector<std::string>{"cost", "api", "model"}));
    ASSERT_EQ(frame.allocation.used_width, 20);
    ASSERT_FALSE(frame.allocation.overflow);
    ASSERT_EQ(frame.status_line, "  *  00:42  git:main");
}

TEST_CASE(test_resize_republishes_snapshot) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source(200, 40);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto before = engine.compute(session_segments(), DisplayMode::Normal);
    ASSERT_EQ(before.dimensions->breakpoint, Breakpoint::Wide);

    source.set(50, 24);
    ui::ResizeSignal::raise();
    ASSERT_TRUE(ui::ResizeSignal::consume());
    ASSERT_FALSE(ui::ResizeSignal::consume());
    ASSERT_TRUE(observer.refresh());

    auto after = engine.compute(session_segments(), DisplayMode::Normal);
    ASSERT_EQ(after.dimensions->breakpoint, Breakpoint::Narrow);
    ASSERT_EQ(after.mode, DisplayMode::Compact);

    // The earlier frame still sees the size it was computed for
    ASSERT_EQ(before.dimensions->width, 200);
    ASSERT_EQ(before.allocation.kept.size(), 6u);

    // Nothing changed since the last refresh
    ASSERT_FALSE(observer.refresh());
}

TEST_CASE(test_scheduler_drives_resampling) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source(120, 40);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);

    int changes = 0;
    auto t0 = events::Scheduler::Clock::now();
    events::Scheduler scheduler;
    scheduler.schedule("resample", cfg.terminal.poll_interval, [&] {
        if (observer.refresh()) ++changes;
    }, t0);
    ASSERT_EQ(scheduler.size(), 1u);

    source.set(70, 40);
    ASSERT_EQ(scheduler.process(t0 + 50ms), 0);
    ASSERT_EQ(observer.snapshot()->width, 120);

    ASSERT_EQ(scheduler.process(t0 + 100ms), 1);
    ASSERT_EQ(changes, 1);
    ASSERT_EQ(observer.snapshot()->breakpoint, Breakpoint::Compact);

    scheduler.unschedule("resample");
    ASSERT_EQ(scheduler.process(t0 + 1000ms), 0);
}

TEST_CASE(test_width_override_from_config) {
    std::istringstream in("[terminal]\nwidth = 132\n[display]\nmode = v\n");
    auto cfg = config::ConfigLoader::parse(in);

    ui::FixedSizeSource source(40, 24);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(session_segments(), cfg.display.mode);
    ASSERT_EQ(frame.dimensions->width, 132);
    ASSERT_EQ(frame.dimensions->height, 24);
    ASSERT_EQ(frame.dimensions->breakpoint, Breakpoint::Normal);
    ASSERT_EQ(frame.mode, DisplayMode::Verbose);
    ASSERT_EQ(frame.subtask_limit, 8);
}

TEST_CASE(test_unavailable_terminal_uses_fallback) {
    config::LayoutConfig cfg;
    ui::FixedSizeSource source;
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(session_segments(), DisplayMode::Normal);
    ASSERT_FALSE(frame.dimensions->is_available);
    ASSERT_EQ(frame.dimensions->width, 80);
    ASSERT_EQ(frame.dimensions->breakpoint, Breakpoint::Compact);
    ASSERT_EQ(ui::display_cols(frame.status_line), 80);
}

TEST_CASE(test_status_line_uses_field_ellipsis) {
    std::vector<Segment> segments = {
        {"git",   Side::Left,  PriorityTier::Critical, 5, "a-very-long-branch-name-here", std::nullopt},
        {"clock", Side::Right, PriorityTier::Critical, 5, "12:00",                        std::nullopt},
    };

    config::LayoutConfig cfg;
    ui::FixedSizeSource source(30, 24);
    DimensionObserver observer(source, cfg.thresholds, cfg.terminal);
    LayoutEngine engine(cfg, observer);

    auto frame = engine.compute(segments, DisplayMode::Normal);
    ASSERT_EQ(frame.status_line, "  a-very-long-branch-... 12:00");
    ASSERT_TRUE(frame.status_line.find("…") == std::string::npos);

    // Same marker as truncated fields when the config changes it
    std::istringstream in("[truncation]\nellipsis = \"~\"\n");
    auto tilde = config::ConfigLoader::parse(in);
    LayoutEngine tilde_engine(tilde, observer);

    frame = tilde_engine.compute(segments, DisplayMode::Normal);
    ASSERT_EQ(frame.status_line, "  a-very-long-branch-na~ 12:00");
    ASSERT_EQ(tilde_engine.fit(frame, std::string(40, 'x'), {}), std::string(29, 'x') + "~");
}

int main() {
    util::Logger::init((std::filesystem::temp_directory_path() / "sextant_test_layout.log").string());
    util::Logger::set_min_level(util::Logger::Level::Debug);
    return sextant::test::TestRunner::instance().run_all();
}
