#include "../framework/SimpleTest.hpp"
#include "config/ConfigError.hpp"
#include "layout/Breakpoint.hpp"
#include "layout/DimensionObserver.hpp"
#include "ui/Terminal.hpp"

using namespace sextant::layout;
using sextant::config::ConfigError;
using sextant::ui::FixedSizeSource;

TEST_CASE(test_classify_boundaries) {
    auto table = ThresholdTable::standard();

    ASSERT_EQ(classify(59, table), Breakpoint::Narrow);
    ASSERT_EQ(classify(60, table), Breakpoint::Compact);
    ASSERT_EQ(classify(99, table), Breakpoint::Compact);
    ASSERT_EQ(classify(100, table), Breakpoint::Normal);
    ASSERT_EQ(classify(159, table), Breakpoint::Normal);
    ASSERT_EQ(classify(160, table), Breakpoint::Wide);
}

TEST_CASE(test_classify_degenerate_widths) {
    auto table = ThresholdTable::standard();

    ASSERT_EQ(table.classify(0), Breakpoint::Narrow);
    ASSERT_EQ(table.classify(-40), Breakpoint::Narrow);
    ASSERT_EQ(table.classify(100000), Breakpoint::Wide);
}

TEST_CASE(test_classify_is_repeatable) {
    auto table = ThresholdTable::standard();
    for (int w = 0; w < 250; w += 7) {
        Breakpoint first = table.classify(w);
        for (int i = 0; i < 3; ++i) {
            ASSERT_EQ(table.classify(w), first);
        }
    }
}

TEST_CASE(test_classify_is_monotonic) {
    auto table = ThresholdTable::standard();
    int previous = ordinal(table.classify(-1));
    for (int w = 0; w <= 400; ++w) {
        int current = ordinal(table.classify(w));
        ASSERT_TRUE(current >= previous);
        previous = current;
    }
}

TEST_CASE(test_custom_table_classifies_with_its_bounds) {
    auto table = ThresholdTable::create({
        {Breakpoint::Narrow, 0},
        {Breakpoint::Compact, 40},
        {Breakpoint::Normal, 80},
        {Breakpoint::Wide, 120},
    });

    ASSERT_EQ(table.classify(39), Breakpoint::Narrow);
    ASSERT_EQ(table.classify(40), Breakpoint::Compact);
    ASSERT_EQ(table.classify(120), Breakpoint::Wide);
    ASSERT_EQ(table.lower_bound(Breakpoint::Normal), 80);
}

TEST_CASE(test_table_rejects_equal_bounds) {
    ASSERT_THROWS(ThresholdTable::create({
        {Breakpoint::Narrow, 0},
        {Breakpoint::Compact, 60},
        {Breakpoint::Normal, 60},
        {Breakpoint::Wide, 160},
    }), ConfigError);
}

TEST_CASE(test_table_rejects_decreasing_bounds) {
    ASSERT_THROWS(ThresholdTable::create({
        {Breakpoint::Narrow, 0},
        {Breakpoint::Compact, 100},
        {Breakpoint::Normal, 60},
        {Breakpoint::Wide, 160},
    }), ConfigError);
}

TEST_CASE(test_table_rejects_missing_or_misordered_entries) {
    ASSERT_THROWS(ThresholdTable::create({
        {Breakpoint::Narrow, 0},
        {Breakpoint::Normal, 60},
        {Breakpoint::Wide, 120},
    }), ConfigError);

    ASSERT_THROWS(ThresholdTable::create({
        {Breakpoint::Narrow, 0},
        {Breakpoint::Normal, 60},
        {Breakpoint::Compact, 100},
        {Breakpoint::Wide, 160},
    }), ConfigError);
}

TEST_CASE(test_table_requires_narrow_at_zero) {
    ASSERT_THROWS(ThresholdTable::create({
        {Breakpoint::Narrow, 10},
        {Breakpoint::Compact, 60},
        {Breakpoint::Normal, 100},
        {Breakpoint::Wide, 160},
    }), ConfigError);
}

TEST_CASE(test_breakpoint_names) {
    ASSERT_EQ(std::string(to_string(Breakpoint::Compact)), "compact");
    ASSERT_TRUE(breakpoint_from_string("wide") == Breakpoint::Wide);
    ASSERT_FALSE(breakpoint_from_string("huge").has_value());
}

TEST_CASE(test_snapshot_flags_match_breakpoint) {
    auto snap = make_snapshot({120, 30, true}, ThresholdTable::standard());

    ASSERT_EQ(snap.breakpoint, Breakpoint::Normal);
    ASSERT_TRUE(snap.is_normal);
    ASSERT_FALSE(snap.is_narrow);
    ASSERT_FALSE(snap.is_compact);
    ASSERT_FALSE(snap.is_wide);
    ASSERT_TRUE(snap.is_available);
}

TEST_CASE(test_observer_samples_source) {
    FixedSizeSource source(170, 48);
    DimensionObserver observer(source, ThresholdTable::standard());

    auto snap = observer.snapshot();
    ASSERT_EQ(snap->width, 170);
    ASSERT_EQ(snap->height, 48);
    ASSERT_EQ(snap->breakpoint, Breakpoint::Wide);
    ASSERT_TRUE(snap->is_wide);
    ASSERT_TRUE(snap->is_available);
}

TEST_CASE(test_observer_falls_back_when_unavailable) {
    FixedSizeSource source;
    source.set_unavailable();
    DimensionObserver observer(source, ThresholdTable::standard());

    auto size = observer.sample();
    ASSERT_EQ(size.width, 80);
    ASSERT_EQ(size.height, 24);
    ASSERT_FALSE(size.is_available);

    auto snap = observer.snapshot();
    ASSERT_EQ(snap->breakpoint, Breakpoint::Compact);
    ASSERT_FALSE(snap->is_available);
}

TEST_CASE(test_observer_falls_back_on_zero_size) {
    FixedSizeSource source(0, 0);
    ObserverSettings settings;
    settings.fallback_width = 100;
    settings.fallback_height = 30;
    DimensionObserver observer(source, ThresholdTable::standard(), settings);

    auto size = observer.sample();
    ASSERT_EQ(size.width, 100);
    ASSERT_EQ(size.height, 30);
    ASSERT_FALSE(size.is_available);

    // Width known but rows unknown: only the height falls back
    source.set(70, 0);
    size = observer.sample();
    ASSERT_EQ(size.width, 70);
    ASSERT_EQ(size.height, 30);
    ASSERT_TRUE(size.is_available);
}

TEST_CASE(test_observer_width_override) {
    FixedSizeSource source(50, 20);
    ObserverSettings settings;
    settings.width_override = 200;
    DimensionObserver observer(source, ThresholdTable::standard(), settings);

    ASSERT_EQ(observer.snapshot()->width, 200);
    ASSERT_EQ(observer.snapshot()->height, 20);
    ASSERT_EQ(observer.snapshot()->breakpoint, Breakpoint::Wide);
}

TEST_CASE(test_refresh_publishes_new_snapshot) {
    FixedSizeSource source(120, 40);
    DimensionObserver observer(source, ThresholdTable::standard());

    auto before = observer.snapshot();
    ASSERT_FALSE(observer.refresh());

    source.set(50, 24);
    ASSERT_TRUE(observer.refresh());

    auto after = observer.snapshot();
    ASSERT_EQ(after->breakpoint, Breakpoint::Narrow);
    ASSERT_TRUE(after->is_narrow);

    // Earlier snapshots are untouched
    ASSERT_EQ(before->width, 120);
    ASSERT_EQ(before->breakpoint, Breakpoint::Normal);

    ASSERT_FALSE(observer.refresh());
}

TEST_CASE(test_refresh_reports_height_only_change) {
    FixedSizeSource source(120, 40);
    DimensionObserver observer(source, ThresholdTable::standard());

    source.set(120, 20);
    ASSERT_TRUE(observer.refresh());
    ASSERT_EQ(observer.snapshot()->breakpoint, Breakpoint::Normal);
    ASSERT_EQ(observer.snapshot()->height, 20);
}

int main() {
    return sextant::test::TestRunner::instance().run_all();
}
