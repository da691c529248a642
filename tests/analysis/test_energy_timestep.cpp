/**
 * @file test_energy_timestep.cpp
 * @brief Tests for the energy balance and timestep rules
 */

#include <dynadiag/analysis/EnergyAnalyzer.hpp>
#include <dynadiag/analysis/TimestepAnalyzer.hpp>

#include <gtest/gtest.h>

#include <map>
#include <utility>
#include <vector>

using namespace dynadiag;

namespace {

EnergySample Sample(std::size_t ordinal, double internal, double hourglass, double ratio = 1.0) {
    EnergySample s;
    s.ordinal = ordinal;
    s.cycle = static_cast<Cycle>(ordinal) * 100;
    s.time = static_cast<double>(ordinal) * 1e-3;
    s.kinetic = 100.0;
    s.internal = internal;
    s.hourglass = hourglass;
    s.total = s.kinetic + s.internal + s.hourglass;
    s.ratio = ratio;
    return s;
}

std::vector<EnergySample> RatioSeries(std::initializer_list<double> ratios) {
    std::vector<EnergySample> out;
    std::size_t i = 0;
    for (double r : ratios) {
        out.push_back(Sample(i++, 1000.0, 10.0, r));
    }
    return out;
}

TimestepRecord Record(Cycle cycle, double dt, ElementId element, PartId part = 1) {
    return TimestepRecord{.cycle = cycle,
                          .time = static_cast<double>(cycle) * 1e-6,
                          .dt = dt,
                          .element_kind = ElementKind::Solid,
                          .element = element,
                          .part = part};
}

} // namespace

// =============================================================================
// Hourglass growth
// =============================================================================

TEST(EnergyRules, HourglassGrowthWarnsThenEscalatesOnce) {
    std::vector<EnergySample> series;
    const double ratios[] = {0.02, 0.05, 0.08, 0.11, 0.14, 0.17, 0.19, 0.22};
    for (std::size_t i = 0; i < 8; ++i) {
        series.push_back(Sample(i, 1000.0, ratios[i] * 1000.0));
    }

    auto findings = rules::energy::HourglassGrowth(series, SourceKind::Glstat);
    ASSERT_EQ(findings.size(), 2u);

    EXPECT_EQ(findings[0].severity, FindingSeverity::Warning);
    ASSERT_EQ(findings[0].evidence.size(), 1u);
    EXPECT_EQ(findings[0].evidence[0].entity, "sample");
    EXPECT_EQ(findings[0].evidence[0].id, 3);
    EXPECT_EQ(findings[0].evidence[0].source, SourceKind::Glstat);

    EXPECT_EQ(findings[1].severity, FindingSeverity::Critical);
    EXPECT_EQ(findings[1].evidence[0].id, 7);
    EXPECT_EQ(findings[1].evidence[0].cycle, Cycle{700});
}

TEST(EnergyRules, HourglassRatioIgnoresNonPositiveInternal) {
    EXPECT_DOUBLE_EQ(rules::energy::HourglassRatio(Sample(0, 0.0, 50.0)), 0.0);
    EXPECT_DOUBLE_EQ(rules::energy::HourglassRatio(Sample(0, 200.0, 50.0)), 0.25);
}

TEST(EnergyRules, QuietSeriesRaisesNothing) {
    std::vector<EnergySample> series;
    for (std::size_t i = 0; i < 20; ++i) {
        series.push_back(Sample(i, 1000.0 + static_cast<double>(i), 10.0));
    }
    EXPECT_TRUE(rules::energy::HourglassGrowth(series, SourceKind::Glstat).empty());
    EXPECT_TRUE(rules::energy::RatioDivergence(series, SourceKind::Glstat).empty());
    EXPECT_TRUE(rules::energy::RatioBand(series, SourceKind::Glstat).empty());
    EXPECT_TRUE(rules::energy::KineticJumps(series, SourceKind::Glstat).empty());
    EXPECT_TRUE(rules::energy::NegativeInternal(series, SourceKind::Glstat).empty());
}

// =============================================================================
// Energy ratio
// =============================================================================

TEST(EnergyRules, RatioDivergenceFiresPerDivergedSample) {
    auto series = RatioSeries({1.0, 5.1, 5.3, 1.0, 6.0});
    auto findings = rules::energy::RatioDivergence(series, SourceKind::Glstat);
    ASSERT_EQ(findings.size(), 3u);
    for (const auto &f : findings) {
        EXPECT_EQ(f.severity, FindingSeverity::Critical);
        EXPECT_EQ(f.title, "Energy ratio diverged");
    }
    EXPECT_EQ(findings[0].evidence[0].id, 1);
    EXPECT_EQ(findings[2].evidence[0].id, 4);
    EXPECT_DOUBLE_EQ(*findings[2].evidence[0].value, 6.0);
}

TEST(EnergyRules, ModestDeviationIsABandWarningOnly) {
    auto series = RatioSeries({1.0, 1.5, 1.6});
    EXPECT_TRUE(rules::energy::RatioDivergence(series, SourceKind::Hsp).empty());

    auto band = rules::energy::RatioBand(series, SourceKind::Hsp);
    ASSERT_EQ(band.size(), 1u);
    EXPECT_EQ(band[0].severity, FindingSeverity::Warning);
    EXPECT_EQ(band[0].evidence[0].id, 1);
    EXPECT_EQ(band[0].evidence[0].source, SourceKind::Hsp);
}

// =============================================================================
// Kinetic, sliding, internal
// =============================================================================

TEST(EnergyRules, KineticJumpFiresOnHundredfoldGrowth) {
    std::vector<EnergySample> series{Sample(0, 1000.0, 0.0), Sample(1, 1000.0, 0.0),
                                     Sample(2, 1000.0, 0.0)};
    series[1].kinetic = 100.0 * 100.0;
    series[2].kinetic = 100.0 * 100.0 * 2.0;

    auto findings = rules::energy::KineticJumps(series, SourceKind::Glstat);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].evidence[0].id, 1);
    EXPECT_DOUBLE_EQ(*findings[0].evidence[0].value, 100.0);
}

TEST(EnergyRules, KineticDominanceReportsFirstSampleOnly) {
    std::vector<EnergySample> series{Sample(0, 1000.0, 0.0), Sample(1, 5.0, 0.0),
                                     Sample(2, 1.0, 0.0)};
    auto findings = rules::energy::KineticDominance(series, SourceKind::Glstat);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].evidence[0].id, 1);
}

TEST(EnergyRules, SlidingShareAndSpike) {
    std::vector<EnergySample> series{Sample(0, 1000.0, 0.0), Sample(1, 1000.0, 0.0)};
    series[0].sliding = 1.0;
    series[1].sliding = 600.0;
    series[0].total = 1101.0;
    series[1].total = 1700.0;

    auto share = rules::energy::SlidingShare(series, SourceKind::Glstat);
    ASSERT_EQ(share.size(), 1u);
    EXPECT_EQ(share[0].title, "High sliding interface energy");
    EXPECT_EQ(share[0].evidence[0].id, 1);

    auto spikes = rules::energy::SlidingSpikes(series, SourceKind::Glstat);
    ASSERT_EQ(spikes.size(), 1u);
    EXPECT_DOUBLE_EQ(*spikes[0].evidence[0].value, 600.0);
}

TEST(EnergyRules, NegativeInternalIsCritical) {
    std::vector<EnergySample> series{Sample(0, 1000.0, 0.0), Sample(1, -3.0, 0.0),
                                     Sample(2, -5.0, 0.0)};
    auto findings = rules::energy::NegativeInternal(series, SourceKind::Glstat);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].severity, FindingSeverity::Critical);
    EXPECT_EQ(findings[0].evidence[0].id, 1);
}

TEST(EnergyRules, PartHourglassUsesMatsumTitles) {
    std::map<PartId, MaterialSample> materials;
    materials[1] = MaterialSample{.part = 1, .cycle = 4, .time = 0.01, .title = "body",
                                  .internal = 1000.0, .hourglass = 50.0};
    materials[2] = MaterialSample{.part = 2, .cycle = 4, .time = 0.01, .title = "",
                                  .internal = 100.0, .hourglass = 30.0};
    ElementPartMapper::Builder builder;
    builder.AddPartTitle(2, "plate");
    auto mapper = std::move(builder).Build();

    auto findings = rules::energy::PartHourglass(materials, mapper);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].evidence[0].source, SourceKind::Matsum);
    EXPECT_EQ(findings[0].evidence[0].entity, "part");
    EXPECT_EQ(findings[0].evidence[0].id, 2);
    EXPECT_NE(findings[0].message.find("plate"), std::string::npos);
}

TEST(EnergyAnalyzer, PrefersGlstatAndSummarizesLastSample) {
    RunData data;
    data.hsp_energy = RatioSeries({1.0, 1.0});
    data.glstat_energy = RatioSeries({1.0, 1.0, 1.02});
    ElementPartMapper mapper;
    auto config = AnalysisConfig::Default();
    AnalysisContext ctx{data, mapper, KnowledgeBase::Instance(), config};

    auto result = EnergyAnalyzer().Analyze(ctx);
    EXPECT_TRUE(result.findings.empty());
    ASSERT_TRUE(result.summaries.energy.has_value());
    EXPECT_EQ(result.summaries.energy->source, SourceKind::Glstat);
    EXPECT_EQ(result.summaries.energy->samples, 3u);
    EXPECT_DOUBLE_EQ(result.summaries.energy->final_ratio, 1.02);
    EXPECT_DOUBLE_EQ(result.summaries.energy->final_hourglass_ratio, 0.01);
}

// =============================================================================
// Timestep collapse and drop
// =============================================================================

TEST(TimestepRules, CollapseGroupsContiguousRuns) {
    std::vector<TimestepRecord> records{Record(100, 1e-6, 101), Record(200, 5e-12, 101),
                                        Record(300, 2e-12, 101), Record(400, 1e-6, 102),
                                        Record(500, 3e-12, 102)};
    auto findings = rules::timestep::Collapse(records, SourceKind::Hsp);
    ASSERT_EQ(findings.size(), 2u);

    const auto &first = findings[0];
    EXPECT_EQ(first.severity, FindingSeverity::Critical);
    EXPECT_EQ(first.occurrences, 2);
    ASSERT_EQ(first.evidence.size(), 1u);
    EXPECT_EQ(first.evidence[0].entity, "element");
    EXPECT_EQ(first.evidence[0].id, 101);
    EXPECT_EQ(first.evidence[0].cycle, Cycle{200});
    EXPECT_EQ(first.evidence[0].cycle_end, Cycle{300});
    EXPECT_DOUBLE_EQ(*first.evidence[0].value, 2e-12);

    EXPECT_EQ(findings[1].occurrences, 1);
    EXPECT_EQ(findings[1].evidence[0].id, 102);
}

TEST(TimestepRules, ZeroDtIsNotACollapse) {
    std::vector<TimestepRecord> records{Record(0, 0.0, 101), Record(100, 1e-6, 101)};
    EXPECT_TRUE(rules::timestep::Collapse(records, SourceKind::Hsp).empty());
}

TEST(TimestepRules, ZeroDtSplitsACollapseInterval) {
    std::vector<TimestepRecord> records{Record(0, 1e-6, 101), Record(100, 5e-12, 101),
                                        Record(200, 0.0, 101), Record(300, 2e-12, 101)};
    auto findings = rules::timestep::Collapse(records, SourceKind::Hsp);
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0].evidence[0].cycle, 100);
    EXPECT_EQ(findings[0].evidence[0].cycle_end, 100);
    EXPECT_EQ(findings[1].evidence[0].cycle, 300);
}

TEST(TimestepRules, DtDropSeverityFollowsRatio) {
    std::vector<TimestepRecord> mild{Record(0, 1e-6, 101), Record(100, 4e-7, 101)};
    auto warning = rules::timestep::DtDrop(mild, SourceKind::Hsp);
    ASSERT_EQ(warning.size(), 1u);
    EXPECT_EQ(warning[0].title, "Significant timestep drop");

    std::vector<TimestepRecord> severe{Record(0, 1e-6, 101), Record(100, 5e-8, 103)};
    auto critical = rules::timestep::DtDrop(severe, SourceKind::Hsp);
    ASSERT_EQ(critical.size(), 1u);
    EXPECT_EQ(critical[0].severity, FindingSeverity::Critical);
    EXPECT_EQ(critical[0].evidence[0].id, 103);

    std::vector<TimestepRecord> steady{Record(0, 1e-6, 101), Record(100, 0.8e-6, 101)};
    EXPECT_TRUE(rules::timestep::DtDrop(steady, SourceKind::Hsp).empty());
}

// =============================================================================
// Controlling intervals
// =============================================================================

TEST(TimestepRules, IntervalsPartitionTheCycleRange) {
    std::vector<TimestepRecord> records{Record(0, 1e-6, 101),   Record(100, 0.9e-6, 101),
                                        Record(200, 1e-6, 102), Record(300, 1e-6, 102),
                                        Record(400, 1e-6, 101), Record(500, 0.7e-6, 101)};
    auto intervals = rules::timestep::Intervals(records);
    ASSERT_EQ(intervals.size(), 3u);

    EXPECT_EQ(intervals[0].start_cycle, 0);
    EXPECT_EQ(intervals[0].end_cycle, 199);
    EXPECT_EQ(intervals[0].element, 101);
    EXPECT_DOUBLE_EQ(intervals[0].min_dt, 0.9e-6);

    for (std::size_t i = 1; i < intervals.size(); ++i) {
        EXPECT_EQ(intervals[i].start_cycle, intervals[i - 1].end_cycle + 1);
    }
    EXPECT_EQ(intervals.back().end_cycle, 500);
    EXPECT_DOUBLE_EQ(intervals.back().min_dt, 0.7e-6);
}

TEST(TimestepRules, RepeatedCycleDoesNotOpenAnInterval) {
    std::vector<TimestepRecord> records{Record(100, 1e-6, 101), Record(100, 1e-6, 102),
                                        Record(200, 1e-6, 102)};
    auto intervals = rules::timestep::Intervals(records);
    ASSERT_EQ(intervals.size(), 2u);
    EXPECT_EQ(intervals[0].end_cycle, 199);
    EXPECT_EQ(intervals[1].start_cycle, 200);
}

// =============================================================================
// Smallest elements
// =============================================================================

TEST(TimestepRules, SmallestElementsAreAscendingWithIdTieBreak) {
    std::vector<ElementTimestep> entries{
        {ElementKind::Solid, 30, 1, 3e-6}, {ElementKind::Solid, 12, 1, 1e-6},
        {ElementKind::Shell, 11, 2, 1e-6}, {ElementKind::Solid, 40, 1, 2e-6}};
    auto top = rules::timestep::SmallestElements(entries, 3);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].element, 11);
    EXPECT_EQ(top[1].element, 12);
    EXPECT_EQ(top[2].element, 40);
}

TEST(TimestepRules, GroupByPartFallsBackToMapper) {
    std::vector<ElementTimestep> entries{{ElementKind::Solid, 101, 0, 1e-6},
                                         {ElementKind::Solid, 102, 0, 2e-6},
                                         {ElementKind::Shell, 201, 2, 5e-7}};
    ElementPartMapper::Builder builder;
    builder.AddElement(101, 1).AddElement(102, 1).AddPartTitle(1, "body");
    auto mapper = std::move(builder).Build();
    auto groups = rules::timestep::GroupByPart(entries, 100, mapper);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].part, 2);
    EXPECT_EQ(groups[1].part, 1);
    EXPECT_EQ(groups[1].title, "body");
    EXPECT_EQ(groups[1].elements, 2u);
}

TEST(TimestepRules, DominantPartAboveEightyPercent) {
    std::vector<ElementTimestep> entries;
    for (ElementId e = 1; e <= 9; ++e) {
        entries.push_back({ElementKind::Solid, e, 3, 1e-6});
    }
    entries.push_back({ElementKind::Solid, 10, 4, 1e-6});
    auto findings = rules::timestep::DominantPart(entries);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].title, "Part 3 dominates timestep control");

    entries.push_back({ElementKind::Solid, 11, 4, 1e-6});
    entries.push_back({ElementKind::Solid, 12, 4, 1e-6});
    EXPECT_TRUE(rules::timestep::DominantPart(entries).empty());
}

TEST(TimestepAnalyzer, DerivesRecordsFromEnergySeries) {
    RunData data;
    for (std::size_t i = 0; i < 3; ++i) {
        auto s = Sample(i, 1000.0, 0.0);
        s.dt = 1e-6;
        s.controlling_kind = ElementKind::Solid;
        s.controlling_element = 101;
        s.controlling_part = 1;
        data.glstat_energy.push_back(s);
    }
    ElementPartMapper mapper;
    auto config = AnalysisConfig::Default();
    AnalysisContext ctx{data, mapper, KnowledgeBase::Instance(), config};

    auto result = TimestepAnalyzer().Analyze(ctx);
    EXPECT_TRUE(result.findings.empty());
    ASSERT_TRUE(result.summaries.timestep.has_value());
    ASSERT_EQ(result.summaries.timestep->intervals.size(), 1u);
    EXPECT_EQ(result.summaries.timestep->intervals[0].end_cycle, 200);
    EXPECT_DOUBLE_EQ(result.summaries.timestep->initial_dt, 1e-6);
}
