// RegressionDetectorTest.cpp
//
// Unit tests for benchstat::regression::RegressionDetector:
//  - the documented latency scenarios (unchanged and regressed)
//  - InsufficientData is never downgraded to Unchanged
//  - symmetry under metric-direction inversion
//  - zero-variance baselines and the degenerate effect-size sentinel
//  - the three criteria combination rules

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <set>
#include <vector>

#include "BaselineRecord.h"
#include "BenchStatException.h"
#include "BenchmarkSamples.h"
#include "BootstrapEstimator.h"
#include "RegressionDetector.h"
#include "BaselineFixtures.h"

using Catch::Approx;
using namespace benchstat::regression;
using benchstat::analysis::BootstrapEstimate;
using benchstat::analysis::BootstrapEstimator;
using benchstat::analysis::EffectSizeBucket;
using benchstat::analysis::MetricUnit;
using benchstat::analysis::SampleSet;
using benchstat::InvalidParameterException;
using benchstat_test::makeBaseline;
using benchstat_test::normalInterval;

namespace
{
    using Criteria = std::set<RegressionCriterion>;

    const Criteria kAllCriteria = {RegressionCriterion::MeanShift,
                                   RegressionCriterion::CiNonOverlap,
                                   RegressionCriterion::LargeEffect};

    RegressionVerdict detectAgainst(const RegressionDetector& detector,
                                    const SummaryStatistics& current,
                                    const BaselineRecord& baseline)
    {
        return detector.detect(current, normalInterval(current), baseline);
    }

    RegressionClassification mirrored(RegressionClassification c)
    {
        if (c == RegressionClassification::Regressed)
            return RegressionClassification::Improved;
        if (c == RegressionClassification::Improved)
            return RegressionClassification::Regressed;
        return c;
    }
}

TEST_CASE("RegressionDetector: small latency drift stays Unchanged", "[RegressionDetector][scenario]")
{
    // 0.79, 0.80, ..., 0.85 ms repeated to n = 1000
    std::vector<double> values;
    for (int i = 0; i < 1000; ++i)
        values.push_back(0.79 + 0.01 * (i % 7));
    const SampleSet samples("render_frame", MetricUnit::DurationMs, values);

    BootstrapEstimator<> estimator(0.95, 1000);
    const BootstrapEstimate current = estimator.estimate(samples, 42);
    const BaselineRecord baseline = makeBaseline("render_frame", MetricUnit::DurationMs,
                                                 0.80, 0.03, 1000, 63);

    RegressionDetector detector;
    const RegressionVerdict v = detector.detect(current.statistics, current.interval, baseline);

    REQUIRE(current.statistics.getMean() == Approx(0.82).margin(0.001));
    REQUIRE_FALSE(v.holds(RegressionCriterion::MeanShift));
    REQUIRE(v.getMeanShiftSigmas() == Approx(0.666).margin(0.01));
    REQUIRE(v.getClassification() == RegressionClassification::Unchanged);

    // The interval and effect criteria still fire and are reported.
    REQUIRE(v.holds(RegressionCriterion::CiNonOverlap));
    REQUIRE(v.holds(RegressionCriterion::LargeEffect));
    REQUIRE(v.isWeakSignal());

    SECTION("A majority rule turns the same evidence into a verdict")
    {
        RegressionPolicy policy;
        policy.combination = CriteriaCombination::MajorityOfCriteria;
        const RegressionVerdict m = RegressionDetector(policy).detect(current.statistics,
                                                                      current.interval, baseline);
        REQUIRE(m.getClassification() == RegressionClassification::Regressed);
        REQUIRE_FALSE(m.isWeakSignal());
    }
}

TEST_CASE("RegressionDetector: large latency increase is Regressed", "[RegressionDetector][scenario]")
{
    const SummaryStatistics current = SummaryStatistics::fromMoments(1.20, 0.05, 500);
    const BaselineRecord baseline = makeBaseline("render_frame", MetricUnit::DurationMs,
                                                 0.80, 0.03, 1000, 63);

    const RegressionVerdict v = detectAgainst(RegressionDetector(), current, baseline);

    REQUIRE(v.getClassification() == RegressionClassification::Regressed);
    REQUIRE(v.getCriteria() == kAllCriteria);
    REQUIRE_FALSE(v.isWeakSignal());
    REQUIRE(v.getMeanShiftSigmas() == Approx(0.40 / 0.03));
    REQUIRE(v.getEffectSize().has_value());
    REQUIRE(v.getEffectSize()->cohens_d > 9.0);
    REQUIRE(v.getEffectSize()->bucket == EffectSizeBucket::Large);
    REQUIRE(v.getRationale().find("performance worsened") != std::string::npos);
}

TEST_CASE("RegressionDetector: identical statistics show no signal", "[RegressionDetector]")
{
    const SummaryStatistics current = SummaryStatistics::fromMoments(0.80, 0.03, 1000);
    const BaselineRecord baseline = makeBaseline("idle", MetricUnit::DurationMs, 0.80, 0.03, 1000);

    const RegressionVerdict v = detectAgainst(RegressionDetector(), current, baseline);
    REQUIRE(v.getClassification() == RegressionClassification::Unchanged);
    REQUIRE(v.getCriteria().empty());
    REQUIRE_FALSE(v.isWeakSignal());
    REQUIRE(v.getMeanShiftSigmas() == 0.0);
    REQUIRE(v.getEffectSize()->bucket == EffectSizeBucket::Negligible);
}

TEST_CASE("RegressionDetector: InsufficientData is explicit", "[RegressionDetector][insufficient]")
{
    RegressionDetector detector;

    SECTION("Current run smaller than the planned minimum")
    {
        const SummaryStatistics current = SummaryStatistics::fromMoments(1.20, 0.05, 40);
        const BaselineRecord baseline = makeBaseline("io", MetricUnit::DurationMs, 0.80, 0.03, 1000, 63);

        const RegressionVerdict v = detectAgainst(detector, current, baseline);
        REQUIRE(v.getClassification() == RegressionClassification::InsufficientData);
        // Criteria remain visible even though no verdict is given.
        REQUIRE(v.getCriteria() == kAllCriteria);
        REQUIRE(v.isWeakSignal());
        REQUIRE(v.getRationale().find("below planned minimum 63") != std::string::npos);
    }

    SECTION("Exactly the planned minimum is enough")
    {
        const SummaryStatistics current = SummaryStatistics::fromMoments(1.20, 0.05, 63);
        const BaselineRecord baseline = makeBaseline("io", MetricUnit::DurationMs, 0.80, 0.03, 1000, 63);
        REQUIRE(detectAgainst(detector, current, baseline).getClassification() ==
                RegressionClassification::Regressed);
    }

    SECTION("Baseline without a standard deviation")
    {
        const SummaryStatistics one =
            SummaryStatistics::fromMoments(0.80, std::numeric_limits<double>::quiet_NaN(), 1);
        const BaselineRecord baseline("io", MetricUnit::DurationMs, one,
                                      ConfidenceInterval(0.80, 0.80, 0.80, 0.95), 1000, 1,
                                      benchstat_test::fixedContext());
        const SummaryStatistics current = SummaryStatistics::fromMoments(0.81, 0.01, 100);

        const RegressionVerdict v = detectAgainst(detector, current, baseline);
        REQUIRE(v.getClassification() == RegressionClassification::InsufficientData);
        REQUIRE(std::isnan(v.getMeanShiftSigmas()));
        REQUIRE_FALSE(v.holds(RegressionCriterion::MeanShift));
    }

    SECTION("Single-sample current run")
    {
        const SummaryStatistics current =
            SummaryStatistics::fromMoments(5.0, std::numeric_limits<double>::quiet_NaN(), 1);
        const BaselineRecord baseline = makeBaseline("io", MetricUnit::DurationMs, 0.80, 0.03, 1000, 1);

        const RegressionVerdict v =
            detector.detect(current, ConfidenceInterval(5.0, 5.0, 5.0, 0.95), baseline);
        REQUIRE(v.getClassification() == RegressionClassification::InsufficientData);
    }
}

TEST_CASE("RegressionDetector: symmetric under direction inversion", "[RegressionDetector][property]")
{
    struct Case
    {
        double      currentMean;
        double      currentStddev;
        std::size_t currentN;
        std::size_t plannedMinimum;
    };

    const double baseMean = 10.0;
    const double baseStddev = 0.5;
    const std::vector<Case> cases = {
        {12.0, 0.5, 200, 2},    // strong slowdown
        {8.0, 0.5, 200, 2},     // strong speedup
        {10.05, 0.5, 200, 2},   // noise
        {11.5, 0.6, 20, 50},    // too few samples
        {11.2, 3.0, 200, 2},    // noisy slowdown
    };

    RegressionDetector detector;
    for (const auto& c : cases)
    {
        INFO("current mean = " << c.currentMean);
        const SummaryStatistics latencyRun =
            SummaryStatistics::fromMoments(c.currentMean, c.currentStddev, c.currentN);
        const SummaryStatistics rateRun =
            SummaryStatistics::fromMoments(2.0 * baseMean - c.currentMean, c.currentStddev, c.currentN);

        const RegressionVerdict latency = detectAgainst(
            detector, latencyRun,
            makeBaseline("b", MetricUnit::DurationMs, baseMean, baseStddev, 200, c.plannedMinimum));
        const RegressionVerdict rate = detectAgainst(
            detector, rateRun,
            makeBaseline("b", MetricUnit::RatePerSec, baseMean, baseStddev, 200, c.plannedMinimum));

        REQUIRE(rate.getClassification() == mirrored(latency.getClassification()));
        REQUIRE(rate.getCriteria() == latency.getCriteria());
    }

    const auto classify = [&](double mean, MetricUnit unit) {
        return detectAgainst(detector, SummaryStatistics::fromMoments(mean, 0.5, 200),
                             makeBaseline("b", unit, baseMean, baseStddev, 200))
            .getClassification();
    };
    REQUIRE(classify(12.0, MetricUnit::DurationMs) == RegressionClassification::Regressed);
    REQUIRE(classify(12.0, MetricUnit::RatePerSec) == RegressionClassification::Improved);
    REQUIRE(classify(8.0, MetricUnit::DurationMs) == RegressionClassification::Improved);
    REQUIRE(classify(8.0, MetricUnit::RatePerSec) == RegressionClassification::Regressed);
}

TEST_CASE("RegressionDetector: zero-variance baselines", "[RegressionDetector][degenerate]")
{
    RegressionDetector detector;
    const BaselineRecord flat = makeBaseline("const", MetricUnit::DurationMs, 1.0, 0.0, 50);

    SECTION("Any difference is an infinite mean shift")
    {
        const SummaryStatistics current = SummaryStatistics::fromMoments(1.5, 0.1, 50);
        const RegressionVerdict v = detectAgainst(detector, current, flat);
        REQUIRE(std::isinf(v.getMeanShiftSigmas()));
        REQUIRE(v.getMeanShiftSigmas() > 0.0);
        REQUIRE(v.getClassification() == RegressionClassification::Regressed);
        REQUIRE(v.getEffectSize()->cohens_d == Approx(0.5 / std::sqrt(49.0 * 0.01 / 98.0)));
    }

    SECTION("Both sides constant uses the infinite effect sentinel")
    {
        const SummaryStatistics current = SummaryStatistics::fromMoments(0.5, 0.0, 50);
        const RegressionVerdict v = detectAgainst(detector, current, flat);
        REQUIRE(v.getCriteria() == kAllCriteria);
        REQUIRE(v.getClassification() == RegressionClassification::Improved);
        REQUIRE(v.getEffectSize()->cohens_d == -std::numeric_limits<double>::infinity());
        REQUIRE(v.getEffectSize()->bucket == EffectSizeBucket::Large);
    }

    SECTION("Both sides constant and equal is no change")
    {
        const SummaryStatistics current = SummaryStatistics::fromMoments(1.0, 0.0, 50);
        const RegressionVerdict v = detectAgainst(detector, current, flat);
        REQUIRE(v.getMeanShiftSigmas() == 0.0);
        REQUIRE(v.getClassification() == RegressionClassification::Unchanged);
        REQUIRE(v.getCriteria().empty());
    }
}

TEST_CASE("RegressionDetector: combination rules", "[RegressionDetector][policy]")
{
    const BaselineRecord baseline = makeBaseline("net", MetricUnit::DurationMs, 10.0, 1.0, 5);

    auto detectWith = [&](CriteriaCombination rule, const SummaryStatistics& current,
                          const ConfidenceInterval& ci) {
        RegressionPolicy policy;
        policy.combination = rule;
        return RegressionDetector(policy).detect(current, ci, baseline);
    };

    SECTION("Mean shift corroborated by effect size only")
    {
        // Wide current interval overlaps the baseline's.
        const SummaryStatistics current = SummaryStatistics::fromMoments(13.0, 1.0, 5);
        const ConfidenceInterval wide(9.0, 13.0, 17.0, 0.95);

        const RegressionVerdict def = detectWith(CriteriaCombination::MeanShiftPlusCorroboration, current, wide);
        const Criteria shiftAndEffect = {RegressionCriterion::MeanShift, RegressionCriterion::LargeEffect};
        REQUIRE(def.getCriteria() == shiftAndEffect);
        REQUIRE(def.getClassification() == RegressionClassification::Regressed);

        const RegressionVerdict all = detectWith(CriteriaCombination::AllCriteria, current, wide);
        REQUIRE(all.getClassification() == RegressionClassification::Unchanged);
        REQUIRE(all.isWeakSignal());

        const RegressionVerdict majority = detectWith(CriteriaCombination::MajorityOfCriteria, current, wide);
        REQUIRE(majority.getClassification() == RegressionClassification::Regressed);
    }

    SECTION("Mean shift alone is only a weak signal under every rule")
    {
        // Noisy current run: pooled deviation keeps d small.
        const SummaryStatistics current = SummaryStatistics::fromMoments(13.0, 10.0, 1000);
        const ConfidenceInterval wide(9.0, 13.0, 17.0, 0.95);
        const Criteria shiftOnly = {RegressionCriterion::MeanShift};

        for (auto rule : {CriteriaCombination::MeanShiftPlusCorroboration,
                          CriteriaCombination::AllCriteria,
                          CriteriaCombination::MajorityOfCriteria})
        {
            INFO("rule = " << toString(rule));
            const RegressionVerdict v = detectWith(rule, current, wide);
            REQUIRE(v.getCriteria() == shiftOnly);
            REQUIRE(v.getClassification() == RegressionClassification::Unchanged);
            REQUIRE(v.isWeakSignal());
        }
    }

    SECTION("Rule names round-trip")
    {
        for (auto rule : {CriteriaCombination::MeanShiftPlusCorroboration,
                          CriteriaCombination::AllCriteria,
                          CriteriaCombination::MajorityOfCriteria})
            REQUIRE(criteriaCombinationFromString(toString(rule)) == rule);
        REQUIRE_THROWS_AS(criteriaCombinationFromString("unanimous"), InvalidParameterException);
    }

    SECTION("Thresholds are validated")
    {
        RegressionPolicy bad;
        bad.meanShiftSigmas = 0.0;
        REQUIRE_THROWS_AS(RegressionDetector(bad), InvalidParameterException);

        RegressionPolicy negative;
        negative.largeEffectThreshold = -1.0;
        REQUIRE_THROWS_AS(RegressionDetector(negative), InvalidParameterException);
    }
}
