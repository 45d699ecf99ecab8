// BenchmarkSamplesTest.cpp
//
// Unit tests for the value types shared by every analysis component:
//  - benchstat::analysis::SampleSet and Sample
//  - benchstat::analysis::SummaryStatistics
//  - benchstat::analysis::ConfidenceInterval
//  - the benchstat exception taxonomy

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "BenchStatException.h"
#include "BenchmarkSamples.h"
#include "ConfidenceInterval.h"
#include "SummaryStatistics.h"

using Catch::Approx;
using benchstat::analysis::ConfidenceInterval;
using benchstat::analysis::MetricDirection;
using benchstat::analysis::MetricUnit;
using benchstat::analysis::SampleSet;
using benchstat::analysis::SummaryStatistics;
using benchstat::BenchStatException;
using benchstat::InsufficientSamplesException;
using benchstat::InvalidParameterException;

TEST_CASE("SampleSet construction", "[SampleSet]")
{
    SECTION("Valid set keeps id, unit and order")
    {
        SampleSet s("parse_small", MetricUnit::DurationMs, {3.0, 1.0, 2.0});
        REQUIRE(s.getBenchmarkId() == "parse_small");
        REQUIRE(s.getUnit() == MetricUnit::DurationMs);
        REQUIRE(s.getDirection() == MetricDirection::LowerIsBetter);
        REQUIRE(s.size() == 3);
        REQUIRE(s.getValues() == std::vector<double>{3.0, 1.0, 2.0});
        REQUIRE(s.getSample(1).getIndex() == 1);
        REQUIRE(s.getSample(1).getValue() == 1.0);
    }

    SECTION("Throughput unit is higher-is-better")
    {
        SampleSet s("encode", MetricUnit::RatePerSec, {100.0});
        REQUIRE(s.getDirection() == MetricDirection::HigherIsBetter);
    }

    SECTION("Empty set is rejected with the required count")
    {
        try
        {
            SampleSet s("x", MetricUnit::DurationMs, {});
            FAIL("expected InsufficientSamplesException");
        }
        catch (const InsufficientSamplesException& e)
        {
            REQUIRE(e.getRequired() == 1);
            REQUIRE(e.getActual() == 0);
            REQUIRE(e.getBenchmarkId() == "x");
        }
    }

    SECTION("Empty identifier is rejected")
    {
        REQUIRE_THROWS_AS(SampleSet("", MetricUnit::DurationMs, {1.0}), InvalidParameterException);
    }

    SECTION("Non-finite values are rejected")
    {
        REQUIRE_THROWS_AS(SampleSet("x", MetricUnit::DurationMs,
                                    {1.0, std::numeric_limits<double>::quiet_NaN()}),
                          InvalidParameterException);
        REQUIRE_THROWS_AS(SampleSet("x", MetricUnit::DurationMs,
                                    {std::numeric_limits<double>::infinity()}),
                          InvalidParameterException);
    }

    SECTION("Out-of-range sample index throws")
    {
        SampleSet s("x", MetricUnit::DurationMs, {1.0, 2.0});
        REQUIRE_THROWS_AS(s.getSample(2), InvalidParameterException);
    }
}

TEST_CASE("SampleSet::withoutWarmup", "[SampleSet][warmup]")
{
    SampleSet s("warm", MetricUnit::DurationMs, {9.0, 8.0, 1.0, 2.0, 3.0});

    SECTION("Zero warmup returns an equal set")
    {
        auto t = s.withoutWarmup(0);
        REQUIRE(t.getValues() == s.getValues());
    }

    SECTION("Leading samples are dropped and ordinals preserved")
    {
        auto t = s.withoutWarmup(2);
        REQUIRE(t.size() == 3);
        REQUIRE(t.getValues() == std::vector<double>{1.0, 2.0, 3.0});
        REQUIRE(t.getSample(0).getIndex() == 2);
        REQUIRE(t.getSample(2).getIndex() == 4);
        REQUIRE(t.getBenchmarkId() == "warm");
        REQUIRE(s.size() == 5);
    }

    SECTION("Chained trimming keeps absolute ordinals")
    {
        auto t = s.withoutWarmup(1).withoutWarmup(1);
        REQUIRE(t.getSample(0).getIndex() == 2);
    }

    SECTION("Dropping every sample fails")
    {
        REQUIRE_THROWS_AS(s.withoutWarmup(5), InsufficientSamplesException);
        REQUIRE_THROWS_AS(s.withoutWarmup(10), InsufficientSamplesException);
    }
}

TEST_CASE("Metric unit string conversion", "[SampleSet][unit]")
{
    REQUIRE(benchstat::analysis::toString(MetricUnit::DurationMs) == "duration-ms");
    REQUIRE(benchstat::analysis::toString(MetricUnit::RatePerSec) == "rate-per-sec");
    REQUIRE(benchstat::analysis::metricUnitFromString("duration-ms") == MetricUnit::DurationMs);
    REQUIRE(benchstat::analysis::metricUnitFromString("rate-per-sec") == MetricUnit::RatePerSec);
    REQUIRE_THROWS_AS(benchstat::analysis::metricUnitFromString("ns"), InvalidParameterException);
}

TEST_CASE("SummaryStatistics from samples", "[SummaryStatistics]")
{
    SECTION("Mean and n-1 standard deviation")
    {
        SampleSet s("x", MetricUnit::DurationMs, {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
        auto stats = SummaryStatistics::fromSamples(s);
        REQUIRE(stats.getSampleSize() == 8);
        REQUIRE(stats.getMean() == Approx(5.0));
        REQUIRE(stats.getStddev() == Approx(std::sqrt(32.0 / 7.0)));
        REQUIRE(stats.hasStddev());
        REQUIRE(stats.getStandardError() == Approx(std::sqrt(32.0 / 7.0) / std::sqrt(8.0)));
        REQUIRE(stats.getRelativeStddev() == Approx(std::sqrt(32.0 / 7.0) / 5.0));
    }

    SECTION("Single sample has an undefined standard deviation, never zero")
    {
        SampleSet s("x", MetricUnit::DurationMs, {1.5});
        auto stats = SummaryStatistics::fromSamples(s);
        REQUIRE(stats.getSampleSize() == 1);
        REQUIRE(stats.getMean() == 1.5);
        REQUIRE_FALSE(stats.hasStddev());
        REQUIRE(std::isnan(stats.getStddev()));
        REQUIRE(std::isnan(stats.getStandardError()));
    }

    SECTION("Constant data has zero standard deviation")
    {
        auto stats = SummaryStatistics::fromValues({0.8, 0.8, 0.8});
        REQUIRE(stats.getStddev() == 0.0);
    }

    SECTION("Large offset does not lose precision")
    {
        auto stats = SummaryStatistics::fromValues({1e9 + 1.0, 1e9 + 2.0, 1e9 + 3.0});
        REQUIRE(stats.getMean() == Approx(1e9 + 2.0));
        REQUIRE(stats.getStddev() == Approx(1.0).epsilon(1e-6));
    }

    SECTION("Empty values are rejected")
    {
        REQUIRE_THROWS_AS(SummaryStatistics::fromValues({}), InsufficientSamplesException);
    }
}

TEST_CASE("SummaryStatistics from stored moments", "[SummaryStatistics]")
{
    auto stats = SummaryStatistics::fromMoments(0.80, 0.03, 1000);
    REQUIRE(stats.getMean() == 0.80);
    REQUIRE(stats.getStddev() == 0.03);
    REQUIRE(stats.getSampleSize() == 1000);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_NOTHROW(SummaryStatistics::fromMoments(1.0, nan, 1));
    REQUIRE_THROWS_AS(SummaryStatistics::fromMoments(1.0, 0.0, 1), InvalidParameterException);
    REQUIRE_THROWS_AS(SummaryStatistics::fromMoments(1.0, nan, 5), InvalidParameterException);
    REQUIRE_THROWS_AS(SummaryStatistics::fromMoments(1.0, -0.1, 5), InvalidParameterException);
    REQUIRE_THROWS_AS(SummaryStatistics::fromMoments(nan, 0.1, 5), InvalidParameterException);
    REQUIRE_THROWS_AS(SummaryStatistics::fromMoments(1.0, 0.1, 0), InsufficientSamplesException);
}

TEST_CASE("ConfidenceInterval invariants", "[ConfidenceInterval]")
{
    SECTION("Accessors")
    {
        ConfidenceInterval ci(0.9, 1.0, 1.2, 0.95);
        REQUIRE(ci.getLower() == 0.9);
        REQUIRE(ci.getPointEstimate() == 1.0);
        REQUIRE(ci.getUpper() == 1.2);
        REQUIRE(ci.getLevel() == 0.95);
        REQUIRE(ci.getWidth() == Approx(0.3));
        REQUIRE(ci.contains(0.9));
        REQUIRE(ci.contains(1.2));
        REQUIRE_FALSE(ci.contains(1.21));
    }

    SECTION("Degenerate interval is allowed")
    {
        REQUIRE_NOTHROW(ConfidenceInterval(1.0, 1.0, 1.0, 0.95));
    }

    SECTION("Point estimate outside the bounds is rejected")
    {
        REQUIRE_THROWS_AS(ConfidenceInterval(1.0, 0.9, 1.2, 0.95), InvalidParameterException);
        REQUIRE_THROWS_AS(ConfidenceInterval(1.3, 1.4, 1.2, 0.95), InvalidParameterException);
    }

    SECTION("Level must be strictly inside (0,1)")
    {
        REQUIRE_THROWS_AS(ConfidenceInterval(0.9, 1.0, 1.1, 0.0), InvalidParameterException);
        REQUIRE_THROWS_AS(ConfidenceInterval(0.9, 1.0, 1.1, 1.0), InvalidParameterException);
    }

    SECTION("Overlap treats touching endpoints as overlapping")
    {
        ConfidenceInterval a(0.0, 0.5, 1.0, 0.95);
        ConfidenceInterval b(1.0, 1.5, 2.0, 0.95);
        ConfidenceInterval c(1.01, 1.5, 2.0, 0.95);
        REQUIRE(a.overlaps(b));
        REQUIRE(b.overlaps(a));
        REQUIRE_FALSE(a.overlaps(c));
        REQUIRE_FALSE(c.overlaps(a));
    }
}

TEST_CASE("Exception messages carry operation and benchmark", "[BenchStatException]")
{
    InvalidParameterException e("SampleSizePlanner::plan", "", "power", "must be in (0,1)");
    REQUIRE(std::string(e.what()) == "SampleSizePlanner::plan: power: must be in (0,1)");
    REQUIRE(e.getParameterName() == "power");

    InsufficientSamplesException i("BootstrapEstimator::estimate", "json_parse", 2, 1);
    REQUIRE(std::string(i.what()) ==
            "BootstrapEstimator::estimate [json_parse]: need at least 2 samples, got 1");

    const BenchStatException& base = i;
    REQUIRE(base.getOperation() == "BootstrapEstimator::estimate");
    REQUIRE(base.getBenchmarkId() == "json_parse");
}
