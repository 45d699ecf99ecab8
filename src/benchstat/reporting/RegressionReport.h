#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "BaselineRecord.h"
#include "BootstrapEstimator.h"
#include "RegressionDetector.h"
#include "ReproducibilityContext.h"
#include "SampleSizePlanner.h"

namespace benchstat
{
namespace reporting
{

/**
 * @brief Everything one analysis run produced, ready for rendering.
 *
 * The baseline and verdict are absent when no baseline existed for the
 * benchmark yet; such a report describes a baseline candidate.
 */
class RegressionReport
{
public:
    RegressionReport(std::string benchmarkId,
                     analysis::MetricUnit unit,
                     analysis::BootstrapEstimate estimate,
                     analysis::PlannedSampleSize plan,
                     std::size_t plannedMinimumSamples,
                     std::size_t warmupDiscarded,
                     regression::ReproducibilityContext context,
                     std::optional<regression::BaselineRecord> baseline,
                     std::optional<regression::RegressionVerdict> verdict);

    const std::string& getBenchmarkId() const { return mBenchmarkId; }
    analysis::MetricUnit getUnit() const { return mUnit; }
    const analysis::BootstrapEstimate& getEstimate() const { return mEstimate; }
    const analysis::SummaryStatistics& getStatistics() const { return mEstimate.statistics; }
    const analysis::ConfidenceInterval& getInterval() const { return mEstimate.interval; }
    const analysis::PlannedSampleSize& getPlan() const { return mPlan; }

    /// Planner minimum, or the explicit sample-size override when one was given.
    std::size_t getPlannedMinimumSamples() const { return mPlannedMinimumSamples; }

    /**
     * @brief Power the analysed sample count reaches for the planned effect target.
     *
     * Checks the collected n after the fact; empty below two samples.
     */
    std::optional<double> getAchievedPower() const;

    /// Smallest relative change the analysed sample count detects at the planned power.
    std::optional<double> getMinimumDetectableEffect() const;

    std::size_t getWarmupDiscarded() const { return mWarmupDiscarded; }
    const regression::ReproducibilityContext& getContext() const { return mContext; }
    const std::optional<regression::BaselineRecord>& getBaseline() const { return mBaseline; }
    const std::optional<regression::RegressionVerdict>& getVerdict() const { return mVerdict; }
    bool hasBaseline() const { return mBaseline.has_value(); }

    /**
     * @brief Items of the required-metrics checklist this report lacks.
     *
     * Checklist: n, mean +/- stddev, confidence interval, effect size (only
     * when a baseline was compared), environment, seed (the estimate must
     * have used the context's seed), commit hash. An empty result means the
     * report may be published.
     */
    std::vector<std::string> missingRequiredMetrics() const;

    bool isComplete() const { return missingRequiredMetrics().empty(); }

private:
    std::string mBenchmarkId;
    analysis::MetricUnit mUnit;
    analysis::BootstrapEstimate mEstimate;
    analysis::PlannedSampleSize mPlan;
    std::size_t mPlannedMinimumSamples;
    std::size_t mWarmupDiscarded;
    regression::ReproducibilityContext mContext;
    std::optional<regression::BaselineRecord> mBaseline;
    std::optional<regression::RegressionVerdict> mVerdict;
};

} // namespace reporting
} // namespace benchstat
