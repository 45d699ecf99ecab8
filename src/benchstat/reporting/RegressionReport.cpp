#include "RegressionReport.h"
#include "BenchStatException.h"

namespace benchstat
{
namespace reporting
{

RegressionReport::RegressionReport(std::string benchmarkId,
                                   analysis::MetricUnit unit,
                                   analysis::BootstrapEstimate estimate,
                                   analysis::PlannedSampleSize plan,
                                   std::size_t plannedMinimumSamples,
                                   std::size_t warmupDiscarded,
                                   regression::ReproducibilityContext context,
                                   std::optional<regression::BaselineRecord> baseline,
                                   std::optional<regression::RegressionVerdict> verdict)
    : mBenchmarkId(std::move(benchmarkId)),
      mUnit(unit),
      mEstimate(std::move(estimate)),
      mPlan(plan),
      mPlannedMinimumSamples(plannedMinimumSamples),
      mWarmupDiscarded(warmupDiscarded),
      mContext(std::move(context)),
      mBaseline(std::move(baseline)),
      mVerdict(std::move(verdict))
{
    if (mBaseline && !mVerdict)
    {
        throw InvalidParameterException("RegressionReport", mBenchmarkId, "verdict",
                                        "a compared baseline requires a verdict");
    }
}

std::optional<double> RegressionReport::getAchievedPower() const
{
    const std::size_t n = getStatistics().getSampleSize();
    if (n < analysis::SampleSizePlanner::kMinimumN)
        return std::nullopt;
    return analysis::SampleSizePlanner::achievedPower(n, mPlan.effect_size_target,
                                                      mPlan.relative_stddev, mPlan.alpha);
}

std::optional<double> RegressionReport::getMinimumDetectableEffect() const
{
    const std::size_t n = getStatistics().getSampleSize();
    if (n < analysis::SampleSizePlanner::kMinimumN)
        return std::nullopt;
    return analysis::SampleSizePlanner::minimumDetectableEffect(n, mPlan.relative_stddev,
                                                                mPlan.power, mPlan.alpha);
}

std::vector<std::string> RegressionReport::missingRequiredMetrics() const
{
    std::vector<std::string> missing;
    const auto& stats = getStatistics();

    // n and the interval are guaranteed by construction.
    if (!stats.hasStddev())
        missing.push_back("mean+/-stddev");
    if (mBaseline && (!mVerdict || !mVerdict->getEffectSize()))
        missing.push_back("effect size");

    const auto& env = mContext.getEnvironment();
    if (env.getCompiler().empty() || env.getOsName().empty() || env.getMachine().empty())
        missing.push_back("environment");
    if (mEstimate.seed != mContext.getSeed())
        missing.push_back("seed");
    if (mContext.getCommitHash().empty())
        missing.push_back("commit hash");

    return missing;
}

} // namespace reporting
} // namespace benchstat
