#include "RegressionAnalyzer.h"

#include <cmath>

#include "BenchStatException.h"

namespace benchstat
{
namespace analysis
{

RegressionAnalyzer::RegressionAnalyzer(const AnalysisConfiguration& config,
                                       regression::IBaselineStore& store,
                                       diagnostics::IEstimationObserver& observer,
                                       std::ostream& log)
    : mConfig(config),
      mStore(store),
      mObserver(observer),
      mLog(log),
      mPlanner(config.getSafetyMultiplier()),
      mEstimator(config.getConfidence(), config.getResamples(), config.getShardSize()),
      mDetector(config.getPolicy())
{
}

SampleSet RegressionAnalyzer::trimWarmup(const SampleSet& samples) const
{
    const std::size_t warmup = mConfig.getWarmupIterations();
    if (warmup > 0)
    {
        mLog << "Discarding " << warmup << " warmup sample(s) of "
             << samples.getBenchmarkId() << std::endl;
    }
    return samples.withoutWarmup(warmup);
}

void RegressionAnalyzer::notifyObserver(const SampleSet& samples,
                                        const BootstrapEstimate& estimate) const
{
    mObserver.onEstimate(diagnostics::EstimationDiagnosticRecord(
        samples.getBenchmarkId(),
        toString(samples.getUnit()),
        estimate.statistics.getSampleSize(),
        estimate.resamples,
        estimate.shards,
        estimate.seed,
        estimate.interval.getLevel(),
        estimate.statistics.getMean(),
        estimate.statistics.getStddev(),
        estimate.interval.getLower(),
        estimate.interval.getUpper(),
        estimate.bootstrapStandardError,
        estimate.replicateMin,
        estimate.replicateMax));
}

reporting::RegressionReport
RegressionAnalyzer::analyse(const SampleSet& samples,
                            const regression::ReproducibilityContext& context,
                            const std::optional<std::string>& baselineDateTag) const
{
    const std::string& id = samples.getBenchmarkId();
    const SampleSet trimmed = trimWarmup(samples);

    mLog << "Bootstrapping " << id << ": n = " << trimmed.size()
         << ", B = " << mConfig.getResamples() << ", seed = " << context.getSeed() << std::endl;
    const BootstrapEstimate estimate = mEstimator.estimate(trimmed, context.getSeed());
    notifyObserver(trimmed, estimate);

    const double relativeStddev = estimate.statistics.getRelativeStddev();
    if (!std::isfinite(relativeStddev))
    {
        throw InvalidParameterException("RegressionAnalyzer::analyse", id, "samples",
                                        "relative standard deviation is undefined for a zero mean");
    }

    const PlannedSampleSize plan = mPlanner.plan(mConfig.getEffectSizeTarget(), relativeStddev,
                                                 mConfig.getPower(), mConfig.getAlpha());
    const std::size_t plannedMinimum = mConfig.getSampleSizeOverride().value_or(plan.minimum_n);

    mLog << "Sample size plan for " << id << ": minimum " << plan.minimum_n
         << ", recommended " << plan.recommended_n;
    if (mConfig.getSampleSizeOverride())
        mLog << ", override " << plannedMinimum;
    mLog << std::endl;
    if (trimmed.size() < plan.recommended_n)
    {
        mLog << "Warning: " << id << " has " << trimmed.size()
             << " samples, fewer than the recommended " << plan.recommended_n << std::endl;
    }
    mLog << "Achieved power for n = " << trimmed.size() << ": "
         << SampleSizePlanner::achievedPower(trimmed.size(), plan.effect_size_target,
                                             plan.relative_stddev, plan.alpha)
         << ", minimum detectable effect "
         << SampleSizePlanner::minimumDetectableEffect(trimmed.size(), plan.relative_stddev,
                                                       plan.power, plan.alpha) * 100.0
         << "%" << std::endl;

    std::optional<regression::BaselineRecord> baseline =
        baselineDateTag ? mStore.load(id, *baselineDateTag) : mStore.load(id);

    if (baselineDateTag && !baseline)
    {
        throw StoreException("RegressionAnalyzer::analyse", id,
                             "no baseline dated " + *baselineDateTag);
    }

    std::optional<regression::RegressionVerdict> verdict;
    if (baseline)
    {
        if (baseline->getUnit() != trimmed.getUnit())
        {
            throw InvalidParameterException("RegressionAnalyzer::analyse", id, "unit",
                                            "run is " + toString(trimmed.getUnit()) +
                                            " but baseline is " + toString(baseline->getUnit()));
        }

        verdict = mDetector.detect(estimate.statistics, estimate.interval, *baseline);
        mLog << "Compared " << id << " with baseline " << baseline->getDateTag() << ": "
             << regression::toString(verdict->getClassification()) << std::endl;
    }
    else
    {
        mLog << "No baseline stored for " << id << std::endl;
    }

    return reporting::RegressionReport(id, trimmed.getUnit(), estimate, plan, plannedMinimum,
                                       samples.size() - trimmed.size(), context,
                                       std::move(baseline), std::move(verdict));
}

regression::BaselineRecord RegressionAnalyzer::promote(const reporting::RegressionReport& report)
{
    if (report.getVerdict() &&
        report.getVerdict()->getClassification() == regression::RegressionClassification::Regressed)
    {
        mLog << "Warning: promoting a run classified as Regressed for "
             << report.getBenchmarkId() << std::endl;
    }

    regression::BaselineRecord record(report.getBenchmarkId(),
                                      report.getUnit(),
                                      report.getStatistics(),
                                      report.getInterval(),
                                      report.getEstimate().resamples,
                                      report.getPlannedMinimumSamples(),
                                      report.getContext());
    mStore.save(record);

    mLog << "Promoted " << record.getBenchmarkId() << " to baseline "
         << record.getDateTag() << std::endl;
    return record;
}

ReproducibilityCheck RegressionAnalyzer::verifyReproducible(const SampleSet& samples,
                                                            uint64_t seed,
                                                            std::size_t runs) const
{
    if (runs < 2)
    {
        throw InvalidParameterException("RegressionAnalyzer::verifyReproducible",
                                        samples.getBenchmarkId(), "runs", "must be >= 2");
    }

    const SampleSet trimmed = samples.withoutWarmup(mConfig.getWarmupIterations());
    ReproducibilityCheck check{runs, true, {}};
    check.bounds.reserve(runs);

    for (std::size_t r = 0; r < runs; ++r)
    {
        const BootstrapEstimate estimate = mEstimator.estimate(trimmed, seed);
        check.bounds.emplace_back(estimate.interval.getLower(), estimate.interval.getUpper());
        if (check.bounds.back() != check.bounds.front())
            check.identical = false;
    }

    mLog << "Reproducibility check for " << samples.getBenchmarkId() << ": " << runs
         << " run(s), " << (check.identical ? "bit-identical" : "MISMATCH") << std::endl;
    return check;
}

} // namespace analysis
} // namespace benchstat
