#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "AnalysisConfiguration.h"
#include "BaselineRecord.h"
#include "BenchmarkSamples.h"
#include "BootstrapEstimator.h"
#include "IBaselineStore.h"
#include "IEstimationObserver.h"
#include "ParallelExecutors.h"
#include "RegressionDetector.h"
#include "RegressionReport.h"
#include "ReproducibilityContext.h"
#include "SampleSizePlanner.h"

namespace benchstat
{
namespace analysis
{

/**
 * @brief Outcome of re-running one bootstrap estimate several times.
 */
struct ReproducibilityCheck
{
    std::size_t runs;
    bool identical;                                  // every run gave bit-identical bounds
    std::vector<std::pair<double, double>> bounds;   // (lower, upper) per run
};

/**
 * @brief Runs the full analysis for one benchmark.
 *
 * analyse(): drop warmup, bootstrap the mean, plan the sample size from the
 * observed noise, load the baseline (latest or dated) and classify the run.
 * promote() turns a report into a new baseline record. Progress is written
 * to the log stream; every estimate is also handed to the observer.
 */
class RegressionAnalyzer
{
public:
    RegressionAnalyzer(const AnalysisConfiguration& config,
                       regression::IBaselineStore& store,
                       diagnostics::IEstimationObserver& observer,
                       std::ostream& log);

    /**
     * @param context provenance of this run; its seed drives the bootstrap
     * @param baselineDateTag compare against this historical record instead
     *        of the latest one
     * @throws InsufficientSamplesException if fewer than two samples remain
     *         after warmup
     * @throws StoreException if the store fails or the dated baseline is
     *         missing
     */
    reporting::RegressionReport analyse(const SampleSet& samples,
                                        const regression::ReproducibilityContext& context,
                                        const std::optional<std::string>& baselineDateTag = std::nullopt) const;

    /// Persist the run described by @p report as the benchmark's new baseline.
    regression::BaselineRecord promote(const reporting::RegressionReport& report);

    /**
     * @brief Repeat the estimate @p runs times with the same seed.
     * @throws InvalidParameterException if runs < 2
     */
    ReproducibilityCheck verifyReproducible(const SampleSet& samples,
                                            uint64_t seed,
                                            std::size_t runs = kDefaultVerificationRuns) const;

    const AnalysisConfiguration& getConfiguration() const { return mConfig; }

    static constexpr std::size_t kDefaultVerificationRuns = 3;

private:
    using Estimator = BootstrapEstimator<concurrency::ThreadPoolExecutor<>>;

    SampleSet trimWarmup(const SampleSet& samples) const;
    void notifyObserver(const SampleSet& samples, const BootstrapEstimate& estimate) const;

    AnalysisConfiguration mConfig;
    regression::IBaselineStore& mStore;
    diagnostics::IEstimationObserver& mObserver;
    std::ostream& mLog;
    SampleSizePlanner mPlanner;
    Estimator mEstimator;
    regression::RegressionDetector mDetector;
};

} // namespace analysis
} // namespace benchstat
