#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "BenchStatException.h"
#include "BootstrapEstimator.h"
#include "RegressionDetector.h"
#include "SampleSizePlanner.h"

namespace benchstat
{
  /**
   * @brief Every tunable of one analysis run, passed explicitly.
   *
   * Nothing in the analysis reads the process environment; the CLI (or a
   * test) builds one of these and hands it down.
   */
  class AnalysisConfiguration
  {
  public:
    static constexpr uint64_t kDefaultSeed = 42;
    static constexpr double   kDefaultEffectSizeTarget = 0.05;

    AnalysisConfiguration()
      : AnalysisConfiguration(analysis::BootstrapEstimator<>::kDefaultConfidence,
                              analysis::BootstrapEstimator<>::kDefaultResamples,
                              analysis::BootstrapEstimator<>::kDefaultShardSize,
                              kDefaultSeed,
                              std::nullopt,
                              0,
                              kDefaultEffectSizeTarget,
                              analysis::SampleSizePlanner::kDefaultPower,
                              analysis::SampleSizePlanner::kDefaultAlpha,
                              analysis::SampleSizePlanner::kDefaultSafetyMultiplier,
                              regression::RegressionPolicy())
    {}

    /**
     * @param sampleSizeOverride when set, replaces the planned minimum sample
     *        count recorded for the run and checked against a baseline
     * @param warmupIterations leading samples discarded before analysis
     * @param effectSizeTarget relative change the plan must be able to detect
     */
    AnalysisConfiguration(double confidence,
                          std::size_t resamples,
                          std::size_t shardSize,
                          uint64_t seed,
                          std::optional<std::size_t> sampleSizeOverride,
                          std::size_t warmupIterations,
                          double effectSizeTarget,
                          double power,
                          double alpha,
                          double safetyMultiplier,
                          regression::RegressionPolicy policy)
      : m_confidence(confidence),
        m_resamples(resamples),
        m_shardSize(shardSize),
        m_seed(seed),
        m_sampleSizeOverride(sampleSizeOverride),
        m_warmupIterations(warmupIterations),
        m_effectSizeTarget(effectSizeTarget),
        m_power(power),
        m_alpha(alpha),
        m_safetyMultiplier(safetyMultiplier),
        m_policy(policy)
    {
      const char* op = "AnalysisConfiguration";
      if (!(confidence > 0.0 && confidence < 1.0))
        throw InvalidParameterException(op, "", "confidence", "must be in (0,1)");
      if (resamples < analysis::BootstrapEstimator<>::kMinResamples)
        throw InvalidParameterException(op, "", "resamples",
                                        "must be >= " +
                                        std::to_string(analysis::BootstrapEstimator<>::kMinResamples));
      if (shardSize == 0)
        throw InvalidParameterException(op, "", "shard_size", "must be > 0");
      if (sampleSizeOverride && *sampleSizeOverride < analysis::SampleSizePlanner::kMinimumN)
        throw InvalidParameterException(op, "", "sample_size", "override must be >= 2");
      if (!std::isfinite(effectSizeTarget) || effectSizeTarget <= 0.0)
        throw InvalidParameterException(op, "", "effect_size_target", "must be finite and > 0");
      if (!(power > 0.0 && power < 1.0))
        throw InvalidParameterException(op, "", "power", "must be in (0,1)");
      if (!(alpha > 0.0 && alpha < 1.0))
        throw InvalidParameterException(op, "", "alpha", "must be in (0,1)");
      if (!std::isfinite(safetyMultiplier) || safetyMultiplier < 1.0)
        throw InvalidParameterException(op, "", "safety_multiplier", "must be finite and >= 1");
    }

    double getConfidence() const { return m_confidence; }
    std::size_t getResamples() const { return m_resamples; }
    std::size_t getShardSize() const { return m_shardSize; }
    uint64_t getSeed() const { return m_seed; }
    const std::optional<std::size_t>& getSampleSizeOverride() const { return m_sampleSizeOverride; }
    std::size_t getWarmupIterations() const { return m_warmupIterations; }
    double getEffectSizeTarget() const { return m_effectSizeTarget; }
    double getPower() const { return m_power; }
    double getAlpha() const { return m_alpha; }
    double getSafetyMultiplier() const { return m_safetyMultiplier; }
    const regression::RegressionPolicy& getPolicy() const { return m_policy; }

  private:
    double                       m_confidence;
    std::size_t                  m_resamples;
    std::size_t                  m_shardSize;
    uint64_t                     m_seed;
    std::optional<std::size_t>   m_sampleSizeOverride;
    std::size_t                  m_warmupIterations;
    double                       m_effectSizeTarget;
    double                       m_power;
    double                       m_alpha;
    double                       m_safetyMultiplier;
    regression::RegressionPolicy m_policy;
  };
} // namespace benchstat
