#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

#include "BenchStatException.h"
#include "NormalQuantile.h"

namespace benchstat
{
  namespace analysis
  {
    struct PlannedSampleSize
    {
      std::size_t minimum_n;          // ceil of the power formula, floor of kMinimumN
      std::size_t recommended_n;      // minimum_n scaled by the safety multiplier
      double      effect_size_target; // relative change to detect (delta)
      double      relative_stddev;    // relative noise (sigma)
      double      power;
      double      alpha;
      double      z_alpha;            // z_{1 - alpha/2}
      double      z_power;            // z_{power}
      double      safety_multiplier;
    };

    /**
     * @brief Normal-approximation sample-size planning for a two-sample mean comparison.
     *
     *   n = 2 * (z_{1-alpha/2} + z_{power})^2 * (sigma / delta)^2
     *
     * where delta is the relative effect to detect and sigma the relative
     * standard deviation of a single measurement. minimum_n is the formula
     * rounded up (never below 2, the smallest n with a defined standard
     * deviation); recommended_n multiplies minimum_n by the safety multiplier
     * and rounds up again.
     *
     * Pure and deterministic: the same inputs always yield the same plan.
     */
    class SampleSizePlanner
    {
    public:
      static constexpr double      kDefaultSafetyMultiplier = 1.5;
      static constexpr double      kDefaultPower = 0.80;
      static constexpr double      kDefaultAlpha = 0.05;
      static constexpr std::size_t kMinimumN = 2;

      explicit SampleSizePlanner(double safetyMultiplier = kDefaultSafetyMultiplier)
        : m_safetyMultiplier(safetyMultiplier)
      {
        if (!std::isfinite(safetyMultiplier) || safetyMultiplier < 1.0)
          throw InvalidParameterException("SampleSizePlanner", "", "safety_multiplier",
                                          "must be finite and >= 1");
      }

      double getSafetyMultiplier() const noexcept
      {
        return m_safetyMultiplier;
      }

      PlannedSampleSize plan(double effectSizeTarget,
                             double relativeStddev,
                             double power = kDefaultPower,
                             double alpha = kDefaultAlpha) const
      {
        validateEffect("SampleSizePlanner::plan", effectSizeTarget);
        validateStddev("SampleSizePlanner::plan", relativeStddev);
        validateProbability("SampleSizePlanner::plan", "power", power);
        validateProbability("SampleSizePlanner::plan", "alpha", alpha);

        const double zAlpha = detail::compute_two_sided_critical_value(alpha);
        const double zPower = detail::compute_normal_quantile(power);
        const double zSum = zAlpha + zPower;

        // A non-positive z sum means any sample meets the power target.
        double raw = 0.0;
        if (zSum > 0.0)
          {
            const double ratio = relativeStddev / effectSizeTarget;
            raw = 2.0 * zSum * zSum * ratio * ratio;
          }

        const std::size_t minimumN = std::max(kMinimumN, toSampleCount(raw));
        const std::size_t recommendedN =
          std::max(minimumN, toSampleCount(static_cast<double>(minimumN) * m_safetyMultiplier));

        return PlannedSampleSize{
          minimumN,
          recommendedN,
          effectSizeTarget,
          relativeStddev,
          power,
          alpha,
          zAlpha,
          zPower,
          m_safetyMultiplier
        };
      }

      /**
       * @brief Power reached by @p n samples per group for the given effect.
       *
       * Inverse of plan(): Phi(sqrt(n/2) * delta / sigma - z_{1-alpha/2}).
       * Noise-free measurements (sigma == 0) have power 1.
       */
      static double achievedPower(std::size_t n,
                                  double effectSizeTarget,
                                  double relativeStddev,
                                  double alpha = kDefaultAlpha)
      {
        validateN("SampleSizePlanner::achievedPower", n);
        validateEffect("SampleSizePlanner::achievedPower", effectSizeTarget);
        validateStddev("SampleSizePlanner::achievedPower", relativeStddev);
        validateProbability("SampleSizePlanner::achievedPower", "alpha", alpha);

        if (relativeStddev == 0.0)
          return 1.0;

        const double zAlpha = detail::compute_two_sided_critical_value(alpha);
        const double noncentrality =
          std::sqrt(static_cast<double>(n) / 2.0) * effectSizeTarget / relativeStddev;
        return detail::compute_normal_cdf(noncentrality - zAlpha);
      }

      /**
       * @brief Smallest relative effect detectable with @p n samples per group.
       *
       * (z_{1-alpha/2} + z_{power}) * sigma * sqrt(2 / n)
       */
      static double minimumDetectableEffect(std::size_t n,
                                            double relativeStddev,
                                            double power = kDefaultPower,
                                            double alpha = kDefaultAlpha)
      {
        validateN("SampleSizePlanner::minimumDetectableEffect", n);
        validateStddev("SampleSizePlanner::minimumDetectableEffect", relativeStddev);
        validateProbability("SampleSizePlanner::minimumDetectableEffect", "power", power);
        validateProbability("SampleSizePlanner::minimumDetectableEffect", "alpha", alpha);

        const double zSum = detail::compute_two_sided_critical_value(alpha) +
                            detail::compute_normal_quantile(power);
        return std::max(0.0, zSum) * relativeStddev * std::sqrt(2.0 / static_cast<double>(n));
      }

    private:
      // Rounds up, tolerating representation error just above an integer
      // (e.g. 4.0000000001). Counts that do not fit a size_t are rejected.
      static std::size_t toSampleCount(double x)
      {
        constexpr double kTolerance = 1e-9;
        if (x <= 0.0)
          return 0;

        // 2^64 as a double; every double below it converts exactly.
        constexpr double kLimit = static_cast<double>(std::numeric_limits<std::size_t>::max());
        const double rounded = std::ceil(x - kTolerance);
        if (!(rounded < kLimit))
          throw InvalidParameterException("SampleSizePlanner::plan", "", "effect_size_target",
                                          "required sample size not representable");
        return static_cast<std::size_t>(rounded);
      }

      static void validateEffect(const char* op, double effect)
      {
        if (!std::isfinite(effect) || effect <= 0.0)
          throw InvalidParameterException(op, "", "effect_size_target", "must be finite and > 0");
      }

      static void validateStddev(const char* op, double stddev)
      {
        if (!std::isfinite(stddev) || stddev < 0.0)
          throw InvalidParameterException(op, "", "relative_stddev", "must be finite and >= 0");
      }

      static void validateProbability(const char* op, const char* name, double p)
      {
        if (!(p > 0.0 && p < 1.0))
          throw InvalidParameterException(op, "", name, "must be in (0,1)");
      }

      static void validateN(const char* op, std::size_t n)
      {
        if (n < kMinimumN)
          throw InsufficientSamplesException(op, "", kMinimumN, n);
      }

      double m_safetyMultiplier;
    };
  } // namespace analysis
} // namespace benchstat
