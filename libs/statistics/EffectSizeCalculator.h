#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>

#include "BenchStatException.h"
#include "SummaryStatistics.h"

namespace benchstat
{
  namespace analysis
  {
    enum class EffectSizeBucket
    {
      Negligible,
      Small,
      Medium,
      Large
    };

    inline std::string toString(EffectSizeBucket bucket)
    {
      switch (bucket)
        {
        case EffectSizeBucket::Negligible: return "Negligible";
        case EffectSizeBucket::Small:      return "Small";
        case EffectSizeBucket::Medium:     return "Medium";
        case EffectSizeBucket::Large:      return "Large";
        }
      return "Unknown";
    }

    struct EffectSize
    {
      double           cohens_d;
      EffectSizeBucket bucket;
    };

    /**
     * @brief Cohen's d between two summaries using the pooled standard deviation.
     *
     *   s_pooled = sqrt(((n_a - 1) s_a^2 + (n_b - 1) s_b^2) / (n_a + n_b - 2))
     *   d        = (mean_a - mean_b) / s_pooled
     *
     * A summary with n == 1 contributes nothing to the pooled variance.
     */
    class EffectSizeCalculator
    {
    public:
      static constexpr double kSmallThreshold  = 0.2;
      static constexpr double kMediumThreshold = 0.5;
      static constexpr double kLargeThreshold  = 0.8;

      static EffectSizeBucket classify(double d) noexcept
      {
        const double magnitude = std::fabs(d);
        if (magnitude < kSmallThreshold)
          return EffectSizeBucket::Negligible;
        if (magnitude < kMediumThreshold)
          return EffectSizeBucket::Small;
        if (magnitude < kLargeThreshold)
          return EffectSizeBucket::Medium;
        return EffectSizeBucket::Large;
      }

      /**
       * @throws InsufficientSamplesException when n_a + n_b <= 2
       * @throws DegenerateVarianceException when s_pooled == 0 and the means
       *         differ; the exception carries d = +/-inf (bucket Large)
       */
      static EffectSize compare(const SummaryStatistics& a,
                                const SummaryStatistics& b,
                                const std::string& benchmarkId = "")
      {
        const char* op = "EffectSizeCalculator::compare";
        const std::size_t na = a.getSampleSize();
        const std::size_t nb = b.getSampleSize();
        if (na + nb <= 2)
          throw InsufficientSamplesException(op, benchmarkId, 3, na + nb);

        const double pooled = pooledStddev(a, b);
        const double diff = a.getMean() - b.getMean();

        if (pooled == 0.0)
          {
            if (diff == 0.0)
              return EffectSize{0.0, EffectSizeBucket::Negligible};

            const double sentinel = diff > 0.0 ? std::numeric_limits<double>::infinity()
                                               : -std::numeric_limits<double>::infinity();
            throw DegenerateVarianceException(op, benchmarkId, sentinel);
          }

        const double d = diff / pooled;
        return EffectSize{d, classify(d)};
      }

      static double pooledStddev(const SummaryStatistics& a, const SummaryStatistics& b)
      {
        const std::size_t na = a.getSampleSize();
        const std::size_t nb = b.getSampleSize();
        const double ssa = a.hasStddev() ? static_cast<double>(na - 1) * a.getVariance() : 0.0;
        const double ssb = b.hasStddev() ? static_cast<double>(nb - 1) * b.getVariance() : 0.0;
        return std::sqrt((ssa + ssb) / static_cast<double>(na + nb - 2));
      }
    };
  } // namespace analysis
} // namespace benchstat
