#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include "BenchStatException.h"
#include "BenchmarkSamples.h"

namespace benchstat
{
  namespace analysis
  {
    /**
     * @brief Mean, sample standard deviation (n-1 denominator) and size.
     *
     * Instances are derived from data via fromSamples()/fromValues(), or
     * restored from persisted moments via fromMoments(). The standard
     * deviation is NaN when n < 2; callers must test hasStddev() rather than
     * relying on a zero default.
     */
    class SummaryStatistics
    {
    public:
      static SummaryStatistics fromSamples(const SampleSet& samples)
      {
        return fromValues(samples.getValues(), samples.getBenchmarkId());
      }

      /**
       * @brief One-pass Welford mean and unbiased variance.
       */
      static SummaryStatistics fromValues(const std::vector<double>& values,
                                          const std::string& benchmarkId = "")
      {
        if (values.empty())
          throw InsufficientSamplesException("SummaryStatistics::fromValues", benchmarkId, 1, 0);

        long double mean = 0.0L;
        long double m2 = 0.0L;
        std::size_t k = 0;
        for (double v : values)
          {
            ++k;
            const long double x = static_cast<long double>(v);
            const long double delta = x - mean;
            mean += delta / static_cast<long double>(k);
            m2 += delta * (x - mean);
          }

        const double stddev = (k > 1)
          ? static_cast<double>(std::sqrt(m2 / static_cast<long double>(k - 1)))
          : std::numeric_limits<double>::quiet_NaN();

        return SummaryStatistics(static_cast<double>(mean), stddev, k);
      }

      /**
       * @brief Rebuild statistics from stored moments (e.g. a baseline record).
       *
       * @p stddev must be NaN when @p n < 2 and finite and non-negative
       * otherwise.
       */
      static SummaryStatistics fromMoments(double mean, double stddev, std::size_t n)
      {
        const char* op = "SummaryStatistics::fromMoments";
        if (n < 1)
          throw InsufficientSamplesException(op, "", 1, n);
        if (!std::isfinite(mean))
          throw InvalidParameterException(op, "", "mean", "must be finite");
        if (n < 2)
          {
            if (!std::isnan(stddev))
              throw InvalidParameterException(op, "", "stddev", "must be undefined (NaN) when n < 2");
          }
        else if (!std::isfinite(stddev) || stddev < 0.0)
          {
            throw InvalidParameterException(op, "", "stddev", "must be finite and non-negative");
          }

        return SummaryStatistics(mean, stddev, n);
      }

      double getMean() const noexcept { return m_mean; }
      double getStddev() const noexcept { return m_stddev; }
      std::size_t getSampleSize() const noexcept { return m_n; }
      bool hasStddev() const noexcept { return m_n >= 2; }

      double getVariance() const noexcept
      {
        return m_stddev * m_stddev;
      }

      /// stddev / sqrt(n); NaN when the standard deviation is undefined.
      double getStandardError() const noexcept
      {
        return m_stddev / std::sqrt(static_cast<double>(m_n));
      }

      /// Coefficient of variation (stddev / |mean|); NaN for a zero mean.
      double getRelativeStddev() const noexcept
      {
        if (m_mean == 0.0)
          return std::numeric_limits<double>::quiet_NaN();
        return m_stddev / std::fabs(m_mean);
      }

    private:
      SummaryStatistics(double mean, double stddev, std::size_t n)
        : m_mean(mean), m_stddev(stddev), m_n(n)
      {}

      double      m_mean;
      double      m_stddev;
      std::size_t m_n;
    };
  } // namespace analysis
} // namespace benchstat
