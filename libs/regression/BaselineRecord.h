#pragma once

#include <cstddef>
#include <string>

#include "BenchStatException.h"
#include "BenchmarkSamples.h"
#include "ConfidenceInterval.h"
#include "ReproducibilityContext.h"
#include "SummaryStatistics.h"
#include "TimestampFormat.h"

namespace benchstat
{
  namespace regression
  {
    using analysis::ConfidenceInterval;
    using analysis::MetricUnit;
    using analysis::SummaryStatistics;

    /**
     * @brief Immutable snapshot of a run promoted to baseline.
     *
     * Records are keyed by (benchmark id, date tag) where the date tag is
     * derived from the context timestamp. A later promotion supersedes a
     * record; nothing ever mutates one.
     */
    class BaselineRecord
    {
    public:
      BaselineRecord(std::string benchmarkId,
                     MetricUnit unit,
                     SummaryStatistics statistics,
                     ConfidenceInterval interval,
                     std::size_t bootstrapResamples,
                     std::size_t plannedMinimumSamples,
                     ReproducibilityContext context)
        : m_benchmarkId(std::move(benchmarkId)),
          m_unit(unit),
          m_statistics(statistics),
          m_interval(interval),
          m_bootstrapResamples(bootstrapResamples),
          m_plannedMinimumSamples(plannedMinimumSamples),
          m_context(std::move(context))
      {
        if (m_benchmarkId.empty())
          throw InvalidParameterException("BaselineRecord", "", "benchmarkId", "must not be empty");
      }

      const std::string& getBenchmarkId() const noexcept { return m_benchmarkId; }
      MetricUnit getUnit() const noexcept { return m_unit; }
      const SummaryStatistics& getStatistics() const noexcept { return m_statistics; }
      const ConfidenceInterval& getInterval() const noexcept { return m_interval; }
      std::size_t getBootstrapResamples() const noexcept { return m_bootstrapResamples; }

      /// Smallest current-run size the detector accepts against this baseline.
      std::size_t getPlannedMinimumSamples() const noexcept { return m_plannedMinimumSamples; }

      const ReproducibilityContext& getContext() const noexcept { return m_context; }

      std::string getDateTag() const
      {
        return toDateTag(m_context.getTimestamp());
      }

    private:
      std::string            m_benchmarkId;
      MetricUnit             m_unit;
      SummaryStatistics      m_statistics;
      ConfidenceInterval     m_interval;
      std::size_t            m_bootstrapResamples;
      std::size_t            m_plannedMinimumSamples;
      ReproducibilityContext m_context;
    };
  } // namespace regression
} // namespace benchstat
