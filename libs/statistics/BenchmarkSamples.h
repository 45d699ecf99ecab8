#pragma once

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "BenchStatException.h"

namespace benchstat
{
  namespace analysis
  {
    /// Unit tag attached by the harness to every measurement of a run.
    enum class MetricUnit
    {
      DurationMs,   // latency-type, smaller is better
      RatePerSec    // throughput-type, larger is better
    };

    enum class MetricDirection
    {
      LowerIsBetter,
      HigherIsBetter
    };

    inline MetricDirection directionOf(MetricUnit unit) noexcept
    {
      return unit == MetricUnit::DurationMs ? MetricDirection::LowerIsBetter
                                            : MetricDirection::HigherIsBetter;
    }

    inline std::string toString(MetricUnit unit)
    {
      return unit == MetricUnit::DurationMs ? "duration-ms" : "rate-per-sec";
    }

    inline MetricUnit metricUnitFromString(const std::string& s)
    {
      if (s == "duration-ms")
        return MetricUnit::DurationMs;
      if (s == "rate-per-sec")
        return MetricUnit::RatePerSec;
      throw InvalidParameterException("metricUnitFromString", "", "unit",
                                      "unknown unit '" + s + "'");
    }

    /**
     * @brief One recorded measurement and its ordinal within the run.
     */
    class Sample
    {
    public:
      Sample(std::size_t index, double value)
        : m_index(index), m_value(value)
      {}

      std::size_t getIndex() const noexcept { return m_index; }
      double getValue() const noexcept { return m_value; }

    private:
      std::size_t m_index;
      double      m_value;
    };

    /**
     * @brief Ordered, non-empty measurements of one benchmark in one unit.
     *
     * Unit and identifier are properties of the set, so every sample in it
     * shares them by construction. Values must be finite. Instances are
     * immutable; withoutWarmup() returns a new set.
     */
    class SampleSet
    {
    public:
      SampleSet(std::string benchmarkId, MetricUnit unit, std::vector<double> values)
        : SampleSet(std::move(benchmarkId), unit, std::move(values), 0)
      {}

      const std::string& getBenchmarkId() const noexcept { return m_benchmarkId; }
      MetricUnit getUnit() const noexcept { return m_unit; }
      MetricDirection getDirection() const noexcept { return directionOf(m_unit); }
      std::size_t size() const noexcept { return m_values.size(); }

      /// Raw values in recording order.
      const std::vector<double>& getValues() const noexcept { return m_values; }

      Sample getSample(std::size_t i) const
      {
        if (i >= m_values.size())
          throw InvalidParameterException("SampleSet::getSample", m_benchmarkId, "i",
                                          "index " + std::to_string(i) + " out of range");
        return Sample(m_firstOrdinal + i, m_values[i]);
      }

      /**
       * @brief Drop the first @p warmupIterations samples.
       *
       * Ordinals of the retained samples are unchanged.
       * @throws InsufficientSamplesException if no sample would remain.
       */
      SampleSet withoutWarmup(std::size_t warmupIterations) const
      {
        if (warmupIterations == 0)
          return *this;

        if (warmupIterations >= m_values.size())
          throw InsufficientSamplesException("SampleSet::withoutWarmup", m_benchmarkId,
                                             warmupIterations + 1, m_values.size());

        std::vector<double> kept(m_values.begin() + static_cast<std::ptrdiff_t>(warmupIterations),
                                 m_values.end());
        return SampleSet(m_benchmarkId, m_unit, std::move(kept), m_firstOrdinal + warmupIterations);
      }

    private:
      SampleSet(std::string benchmarkId, MetricUnit unit, std::vector<double> values,
                std::size_t firstOrdinal)
        : m_benchmarkId(std::move(benchmarkId)),
          m_unit(unit),
          m_values(std::move(values)),
          m_firstOrdinal(firstOrdinal)
      {
        if (m_benchmarkId.empty())
          throw InvalidParameterException("SampleSet", "", "benchmarkId", "must not be empty");
        if (m_values.empty())
          throw InsufficientSamplesException("SampleSet", m_benchmarkId, 1, 0);
        for (std::size_t i = 0; i < m_values.size(); ++i)
          {
            if (!std::isfinite(m_values[i]))
              throw InvalidParameterException("SampleSet", m_benchmarkId, "values",
                                              "sample " + std::to_string(i) + " is not finite");
          }
      }

      std::string         m_benchmarkId;
      MetricUnit          m_unit;
      std::vector<double> m_values;
      std::size_t         m_firstOrdinal;
    };
  } // namespace analysis
} // namespace benchstat
