#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace benchstat::diagnostics
{
  /**
   * @brief One bootstrap estimate, flattened for diagnostic sinks.
   */
  class EstimationDiagnosticRecord
  {
  public:
    EstimationDiagnosticRecord(std::string benchmarkId,
                               std::string unit,
                               std::size_t sampleSize,
                               std::size_t numResamples,
                               std::size_t numShards,
                               uint64_t seed,
                               double confidence,
                               double mean,
                               double stddev,
                               double lowerBound,
                               double upperBound,
                               double bootstrapStandardError,
                               double replicateMin,
                               double replicateMax)
      : m_benchmarkId(std::move(benchmarkId)),
        m_unit(std::move(unit)),
        m_sampleSize(sampleSize),
        m_numResamples(numResamples),
        m_numShards(numShards),
        m_seed(seed),
        m_confidence(confidence),
        m_mean(mean),
        m_stddev(stddev),
        m_lowerBound(lowerBound),
        m_upperBound(upperBound),
        m_bootstrapStandardError(bootstrapStandardError),
        m_replicateMin(replicateMin),
        m_replicateMax(replicateMax)
    {}

    EstimationDiagnosticRecord() = delete;

    const std::string& getBenchmarkId() const { return m_benchmarkId; }
    const std::string& getUnit() const { return m_unit; }
    std::size_t getSampleSize() const { return m_sampleSize; }
    std::size_t getNumResamples() const { return m_numResamples; }
    std::size_t getNumShards() const { return m_numShards; }
    uint64_t getSeed() const { return m_seed; }
    double getConfidence() const { return m_confidence; }
    double getMean() const { return m_mean; }
    double getStddev() const { return m_stddev; }
    double getLowerBound() const { return m_lowerBound; }
    double getUpperBound() const { return m_upperBound; }
    double getBootstrapStandardError() const { return m_bootstrapStandardError; }
    double getReplicateMin() const { return m_replicateMin; }
    double getReplicateMax() const { return m_replicateMax; }

  private:
    std::string m_benchmarkId;
    std::string m_unit;
    std::size_t m_sampleSize;
    std::size_t m_numResamples;
    std::size_t m_numShards;
    uint64_t    m_seed;
    double      m_confidence;
    double      m_mean;
    double      m_stddev;
    double      m_lowerBound;
    double      m_upperBound;
    double      m_bootstrapStandardError;
    double      m_replicateMin;
    double      m_replicateMax;
  };
} // namespace benchstat::diagnostics
