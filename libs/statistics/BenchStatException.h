#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace benchstat
{
  /**
   * @brief Root of the benchstat error taxonomy.
   *
   * Every failure carries the benchmark identifier (empty for calls that are
   * not tied to one, e.g. sample-size planning) and the operation that
   * failed. what() renders both in front of the detail text.
   */
  class BenchStatException : public std::runtime_error
  {
  public:
    BenchStatException(const std::string& operation,
                       const std::string& benchmarkId,
                       const std::string& detail)
      : std::runtime_error(formatMessage(operation, benchmarkId, detail)),
        m_operation(operation),
        m_benchmarkId(benchmarkId),
        m_detail(detail)
    {}

    const std::string& getOperation() const noexcept { return m_operation; }
    const std::string& getBenchmarkId() const noexcept { return m_benchmarkId; }
    const std::string& getDetail() const noexcept { return m_detail; }

  private:
    static std::string formatMessage(const std::string& operation,
                                     const std::string& benchmarkId,
                                     const std::string& detail)
    {
      std::string msg = operation;
      if (!benchmarkId.empty())
        msg += " [" + benchmarkId + "]";
      msg += ": " + detail;
      return msg;
    }

    std::string m_operation;
    std::string m_benchmarkId;
    std::string m_detail;
  };

  /// Malformed planning or statistical input. Caller error, never retried.
  class InvalidParameterException : public BenchStatException
  {
  public:
    InvalidParameterException(const std::string& operation,
                              const std::string& benchmarkId,
                              const std::string& parameterName,
                              const std::string& detail)
      : BenchStatException(operation, benchmarkId, parameterName + ": " + detail),
        m_parameterName(parameterName)
    {}

    const std::string& getParameterName() const noexcept { return m_parameterName; }

  private:
    std::string m_parameterName;
  };

  /// Fewer samples than the operation needs; reports the required minimum.
  class InsufficientSamplesException : public BenchStatException
  {
  public:
    InsufficientSamplesException(const std::string& operation,
                                 const std::string& benchmarkId,
                                 std::size_t required,
                                 std::size_t actual)
      : BenchStatException(operation, benchmarkId,
                           "need at least " + std::to_string(required) +
                           " samples, got " + std::to_string(actual)),
        m_required(required),
        m_actual(actual)
    {}

    std::size_t getRequired() const noexcept { return m_required; }
    std::size_t getActual() const noexcept { return m_actual; }

  private:
    std::size_t m_required;
    std::size_t m_actual;
  };

  /**
   * @brief Pooled standard deviation is zero while the means differ.
   *
   * The effect size is unbounded; the sentinel Cohen's d is +inf or -inf
   * with the sign of the mean difference and the bucket is always Large.
   */
  class DegenerateVarianceException : public BenchStatException
  {
  public:
    DegenerateVarianceException(const std::string& operation,
                                const std::string& benchmarkId,
                                double sentinelCohensD)
      : BenchStatException(operation, benchmarkId,
                           "pooled standard deviation is zero but means differ"),
        m_sentinelCohensD(sentinelCohensD)
    {}

    double getSentinelCohensD() const noexcept { return m_sentinelCohensD; }

  private:
    double m_sentinelCohensD;
  };

  /// Opaque failure from a baseline store. Always propagated, never swallowed.
  class StoreException : public BenchStatException
  {
  public:
    StoreException(const std::string& operation,
                   const std::string& benchmarkId,
                   const std::string& detail)
      : BenchStatException(operation, benchmarkId, detail)
    {}
  };

  /// A cooperative cancellation request was observed between bootstrap shards.
  class OperationCancelledException : public BenchStatException
  {
  public:
    OperationCancelledException(const std::string& operation,
                                const std::string& benchmarkId,
                                std::size_t completedShards)
      : BenchStatException(operation, benchmarkId,
                           "cancelled after " + std::to_string(completedShards) + " shard(s)"),
        m_completedShards(completedShards)
    {}

    std::size_t getCompletedShards() const noexcept { return m_completedShards; }

  private:
    std::size_t m_completedShards;
  };
} // namespace benchstat
