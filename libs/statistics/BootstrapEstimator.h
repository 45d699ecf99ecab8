#pragma once

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

#include "BenchStatException.h"
#include "BenchmarkSamples.h"
#include "ConfidenceInterval.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "RngUtils.h"
#include "SummaryStatistics.h"

namespace benchstat
{
  namespace analysis
  {
    /**
     * @brief Cooperative cancellation flag polled between bootstrap shards.
     */
    class CancellationToken
    {
    public:
      CancellationToken() : m_cancelled(false) {}

      void requestCancel() noexcept
      {
        m_cancelled.store(true, std::memory_order_relaxed);
      }

      bool isCancelled() const noexcept
      {
        return m_cancelled.load(std::memory_order_relaxed);
      }

    private:
      std::atomic<bool> m_cancelled;
    };

    struct BootstrapEstimate
    {
      SummaryStatistics  statistics;              // direct mean / stddev / n
      ConfidenceInterval interval;                // percentile CI around the mean
      std::size_t        resamples;               // B
      std::size_t        shards;                  // ceil(B / shardSize)
      std::size_t        shardSize;
      uint64_t           seed;
      double             bootstrapStandardError;  // stddev of the B resample means
      double             replicateMin;
      double             replicateMax;
    };

    namespace detail
    {
      // Hyndman-Fan type-7 quantile of an ascending-sorted, non-empty range.
      inline double quantile_type7_sorted(const std::vector<double>& sorted, double p)
      {
        if (sorted.empty())
          throw std::invalid_argument("quantile_type7_sorted: empty input");
        if (p <= 0.0)
          return sorted.front();
        if (p >= 1.0)
          return sorted.back();

        const double h = (static_cast<double>(sorted.size()) - 1.0) * p;
        const std::size_t lo = static_cast<std::size_t>(std::floor(h));
        if (lo + 1 >= sorted.size())
          return sorted.back();

        const double frac = h - static_cast<double>(lo);
        return sorted[lo] + (sorted[lo + 1] - sorted[lo]) * frac;
      }
    } // namespace detail

    /**
     * @brief Percentile-bootstrap confidence interval for the mean of a SampleSet.
     *
     *  - The direct mean and standard deviation are computed from the samples.
     *  - B resamples of size n are drawn with replacement; the mean of each is
     *    recorded.
     *  - The interval is the type-7 empirical quantile of the B means at
     *    (1 - CL)/2 and 1 - (1 - CL)/2, widened if necessary so that it
     *    contains the direct mean.
     *
     * Resampling is split into shards of shardSize replicates. Shard s draws
     * from its own engine seeded with derive_shard_seed(seed, s) and writes
     * only to replicate slots [s * shardSize, (s + 1) * shardSize). The shard
     * layout depends on B and shardSize alone, so results are bit-identical
     * for every Executor and thread count.
     *
     * @tparam Executor executor policy from ParallelExecutors.h
     * @tparam Rng      engine constructible from std::seed_seq&
     */
    template<class Executor = concurrency::SingleThreadExecutor,
             class Rng      = std::mt19937_64>
    class BootstrapEstimator
    {
    public:
      static constexpr std::size_t kMinResamples     = 1000;
      static constexpr std::size_t kDefaultResamples = 10000;
      static constexpr std::size_t kDefaultShardSize = 1000;
      static constexpr double      kDefaultConfidence = ConfidenceInterval::kCanonicalLevel;

      /**
       * @throws InvalidParameterException if confidence is outside (0,1),
       *         resamples < kMinResamples, or shardSize == 0.
       */
      explicit BootstrapEstimator(double      confidence = kDefaultConfidence,
                                  std::size_t resamples  = kDefaultResamples,
                                  std::size_t shardSize  = kDefaultShardSize)
        : m_confidence(confidence),
          m_resamples(resamples),
          m_shardSize(shardSize),
          m_exec(std::make_shared<Executor>())
      {
        const char* op = "BootstrapEstimator";
        if (!(confidence > 0.0 && confidence < 1.0))
          throw InvalidParameterException(op, "", "confidence", "must be in (0,1)");
        if (resamples < kMinResamples)
          throw InvalidParameterException(op, "", "resamples",
                                          "must be >= " + std::to_string(kMinResamples) +
                                          ", got " + std::to_string(resamples));
        if (shardSize == 0)
          throw InvalidParameterException(op, "", "shard_size", "must be > 0");
      }

      BootstrapEstimate estimate(const SampleSet& samples, uint64_t rngSeed) const
      {
        CancellationToken neverCancelled;
        return estimate(samples, rngSeed, neverCancelled);
      }

      /**
       * @throws InsufficientSamplesException if samples.size() < 2
       * @throws OperationCancelledException if @p cancel fires before all
       *         shards have started
       */
      BootstrapEstimate estimate(const SampleSet&         samples,
                                 uint64_t                 rngSeed,
                                 const CancellationToken& cancel) const
      {
        const std::string& id = samples.getBenchmarkId();
        const std::size_t n = samples.size();
        if (n < 2)
          throw InsufficientSamplesException("BootstrapEstimator::estimate", id, 2, n);

        const SummaryStatistics direct = SummaryStatistics::fromSamples(samples);
        const std::vector<double>& x = samples.getValues();

        const std::size_t numShards = (m_resamples + m_shardSize - 1) / m_shardSize;
        std::vector<double> means(m_resamples);
        const rng_utils::ShardEngineProvider<Rng> provider(rngSeed);
        std::atomic<std::size_t> startedShards{0};

        concurrency::parallel_for_chunked(
          static_cast<uint32_t>(numShards),
          *m_exec,
          [&](uint32_t shard) {
            if (cancel.isCancelled())
              throw OperationCancelledException("BootstrapEstimator::estimate", id,
                                                startedShards.load());
            startedShards.fetch_add(1);

            auto rng = provider.make_engine(shard);

            const std::size_t begin = static_cast<std::size_t>(shard) * m_shardSize;
            const std::size_t end = std::min(m_resamples, begin + m_shardSize);
            for (std::size_t b = begin; b < end; ++b)
              {
                double sum = 0.0;
                for (std::size_t i = 0; i < n; ++i)
                  sum += x[rng_utils::get_random_index(rng, n)];
                means[b] = sum / static_cast<double>(n);
              }
          },
          /*chunkSizeHint=*/1);

        namespace ba = boost::accumulators;
        ba::accumulator_set<double, ba::stats<ba::tag::count, ba::tag::mean, ba::tag::variance,
                                              ba::tag::min, ba::tag::max>> acc;
        for (double m : means)
          acc(m);

        // Boost's variance uses the population denominator.
        const double B = static_cast<double>(ba::count(acc));
        const double se = std::sqrt(ba::variance(acc) * B / (B - 1.0));

        std::sort(means.begin(), means.end());
        const double alpha = 1.0 - m_confidence;
        const double mean = direct.getMean();
        const double lower = std::min(detail::quantile_type7_sorted(means, alpha / 2.0), mean);
        const double upper = std::max(detail::quantile_type7_sorted(means, 1.0 - alpha / 2.0), mean);

        return BootstrapEstimate{
          direct,
          ConfidenceInterval(lower, mean, upper, m_confidence),
          m_resamples,
          numShards,
          m_shardSize,
          rngSeed,
          se,
          (ba::min)(acc),
          (ba::max)(acc)
        };
      }

      double getConfidence() const noexcept { return m_confidence; }
      std::size_t getResamples() const noexcept { return m_resamples; }
      std::size_t getShardSize() const noexcept { return m_shardSize; }

    private:
      double                            m_confidence;
      std::size_t                       m_resamples;
      std::size_t                       m_shardSize;
      mutable std::shared_ptr<Executor> m_exec;
    };
  } // namespace analysis
} // namespace benchstat
