#pragma once

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "BaselineRecord.h"
#include "BenchStatException.h"
#include "BenchmarkSamples.h"
#include "ConfidenceInterval.h"
#include "EffectSizeCalculator.h"
#include "SummaryStatistics.h"

namespace benchstat
{
  namespace regression
  {
    using analysis::EffectSize;
    using analysis::EffectSizeBucket;
    using analysis::EffectSizeCalculator;
    using analysis::MetricDirection;

    enum class RegressionClassification
    {
      Improved,
      Regressed,
      Unchanged,
      InsufficientData
    };

    enum class RegressionCriterion
    {
      MeanShift,     // |current - baseline| / baseline stddev above threshold
      CiNonOverlap,  // the two confidence intervals are disjoint
      LargeEffect    // |Cohen's d| above threshold
    };

    /// How the individual criteria combine into a Regressed/Improved verdict.
    enum class CriteriaCombination
    {
      MeanShiftPlusCorroboration,  // MeanShift and at least one other
      AllCriteria,                 // all three
      MajorityOfCriteria           // any two of three
    };

    inline std::string toString(RegressionClassification c)
    {
      switch (c)
        {
        case RegressionClassification::Improved:         return "Improved";
        case RegressionClassification::Regressed:        return "Regressed";
        case RegressionClassification::Unchanged:        return "Unchanged";
        case RegressionClassification::InsufficientData: return "InsufficientData";
        }
      return "Unknown";
    }

    inline std::string toString(RegressionCriterion c)
    {
      switch (c)
        {
        case RegressionCriterion::MeanShift:    return "MeanShift";
        case RegressionCriterion::CiNonOverlap: return "CiNonOverlap";
        case RegressionCriterion::LargeEffect:  return "LargeEffect";
        }
      return "Unknown";
    }

    inline std::string toString(CriteriaCombination c)
    {
      switch (c)
        {
        case CriteriaCombination::MeanShiftPlusCorroboration: return "mean-shift-plus-one";
        case CriteriaCombination::AllCriteria:                return "all";
        case CriteriaCombination::MajorityOfCriteria:         return "majority";
        }
      return "unknown";
    }

    inline CriteriaCombination criteriaCombinationFromString(const std::string& s)
    {
      if (s == "mean-shift-plus-one")
        return CriteriaCombination::MeanShiftPlusCorroboration;
      if (s == "all")
        return CriteriaCombination::AllCriteria;
      if (s == "majority")
        return CriteriaCombination::MajorityOfCriteria;
      throw InvalidParameterException("criteriaCombinationFromString", "", "combination",
                                      "unknown rule '" + s + "'");
    }

    struct RegressionPolicy
    {
      double              meanShiftSigmas      = 2.0;
      double              largeEffectThreshold = 0.5;
      CriteriaCombination combination          = CriteriaCombination::MeanShiftPlusCorroboration;
    };

    /**
     * @brief Outcome of comparing one run against one baseline.
     *
     * getCriteria() lists every criterion that held, whatever the final
     * classification. isWeakSignal() is true when at least one criterion held
     * but the verdict is not Regressed/Improved.
     */
    class RegressionVerdict
    {
    public:
      RegressionVerdict(RegressionClassification classification,
                        std::set<RegressionCriterion> criteria,
                        std::optional<EffectSize> effect,
                        double meanShiftSigmas,
                        bool weakSignal,
                        std::string rationale)
        : m_classification(classification),
          m_criteria(std::move(criteria)),
          m_effect(effect),
          m_meanShiftSigmas(meanShiftSigmas),
          m_weakSignal(weakSignal),
          m_rationale(std::move(rationale))
      {}

      RegressionClassification getClassification() const noexcept { return m_classification; }
      const std::set<RegressionCriterion>& getCriteria() const noexcept { return m_criteria; }

      bool holds(RegressionCriterion c) const
      {
        return m_criteria.count(c) != 0;
      }

      /// Empty when the effect size could not be computed (n_a + n_b <= 2).
      const std::optional<EffectSize>& getEffectSize() const noexcept { return m_effect; }

      /// Signed shift in baseline standard deviations; NaN when undefined.
      double getMeanShiftSigmas() const noexcept { return m_meanShiftSigmas; }

      bool isWeakSignal() const noexcept { return m_weakSignal; }
      const std::string& getRationale() const noexcept { return m_rationale; }

    private:
      RegressionClassification      m_classification;
      std::set<RegressionCriterion> m_criteria;
      std::optional<EffectSize>     m_effect;
      double                        m_meanShiftSigmas;
      bool                          m_weakSignal;
      std::string                   m_rationale;
    };

    /**
     * @brief Multi-criterion regression decision against a stored baseline.
     *
     * Each criterion is evaluated independently. The combination rule in the
     * policy decides whether the criteria that held support a verdict; the
     * direction of the mean difference, read against the baseline's metric
     * unit, then picks Regressed or Improved. A current run smaller than the
     * baseline's planned minimum, or a missing standard deviation on either
     * side, yields InsufficientData regardless of the criteria.
     */
    class RegressionDetector
    {
    public:
      explicit RegressionDetector(RegressionPolicy policy = RegressionPolicy())
        : m_policy(policy)
      {
        if (!std::isfinite(policy.meanShiftSigmas) || policy.meanShiftSigmas <= 0.0)
          throw InvalidParameterException("RegressionDetector", "", "meanShiftSigmas",
                                          "must be finite and > 0");
        if (!std::isfinite(policy.largeEffectThreshold) || policy.largeEffectThreshold < 0.0)
          throw InvalidParameterException("RegressionDetector", "", "largeEffectThreshold",
                                          "must be finite and >= 0");
      }

      const RegressionPolicy& getPolicy() const noexcept
      {
        return m_policy;
      }

      RegressionVerdict detect(const SummaryStatistics& current,
                               const ConfidenceInterval& currentInterval,
                               const BaselineRecord& baseline) const
      {
        const std::string& id = baseline.getBenchmarkId();
        const SummaryStatistics& base = baseline.getStatistics();
        const double delta = current.getMean() - base.getMean();

        std::set<RegressionCriterion> criteria;

        const double shift = meanShiftSigmas(delta, base);
        if (!std::isnan(shift) && std::fabs(shift) > m_policy.meanShiftSigmas)
          criteria.insert(RegressionCriterion::MeanShift);

        if (!currentInterval.overlaps(baseline.getInterval()))
          criteria.insert(RegressionCriterion::CiNonOverlap);

        std::optional<EffectSize> effect;
        if (current.getSampleSize() + base.getSampleSize() > 2)
          {
            try
              {
                effect = EffectSizeCalculator::compare(current, base, id);
              }
            catch (const DegenerateVarianceException& e)
              {
                effect = EffectSize{e.getSentinelCohensD(), EffectSizeBucket::Large};
              }

            if (std::fabs(effect->cohens_d) > m_policy.largeEffectThreshold)
              criteria.insert(RegressionCriterion::LargeEffect);
          }

        std::ostringstream why;
        why << std::fixed << std::setprecision(2);
        if (std::isnan(shift))
          why << "mean shift undefined";
        else
          why << "mean shift " << std::showpos << shift << std::noshowpos
              << " sigma (threshold " << m_policy.meanShiftSigmas << ")";
        why << "; criteria held: " << describe(criteria);

        const std::vector<std::string> shortfalls = insufficiencies(current, baseline);
        if (!shortfalls.empty())
          {
            why << "; insufficient data:";
            for (const auto& s : shortfalls)
              why << " " << s << ";";
            return RegressionVerdict(RegressionClassification::InsufficientData, criteria,
                                     effect, shift, !criteria.empty(), why.str());
          }

        if (combinationHolds(criteria) && delta != 0.0)
          {
            const bool worse = analysis::directionOf(baseline.getUnit()) == MetricDirection::LowerIsBetter
                                 ? delta > 0.0
                                 : delta < 0.0;
            why << "; rule " << toString(m_policy.combination) << " satisfied, "
                << (worse ? "performance worsened" : "performance improved");
            return RegressionVerdict(worse ? RegressionClassification::Regressed
                                           : RegressionClassification::Improved,
                                     criteria, effect, shift, false, why.str());
          }

        const bool weak = !criteria.empty();
        if (weak)
          why << "; rule " << toString(m_policy.combination) << " not satisfied (weak signal)";
        return RegressionVerdict(RegressionClassification::Unchanged, criteria, effect, shift,
                                 weak, why.str());
      }

    private:
      static double meanShiftSigmas(double delta, const SummaryStatistics& base)
      {
        if (!base.hasStddev())
          return std::numeric_limits<double>::quiet_NaN();

        const double sd = base.getStddev();
        if (sd > 0.0)
          return delta / sd;
        if (delta == 0.0)
          return 0.0;
        return delta > 0.0 ? std::numeric_limits<double>::infinity()
                           : -std::numeric_limits<double>::infinity();
      }

      static std::vector<std::string> insufficiencies(const SummaryStatistics& current,
                                                      const BaselineRecord& baseline)
      {
        std::vector<std::string> out;
        const std::size_t n = current.getSampleSize();
        if (n < baseline.getPlannedMinimumSamples())
          out.push_back("current n=" + std::to_string(n) + " below planned minimum " +
                        std::to_string(baseline.getPlannedMinimumSamples()));
        if (!current.hasStddev())
          out.push_back("current standard deviation undefined");
        if (!baseline.getStatistics().hasStddev())
          out.push_back("baseline standard deviation undefined");
        return out;
      }

      bool combinationHolds(const std::set<RegressionCriterion>& criteria) const
      {
        const bool meanShift = criteria.count(RegressionCriterion::MeanShift) != 0;
        const bool ciApart = criteria.count(RegressionCriterion::CiNonOverlap) != 0;
        const bool large = criteria.count(RegressionCriterion::LargeEffect) != 0;

        switch (m_policy.combination)
          {
          case CriteriaCombination::MeanShiftPlusCorroboration:
            return meanShift && (ciApart || large);
          case CriteriaCombination::AllCriteria:
            return meanShift && ciApart && large;
          case CriteriaCombination::MajorityOfCriteria:
            return criteria.size() >= 2;
          }
        return false;
      }

      static std::string describe(const std::set<RegressionCriterion>& criteria)
      {
        if (criteria.empty())
          return "none";
        std::string s;
        for (auto c : criteria)
          {
            if (!s.empty())
              s += ", ";
            s += toString(c);
          }
        return s;
      }

      RegressionPolicy m_policy;
    };
  } // namespace regression
} // namespace benchstat
