#pragma once

#include <cmath>
#include <string>

#include "BenchStatException.h"

namespace benchstat
{
  namespace analysis
  {
    /**
     * @brief Two-sided interval around a point estimate.
     *
     * Invariants checked on construction: lower <= point <= upper, all finite,
     * and level in (0, 1).
     */
    class ConfidenceInterval
    {
    public:
      static constexpr double kCanonicalLevel = 0.95;

      ConfidenceInterval(double lower, double pointEstimate, double upper, double level)
        : m_lower(lower), m_point(pointEstimate), m_upper(upper), m_level(level)
      {
        const char* op = "ConfidenceInterval";
        if (!std::isfinite(lower) || !std::isfinite(upper) || !std::isfinite(pointEstimate))
          throw InvalidParameterException(op, "", "bounds", "must be finite");
        if (!(level > 0.0 && level < 1.0))
          throw InvalidParameterException(op, "", "level", "must be in (0,1)");
        if (!(lower <= pointEstimate && pointEstimate <= upper))
          throw InvalidParameterException(op, "", "bounds",
                                          "require lower <= point estimate <= upper");
      }

      double getLower() const noexcept { return m_lower; }
      double getUpper() const noexcept { return m_upper; }
      double getPointEstimate() const noexcept { return m_point; }
      double getLevel() const noexcept { return m_level; }
      double getWidth() const noexcept { return m_upper - m_lower; }

      bool contains(double x) const noexcept
      {
        return m_lower <= x && x <= m_upper;
      }

      /// Closed intervals: touching endpoints count as overlap.
      bool overlaps(const ConfidenceInterval& other) const noexcept
      {
        return !(m_upper < other.m_lower || other.m_upper < m_lower);
      }

    private:
      double m_lower;
      double m_point;
      double m_upper;
      double m_level;
    };
  } // namespace analysis
} // namespace benchstat
