#pragma once

#include "RegressionReport.h"

namespace benchstat
{
  // Process exit statuses of the benchstat command.
  constexpr int kExitOk = 0;               // Unchanged, Improved or a baseline candidate
  constexpr int kExitError = 1;
  constexpr int kExitRegressed = 2;
  constexpr int kExitIncomplete = 3;       // required metrics missing
  constexpr int kExitNotReproducible = 4;  // bootstrap bounds differ for one seed
  constexpr int kExitInsufficientData = 5; // too few samples for a verdict

  /// Exit status carried by a completed report's verdict.
  inline int exitStatusFor(const reporting::RegressionReport& report)
  {
    if (!report.getVerdict())
      return kExitOk;

    switch (report.getVerdict()->getClassification())
      {
      case regression::RegressionClassification::Regressed:
        return kExitRegressed;
      case regression::RegressionClassification::InsufficientData:
        return kExitInsufficientData;
      default:
        return kExitOk;
      }
  }
}
