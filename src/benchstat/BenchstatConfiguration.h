#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "AnalysisConfiguration.h"
#include "BenchmarkSamples.h"

namespace benchstat
{
  class BenchstatConfigurationException : public std::runtime_error
  {
  public:
    explicit BenchstatConfigurationException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };

  /**
   * @brief Everything the benchstat command line asked for.
   *
   * Optional members are unset when the corresponding option was not given.
   */
  struct BenchstatConfiguration
  {
    std::string                samplesFile;
    std::string                benchmarkId;
    analysis::MetricUnit       unit = analysis::MetricUnit::DurationMs;
    std::string                storeRoot;
    std::optional<std::string> baselineDate;
    std::string                commitHash;
    std::string                hardwareTag;
    std::optional<std::string> timestamp;       // ISO 8601; defaults to now (UTC)
    std::optional<std::string> reportJsonPath;
    std::optional<std::string> logFile;
    std::optional<std::string> diagnosticsCsv;
    bool                       promote = false;
    std::size_t                verifyRuns = 0;  // 0 disables the reproducibility check
    AnalysisConfiguration      analysisConfig;
  };

  /**
   * @brief Parse argv (and an optional --config file) into a configuration.
   *
   * Command-line values take precedence over the config file.
   *
   * @param out receives the usage text when --help is given
   * @return std::nullopt when --help was requested
   * @throws BenchstatConfigurationException on unknown, malformed, missing
   *         or out-of-range options
   */
  std::optional<BenchstatConfiguration>
  parseBenchstatConfiguration(int argc, const char* const argv[], std::ostream& out);
}
