#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "BenchStatException.h"
#include "BenchstatConfiguration.h"
#include "CsvEstimationCollector.h"
#include "ExitStatus.h"
#include "JsonBaselineStore.h"
#include "NullEstimationCollector.h"
#include "OutputUtils.h"
#include "RegressionAnalyzer.h"
#include "ReportPrinter.h"
#include "ReportSerializer.h"
#include "ReproducibilityContext.h"
#include "SampleFileReader.h"
#include "TimestampFormat.h"

using namespace benchstat;

namespace
{
  regression::ReproducibilityContext makeContext(const BenchstatConfiguration& config)
  {
    const uint64_t seed = config.analysisConfig.getSeed();
    if (!config.timestamp)
      return regression::ReproducibilityContext::capture(seed, config.commitHash, config.hardwareTag);

    return regression::ReproducibilityContext(seed,
                                              regression::EnvironmentFingerprint::capture(),
                                              config.commitHash,
                                              config.hardwareTag,
                                              regression::fromIso8601(*config.timestamp));
  }

  void writeJsonReport(const std::string& path, const reporting::RegressionReport& report)
  {
    std::ofstream out(path);
    if (!out)
      throw StoreException("writeJsonReport", report.getBenchmarkId(),
                           "cannot open '" + path + "' for writing");
    out << reporting::ReportSerializer::toJson(report) << std::endl;
    if (!out)
      throw StoreException("writeJsonReport", report.getBenchmarkId(),
                           "failed writing '" + path + "'");
  }

  int run(const BenchstatConfiguration& config, std::ostream& log)
  {
    std::unique_ptr<diagnostics::IEstimationObserver> observer;
    if (config.diagnosticsCsv)
      observer = std::make_unique<diagnostics::CsvEstimationCollector>(*config.diagnosticsCsv);
    else
      observer = std::make_unique<diagnostics::NullEstimationCollector>();

    store::JsonBaselineStore baselines(config.storeRoot);
    analysis::RegressionAnalyzer analyzer(config.analysisConfig, baselines, *observer, log);

    const analysis::SampleSet samples =
      utils::SampleFileReader::readFile(config.samplesFile, config.benchmarkId, config.unit);
    log << "Read " << samples.size() << " sample(s) from " << config.samplesFile << std::endl;

    const reporting::RegressionReport report =
      analyzer.analyse(samples, makeContext(config), config.baselineDate);
    reporting::ReportPrinter::print(report, log);

    if (config.verifyRuns > 0)
      {
        const analysis::ReproducibilityCheck check =
          analyzer.verifyReproducible(samples, config.analysisConfig.getSeed(), config.verifyRuns);
        if (!check.identical)
          {
            std::cerr << "Error: bootstrap bounds differ between runs with the same seed" << std::endl;
            return kExitNotReproducible;
          }
      }

    const std::vector<std::string> missing = report.missingRequiredMetrics();
    if (!missing.empty())
      {
        std::cerr << "Error: report is missing required items:";
        for (const auto& item : missing)
          std::cerr << " " << item;
        std::cerr << std::endl;
        std::cerr << "Not writing the JSON report or promoting the run." << std::endl;
        return kExitIncomplete;
      }

    if (config.reportJsonPath)
      {
        writeJsonReport(*config.reportJsonPath, report);
        log << "JSON report written to " << *config.reportJsonPath << std::endl;
      }

    if (config.promote)
      analyzer.promote(report);

    return exitStatusFor(report);
  }
}

int main(int argc, char** argv)
{
  std::optional<BenchstatConfiguration> config;
  try
    {
      config = parseBenchstatConfiguration(argc, argv, std::cout);
    }
  catch (const BenchstatConfigurationException& e)
    {
      std::cerr << "BenchstatConfigurationException: " << e.what() << std::endl;
      std::cerr << "Run 'benchstat --help' for usage." << std::endl;
      return kExitError;
    }

  if (!config)
    return kExitOk;

  std::ofstream logFile;
  std::unique_ptr<utils::TeeStream> tee;
  if (config->logFile)
    {
      logFile.open(*config->logFile, std::ios::app);
      if (!logFile)
        {
          std::cerr << "Error: cannot open log file '" << *config->logFile << "'" << std::endl;
          return kExitError;
        }
      tee = std::make_unique<utils::TeeStream>(std::cout, logFile);
    }
  std::ostream& log = tee ? static_cast<std::ostream&>(*tee) : std::cout;

  try
    {
      return run(*config, log);
    }
  catch (const BenchStatException& e)
    {
      log << std::flush;
      std::cerr << "Error: " << e.what() << std::endl;
      return kExitError;
    }
  catch (const std::exception& e)
    {
      log << std::flush;
      std::cerr << "Unexpected error: " << e.what() << std::endl;
      return kExitError;
    }
}
