#include "BenchstatConfiguration.h"

#include <fstream>

#include <boost/program_options.hpp>

#include "BenchStatException.h"
#include "RegressionDetector.h"
#include "TimestampFormat.h"

namespace po = boost::program_options;

namespace benchstat
{
  namespace
  {
    po::options_description makeGenericOptions()
    {
      po::options_description generic("Generic options");
      generic.add_options()
        ("help,h", "Print this help message")
        ("config,c", po::value<std::string>(), "Read further options from an INI-style file");
      return generic;
    }

    po::options_description makeRunOptions()
    {
      po::options_description run("Run options");
      run.add_options()
        ("samples,s", po::value<std::string>(), "File of measured samples, one or more per line")
        ("benchmark-id,b", po::value<std::string>(), "Identifier of the benchmark")
        ("unit,u", po::value<std::string>()->default_value("duration-ms"),
         "Metric unit: duration-ms or rate-per-sec")
        ("store", po::value<std::string>()->default_value("baselines"),
         "Directory of the baseline store")
        ("baseline-date", po::value<std::string>(),
         "Compare against the baseline with this date tag instead of the latest")
        ("commit", po::value<std::string>()->default_value(""), "Commit hash of the measured build")
        ("hardware-tag", po::value<std::string>()->default_value(""), "Label of the host hardware")
        ("timestamp", po::value<std::string>(), "Run time in ISO 8601 (default: now, UTC)")
        ("report-json", po::value<std::string>(), "Write the JSON report to this file")
        ("promote", po::bool_switch(), "Store this run as the new baseline")
        ("verify-runs", po::value<std::size_t>()->default_value(0),
         "Repeat the bootstrap this many times and check the bounds are identical")
        ("log-file", po::value<std::string>(), "Copy console output to this file")
        ("diagnostics-csv", po::value<std::string>(), "Append per-estimate diagnostics to this CSV");
      return run;
    }

    po::options_description makeAnalysisOptions()
    {
      const AnalysisConfiguration defaults;

      po::options_description analysisOptions("Analysis options");
      analysisOptions.add_options()
        ("confidence", po::value<double>()->default_value(defaults.getConfidence()),
         "Confidence level of the bootstrap interval")
        ("resamples", po::value<std::size_t>()->default_value(defaults.getResamples()),
         "Number of bootstrap resamples")
        ("shard-size", po::value<std::size_t>()->default_value(defaults.getShardSize()),
         "Resamples per parallel shard")
        ("seed", po::value<uint64_t>()->default_value(defaults.getSeed()), "Master RNG seed")
        ("sample-size-override", po::value<std::size_t>(),
         "Use this minimum sample count instead of the planned one")
        ("warmup", po::value<std::size_t>()->default_value(defaults.getWarmupIterations()),
         "Leading samples to discard")
        ("effect-size", po::value<double>()->default_value(defaults.getEffectSizeTarget()),
         "Relative change the sample size plan must detect")
        ("power", po::value<double>()->default_value(defaults.getPower()), "Target statistical power")
        ("alpha", po::value<double>()->default_value(defaults.getAlpha()), "Significance level")
        ("safety-multiplier", po::value<double>()->default_value(defaults.getSafetyMultiplier()),
         "Recommended/minimum sample size ratio")
        ("mean-shift-sigmas", po::value<double>()->default_value(defaults.getPolicy().meanShiftSigmas),
         "Mean shift threshold in baseline standard deviations")
        ("large-effect", po::value<double>()->default_value(defaults.getPolicy().largeEffectThreshold),
         "|Cohen's d| threshold of the large-effect criterion")
        ("rule", po::value<std::string>()->default_value(
                   regression::toString(defaults.getPolicy().combination)),
         "Criteria combination: mean-shift-plus-one, all or majority");
      return analysisOptions;
    }

    template <class T>
    std::optional<T> optionalValue(const po::variables_map& vm, const char* name)
    {
      if (vm.count(name))
        return vm[name].as<T>();
      return std::nullopt;
    }

    AnalysisConfiguration makeAnalysisConfiguration(const po::variables_map& vm)
    {
      regression::RegressionPolicy policy;
      policy.meanShiftSigmas = vm["mean-shift-sigmas"].as<double>();
      policy.largeEffectThreshold = vm["large-effect"].as<double>();
      policy.combination = regression::criteriaCombinationFromString(vm["rule"].as<std::string>());

      return AnalysisConfiguration(vm["confidence"].as<double>(),
                                   vm["resamples"].as<std::size_t>(),
                                   vm["shard-size"].as<std::size_t>(),
                                   vm["seed"].as<uint64_t>(),
                                   optionalValue<std::size_t>(vm, "sample-size-override"),
                                   vm["warmup"].as<std::size_t>(),
                                   vm["effect-size"].as<double>(),
                                   vm["power"].as<double>(),
                                   vm["alpha"].as<double>(),
                                   vm["safety-multiplier"].as<double>(),
                                   policy);
    }

    const std::string& requiredValue(const po::variables_map& vm, const char* name)
    {
      if (!vm.count(name))
        throw BenchstatConfigurationException(std::string("missing required option --") + name);
      return vm[name].as<std::string>();
    }
  }

  std::optional<BenchstatConfiguration>
  parseBenchstatConfiguration(int argc, const char* const argv[], std::ostream& out)
  {
    po::options_description fileOptions;
    fileOptions.add(makeRunOptions()).add(makeAnalysisOptions());

    po::options_description all("Usage: benchstat --samples FILE --benchmark-id ID [options]");
    all.add(makeGenericOptions()).add(fileOptions);

    po::variables_map vm;
    try
      {
        po::store(po::parse_command_line(argc, argv, all), vm);

        if (vm.count("help"))
          {
            out << all << std::endl;
            return std::nullopt;
          }

        if (vm.count("config"))
          {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream configStream(path);
            if (!configStream)
              throw BenchstatConfigurationException("cannot open config file '" + path + "'");
            po::store(po::parse_config_file(configStream, fileOptions), vm);
          }

        po::notify(vm);
      }
    catch (const po::error& e)
      {
        throw BenchstatConfigurationException(e.what());
      }

    BenchstatConfiguration config;
    config.samplesFile = requiredValue(vm, "samples");
    config.benchmarkId = requiredValue(vm, "benchmark-id");
    config.storeRoot = vm["store"].as<std::string>();
    config.baselineDate = optionalValue<std::string>(vm, "baseline-date");
    config.commitHash = vm["commit"].as<std::string>();
    config.hardwareTag = vm["hardware-tag"].as<std::string>();
    config.timestamp = optionalValue<std::string>(vm, "timestamp");
    config.reportJsonPath = optionalValue<std::string>(vm, "report-json");
    config.logFile = optionalValue<std::string>(vm, "log-file");
    config.diagnosticsCsv = optionalValue<std::string>(vm, "diagnostics-csv");
    config.promote = vm["promote"].as<bool>();
    config.verifyRuns = vm["verify-runs"].as<std::size_t>();

    try
      {
        config.unit = analysis::metricUnitFromString(vm["unit"].as<std::string>());
        if (config.timestamp)
          regression::fromIso8601(*config.timestamp);
        config.analysisConfig = makeAnalysisConfiguration(vm);
      }
    catch (const InvalidParameterException& e)
      {
        throw BenchstatConfigurationException(e.what());
      }

    if (config.verifyRuns == 1)
      throw BenchstatConfigurationException("--verify-runs must be 0 or at least 2");

    return config;
  }
}
