#include "CsvEstimationCollector.h"
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

#include <boost/algorithm/string/replace.hpp>

namespace benchstat::diagnostics
{
  namespace
  {
    // Quotes a field holding a delimiter, quote or line break; embedded quotes are doubled.
    std::string csvField(const std::string& value)
    {
      if (value.find_first_of(",\"\r\n") == std::string::npos)
        return value;
      return "\"" + boost::algorithm::replace_all_copy(value, "\"", "\"\"") + "\"";
    }
  }

  CsvEstimationCollector::CsvEstimationCollector(const std::string& filepath)
    : m_filepath(filepath)
  {
    // An existing non-empty file already has its header.
    std::error_code ec;
    if (std::filesystem::exists(m_filepath, ec)) {
      const auto size = std::filesystem::file_size(m_filepath, ec);
      m_headerWritten = !ec && size > 0;
    }

    m_ofs.open(m_filepath, std::ios::out | std::ios::app);
    if (!m_ofs.is_open()) {
      throw std::runtime_error("Failed to open diagnostic file: " + m_filepath);
    }
    m_ofs.precision(std::numeric_limits<double>::max_digits10);

    if (!m_headerWritten) {
      writeHeaderIfNeeded();
    }
  }

  CsvEstimationCollector::~CsvEstimationCollector() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_ofs.is_open()) m_ofs.close();
  }

  void CsvEstimationCollector::writeHeaderIfNeeded()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_headerWritten) return;

    m_ofs << "BenchmarkID,Unit,N,Resamples,Shards,Seed,Confidence,"
          << "Mean,Stddev,LB,UB,BootSE,RepMin,RepMax\n";

    m_ofs.flush();
    m_headerWritten = true;
  }

  void CsvEstimationCollector::onEstimate(const EstimationDiagnosticRecord& r)
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_ofs.is_open()) return;

    m_ofs << csvField(r.getBenchmarkId()) << ","
          << csvField(r.getUnit()) << ","
          << r.getSampleSize() << ","
          << r.getNumResamples() << ","
          << r.getNumShards() << ","
          << r.getSeed() << ","
          << r.getConfidence() << ",";

    m_ofs << r.getMean() << ","
          << r.getStddev() << ","
          << r.getLowerBound() << ","
          << r.getUpperBound() << ","
          << r.getBootstrapStandardError() << ","
          << r.getReplicateMin() << ","
          << r.getReplicateMax() << "\n";

    m_ofs.flush();
  }
} // namespace benchstat::diagnostics
