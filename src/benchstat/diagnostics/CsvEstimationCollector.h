#pragma once
#include "IEstimationObserver.h"
#include <fstream>
#include <mutex>
#include <string>

namespace benchstat::diagnostics {

/**
 * @brief Appends one CSV row per estimate.
 *
 * The header is written only when the file is new or empty, so several runs
 * can share one diagnostics file. Safe to call from multiple threads.
 */
class CsvEstimationCollector : public IEstimationObserver {
public:
    explicit CsvEstimationCollector(const std::string& filepath);
    ~CsvEstimationCollector();

    void onEstimate(const EstimationDiagnosticRecord& record) override;

private:
    void writeHeaderIfNeeded();

    std::string m_filepath;
    std::ofstream m_ofs;
    std::mutex m_mutex;
    bool m_headerWritten = false;
};

} // namespace benchstat::diagnostics
