#pragma once

#include <ostream>
#include <string>

#include "RegressionReport.h"

namespace benchstat
{
namespace reporting
{

/**
 * @brief Human-readable text rendering of a RegressionReport
 */
class ReportPrinter
{
public:
    static void print(const RegressionReport& report, std::ostream& os);

private:
    static void writeSectionHeader(std::ostream& os, const std::string& title);
    static void writeStatistics(std::ostream& os,
                                const analysis::SummaryStatistics& stats,
                                const analysis::ConfidenceInterval& ci,
                                const std::string& unit);
};

} // namespace reporting
} // namespace benchstat
