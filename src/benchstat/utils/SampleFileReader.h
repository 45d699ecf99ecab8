#pragma once

#include <istream>
#include <string>
#include <vector>

#include "BenchmarkSamples.h"

namespace benchstat
{
namespace utils
{

/**
 * @brief Reads raw measurements written by a benchmark harness.
 *
 * Format: numeric values separated by commas, semicolons or whitespace,
 * any number per line. Blank lines and lines starting with '#' are
 * skipped. Values keep their order of appearance.
 */
class SampleFileReader
{
public:
    /**
     * @throws benchstat::InvalidParameterException naming the line of the
     *         first token that is not a finite number, or if the file cannot
     *         be opened
     */
    static analysis::SampleSet readFile(const std::string& path,
                                        const std::string& benchmarkId,
                                        analysis::MetricUnit unit);

    static analysis::SampleSet read(std::istream& in,
                                    const std::string& benchmarkId,
                                    analysis::MetricUnit unit,
                                    const std::string& sourceName = "<stream>");

private:
    static std::vector<double> parseValues(std::istream& in,
                                           const std::string& benchmarkId,
                                           const std::string& sourceName);
};

} // namespace utils
} // namespace benchstat
