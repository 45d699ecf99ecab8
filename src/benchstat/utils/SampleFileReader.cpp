#include "SampleFileReader.h"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "BenchStatException.h"

namespace benchstat
{
namespace utils
{

analysis::SampleSet SampleFileReader::readFile(const std::string& path,
                                               const std::string& benchmarkId,
                                               analysis::MetricUnit unit)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw InvalidParameterException("SampleFileReader::readFile", benchmarkId, "path",
                                        "cannot open samples file " + path);
    }
    return read(file, benchmarkId, unit, path);
}

analysis::SampleSet SampleFileReader::read(std::istream& in,
                                           const std::string& benchmarkId,
                                           analysis::MetricUnit unit,
                                           const std::string& sourceName)
{
    return analysis::SampleSet(benchmarkId, unit, parseValues(in, benchmarkId, sourceName));
}

std::vector<double> SampleFileReader::parseValues(std::istream& in,
                                                  const std::string& benchmarkId,
                                                  const std::string& sourceName)
{
    std::vector<double> values;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(in, line))
    {
        ++lineNumber;
        boost::algorithm::trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        std::vector<std::string> tokens;
        boost::algorithm::split(tokens, line, boost::algorithm::is_any_of(",; \t"),
                                boost::algorithm::token_compress_on);

        for (const auto& token : tokens)
        {
            if (token.empty())
                continue;

            const std::string where = sourceName + ":" + std::to_string(lineNumber);
            std::size_t consumed = 0;
            double value = 0.0;
            try
            {
                value = std::stod(token, &consumed);
            }
            catch (const std::logic_error&)
            {
                throw InvalidParameterException("SampleFileReader::read", benchmarkId, "samples",
                                                where + ": '" + token + "' is not a number");
            }

            if (consumed != token.size() || !std::isfinite(value))
            {
                throw InvalidParameterException("SampleFileReader::read", benchmarkId, "samples",
                                                where + ": '" + token + "' is not a finite number");
            }
            values.push_back(value);
        }
    }

    return values;
}

} // namespace utils
} // namespace benchstat
