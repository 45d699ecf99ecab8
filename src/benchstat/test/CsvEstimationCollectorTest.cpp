#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <string>
#include <vector>

#include "CsvEstimationCollector.h"
#include "NullEstimationCollector.h"
#include "TempDirectory.h"

using namespace benchstat::diagnostics;

namespace
{
    EstimationDiagnosticRecord sampleRecord(const std::string& id)
    {
        return EstimationDiagnosticRecord(id, "duration-ms", 1000, 10000, 10, 42, 0.95,
                                          0.82, 0.02, 0.8188, 0.8212, 0.0006, 0.8176, 0.8224);
    }

    std::vector<std::string> readLines(const std::string& path)
    {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }

    const std::string kHeader =
        "BenchmarkID,Unit,N,Resamples,Shards,Seed,Confidence,Mean,Stddev,LB,UB,BootSE,RepMin,RepMax";
}

TEST_CASE("CsvEstimationCollector: header once, one row per estimate", "[Diagnostics]")
{
    benchstat_test::TempDirectory tmp("benchstat-diag");
    const std::string path = (tmp.path() / "estimates.csv").string();

    {
        CsvEstimationCollector collector(path);
        collector.onEstimate(sampleRecord("decode"));
        collector.onEstimate(sampleRecord("encode"));
    }

    auto lines = readLines(path);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] == kHeader);
    REQUIRE(lines[1].rfind("decode,duration-ms,1000,10000,10,42,", 0) == 0);
    REQUIRE(lines[2].rfind("encode,", 0) == 0);

    SECTION("reopening appends without repeating the header")
    {
        {
            CsvEstimationCollector collector(path);
            collector.onEstimate(sampleRecord("startup"));
        }
        lines = readLines(path);
        REQUIRE(lines.size() == 4);
        REQUIRE(lines[3].rfind("startup,", 0) == 0);
    }
}

TEST_CASE("CsvEstimationCollector: identifiers with delimiters are quoted", "[Diagnostics]")
{
    benchstat_test::TempDirectory tmp("benchstat-diag");
    const std::string path = (tmp.path() / "estimates.csv").string();

    {
        CsvEstimationCollector collector(path);
        collector.onEstimate(sampleRecord("decode,large"));
        collector.onEstimate(sampleRecord("say \"hi\""));
    }

    const auto lines = readLines(path);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[1].rfind("\"decode,large\",duration-ms,1000,10000,10,42,", 0) == 0);
    REQUIRE(lines[2].rfind("\"say \"\"hi\"\"\",duration-ms,1000,", 0) == 0);
}

TEST_CASE("CsvEstimationCollector: unwritable path throws", "[Diagnostics]")
{
    benchstat_test::TempDirectory tmp("benchstat-diag");
    REQUIRE_THROWS(CsvEstimationCollector((tmp.path() / "no-such-dir" / "x.csv").string()));
}

TEST_CASE("NullEstimationCollector accepts records", "[Diagnostics]")
{
    NullEstimationCollector collector;
    IEstimationObserver& observer = collector;
    REQUIRE_NOTHROW(observer.onEstimate(sampleRecord("decode")));
}
