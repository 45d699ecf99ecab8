#include "ReportPrinter.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace benchstat
{
namespace reporting
{

namespace
{
    std::string formatSigned(double x)
    {
        if (std::isnan(x))
            return "undefined";
        if (std::isinf(x))
            return x > 0.0 ? "+inf" : "-inf";

        std::ostringstream os;
        os << std::showpos << std::fixed << std::setprecision(2) << x;
        return os.str();
    }
}

void ReportPrinter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << "=== " << title << " ===" << std::endl;
}

void ReportPrinter::writeStatistics(std::ostream& os,
                                    const analysis::SummaryStatistics& stats,
                                    const analysis::ConfidenceInterval& ci,
                                    const std::string& unit)
{
    os << "  n               : " << stats.getSampleSize() << std::endl;
    os << "  mean +/- stddev : " << stats.getMean() << " +/- ";
    if (stats.hasStddev())
        os << stats.getStddev();
    else
        os << "undefined";
    os << " " << unit << std::endl;
    os << "  " << std::setprecision(0) << std::fixed << ci.getLevel() * 100.0 << "% CI"
       << std::defaultfloat << std::setprecision(6)
       << "          : [" << ci.getLower() << ", " << ci.getUpper() << "]" << std::endl;
}

void ReportPrinter::print(const RegressionReport& report, std::ostream& os)
{
    const std::string unit = analysis::toString(report.getUnit());
    const auto& est = report.getEstimate();
    const auto& plan = report.getPlan();
    const auto& ctx = report.getContext();

    const std::streamsize savedPrecision = os.precision(6);

    writeSectionHeader(os, "Benchmark " + report.getBenchmarkId());

    os << "Current run" << std::endl;
    writeStatistics(os, report.getStatistics(), report.getInterval(), unit);
    os << "  bootstrap       : " << est.resamples << " resamples in " << est.shards
       << " shard(s), SE " << est.bootstrapStandardError << std::endl;
    if (report.getWarmupDiscarded() > 0)
        os << "  warmup dropped  : " << report.getWarmupDiscarded() << std::endl;

    os << "Sample size plan" << std::endl;
    os << "  detect " << plan.effect_size_target * 100.0 << "% change at power "
       << plan.power << ", alpha " << plan.alpha << std::endl;
    os << "  minimum n       : " << plan.minimum_n
       << " (recommended " << plan.recommended_n << ")" << std::endl;
    if (report.getPlannedMinimumSamples() != plan.minimum_n)
        os << "  override n      : " << report.getPlannedMinimumSamples() << std::endl;
    if (const auto power = report.getAchievedPower())
    {
        os << "  achieved power  : " << *power << " (detects "
           << *report.getMinimumDetectableEffect() * 100.0 << "% change)" << std::endl;
    }
    if (report.getStatistics().getSampleSize() < plan.recommended_n)
        os << "  note            : fewer samples than recommended" << std::endl;

    if (report.getBaseline())
    {
        const auto& baseline = *report.getBaseline();
        os << "Baseline " << baseline.getDateTag()
           << " (commit " << baseline.getContext().getCommitHash() << ")" << std::endl;
        writeStatistics(os, baseline.getStatistics(), baseline.getInterval(), unit);

        const auto& v = *report.getVerdict();
        os << "Verdict" << std::endl;
        os << "  classification  : " << regression::toString(v.getClassification());
        if (v.isWeakSignal())
            os << " (weak signal)";
        os << std::endl;

        os << "  criteria held   : ";
        if (v.getCriteria().empty())
            os << "none";
        bool first = true;
        for (auto c : v.getCriteria())
        {
            os << (first ? "" : ", ") << regression::toString(c);
            first = false;
        }
        os << std::endl;

        os << "  mean shift      : " << formatSigned(v.getMeanShiftSigmas()) << " sigma" << std::endl;
        if (v.getEffectSize())
            os << "  effect size     : d = " << formatSigned(v.getEffectSize()->cohens_d)
               << " (" << analysis::toString(v.getEffectSize()->bucket) << ")" << std::endl;
        os << "  rationale       : " << v.getRationale() << std::endl;
    }
    else
    {
        os << "Baseline        : none stored; run is a baseline candidate" << std::endl;
    }

    os << "Provenance" << std::endl;
    os << "  seed            : " << ctx.getSeed() << std::endl;
    os << "  commit          : " << ctx.getCommitHash() << std::endl;
    os << "  hardware        : " << ctx.getHardwareTag() << std::endl;
    os << "  environment     : " << ctx.getEnvironment().toString()
       << " [" << ctx.getEnvironment().getDigestHex() << "]" << std::endl;
    os << "  timestamp       : " << ctx.getTimestampIso8601() << std::endl;

    os.precision(savedPrecision);
}

} // namespace reporting
} // namespace benchstat
