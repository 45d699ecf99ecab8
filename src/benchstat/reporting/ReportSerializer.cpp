#include "ReportSerializer.h"

#include <cmath>
#include <iomanip>
#include <sstream>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "BaselineRecordSerializer.h"
#include "RngUtils.h"

using namespace rapidjson;

namespace benchstat
{
namespace reporting
{

namespace
{
    const char* kChecksumMember = "checksum";

    Value numberOrMarker(double x, Document::AllocatorType& allocator)
    {
        if (std::isnan(x))
            return Value(kNullType);
        if (std::isinf(x))
            return Value(x > 0.0 ? "+inf" : "-inf", allocator);
        return Value(x);
    }

    Value stringValue(const std::string& s, Document::AllocatorType& allocator)
    {
        return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
    }
}

void ReportSerializer::buildDocument(const RegressionReport& report, Document& doc)
{
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    const auto& est = report.getEstimate();
    const auto& stats = report.getStatistics();
    const auto& ci = report.getInterval();
    const auto& plan = report.getPlan();
    const auto& ctx = report.getContext();
    const auto& env = ctx.getEnvironment();

    doc.AddMember("benchmark_id", stringValue(report.getBenchmarkId(), allocator), allocator);
    doc.AddMember("unit", stringValue(analysis::toString(report.getUnit()), allocator), allocator);

    Value interval(kObjectType);
    interval.AddMember("lower", ci.getLower(), allocator);
    interval.AddMember("point", ci.getPointEstimate(), allocator);
    interval.AddMember("upper", ci.getUpper(), allocator);
    interval.AddMember("level", ci.getLevel(), allocator);

    Value bootstrap(kObjectType);
    bootstrap.AddMember("resamples", static_cast<uint64_t>(est.resamples), allocator);
    bootstrap.AddMember("shards", static_cast<uint64_t>(est.shards), allocator);
    bootstrap.AddMember("shard_size", static_cast<uint64_t>(est.shardSize), allocator);
    bootstrap.AddMember("standard_error", numberOrMarker(est.bootstrapStandardError, allocator), allocator);
    bootstrap.AddMember("replicate_min", est.replicateMin, allocator);
    bootstrap.AddMember("replicate_max", est.replicateMax, allocator);

    Value current(kObjectType);
    current.AddMember("n", static_cast<uint64_t>(stats.getSampleSize()), allocator);
    current.AddMember("mean", stats.getMean(), allocator);
    current.AddMember("stddev", numberOrMarker(stats.getStddev(), allocator), allocator);
    current.AddMember("ci", interval, allocator);
    current.AddMember("bootstrap", bootstrap, allocator);
    current.AddMember("warmup_discarded", static_cast<uint64_t>(report.getWarmupDiscarded()), allocator);
    doc.AddMember("current", current, allocator);

    Value planObj(kObjectType);
    planObj.AddMember("minimum_n", static_cast<uint64_t>(plan.minimum_n), allocator);
    planObj.AddMember("recommended_n", static_cast<uint64_t>(plan.recommended_n), allocator);
    planObj.AddMember("planned_minimum_n", static_cast<uint64_t>(report.getPlannedMinimumSamples()), allocator);
    planObj.AddMember("effect_size_target", plan.effect_size_target, allocator);
    planObj.AddMember("relative_stddev", plan.relative_stddev, allocator);
    planObj.AddMember("power", plan.power, allocator);
    planObj.AddMember("alpha", plan.alpha, allocator);
    planObj.AddMember("safety_multiplier", plan.safety_multiplier, allocator);
    if (const auto power = report.getAchievedPower())
    {
        planObj.AddMember("achieved_power", *power, allocator);
        planObj.AddMember("minimum_detectable_effect", *report.getMinimumDetectableEffect(), allocator);
    }
    doc.AddMember("plan", planObj, allocator);

    Value envObj(kObjectType);
    envObj.AddMember("compiler", stringValue(env.getCompiler(), allocator), allocator);
    envObj.AddMember("os_name", stringValue(env.getOsName(), allocator), allocator);
    envObj.AddMember("os_release", stringValue(env.getOsRelease(), allocator), allocator);
    envObj.AddMember("machine", stringValue(env.getMachine(), allocator), allocator);
    envObj.AddMember("logical_cpus", env.getLogicalCpus(), allocator);
    envObj.AddMember("digest", stringValue(env.getDigestHex(), allocator), allocator);

    Value provenance(kObjectType);
    provenance.AddMember("seed", ctx.getSeed(), allocator);
    provenance.AddMember("commit_hash", stringValue(ctx.getCommitHash(), allocator), allocator);
    provenance.AddMember("hardware_tag", stringValue(ctx.getHardwareTag(), allocator), allocator);
    provenance.AddMember("timestamp", stringValue(ctx.getTimestampIso8601(), allocator), allocator);
    provenance.AddMember("environment", envObj, allocator);
    doc.AddMember("provenance", provenance, allocator);

    if (report.getBaseline())
        doc.AddMember("baseline",
                      store::BaselineRecordSerializer::toValue(*report.getBaseline(), allocator),
                      allocator);
    else
        doc.AddMember("baseline", Value(kNullType), allocator);

    if (report.getVerdict())
    {
        const auto& v = *report.getVerdict();
        Value verdict(kObjectType);
        verdict.AddMember("classification", stringValue(regression::toString(v.getClassification()), allocator), allocator);

        Value criteria(kArrayType);
        for (auto c : v.getCriteria())
            criteria.PushBack(stringValue(regression::toString(c), allocator), allocator);
        verdict.AddMember("criteria", criteria, allocator);

        verdict.AddMember("weak_signal", v.isWeakSignal(), allocator);
        verdict.AddMember("mean_shift_sigmas", numberOrMarker(v.getMeanShiftSigmas(), allocator), allocator);
        if (v.getEffectSize())
        {
            Value effect(kObjectType);
            effect.AddMember("cohens_d", numberOrMarker(v.getEffectSize()->cohens_d, allocator), allocator);
            effect.AddMember("bucket", stringValue(analysis::toString(v.getEffectSize()->bucket), allocator), allocator);
            verdict.AddMember("effect_size", effect, allocator);
        }
        else
        {
            verdict.AddMember("effect_size", Value(kNullType), allocator);
        }
        verdict.AddMember("rationale", stringValue(v.getRationale(), allocator), allocator);
        doc.AddMember("verdict", verdict, allocator);
    }
    else
    {
        doc.AddMember("verdict", Value(kNullType), allocator);
    }
}

std::string ReportSerializer::checksumOf(const Value& content)
{
    StringBuffer buffer;
    Writer<StringBuffer> writer(buffer);
    content.Accept(writer);

    std::ostringstream os;
    os << std::hex << std::setw(16) << std::setfill('0')
       << rng_utils::digest_bytes(std::string(buffer.GetString(), buffer.GetSize()));
    return os.str();
}

std::string ReportSerializer::computeChecksum(const RegressionReport& report)
{
    Document doc;
    buildDocument(report, doc);
    return checksumOf(doc);
}

std::string ReportSerializer::toJson(const RegressionReport& report)
{
    Document doc;
    buildDocument(report, doc);
    const std::string checksum = checksumOf(doc);
    doc.AddMember(StringRef(kChecksumMember), stringValue(checksum, doc.GetAllocator()), doc.GetAllocator());

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

bool ReportSerializer::verifyChecksum(const std::string& json)
{
    Document doc;
    doc.Parse<kParseFullPrecisionFlag>(json.c_str());
    if (doc.HasParseError() || !doc.IsObject())
        return false;

    auto it = doc.FindMember(kChecksumMember);
    if (it == doc.MemberEnd() || !it->value.IsString())
        return false;

    const std::string stored(it->value.GetString(), it->value.GetStringLength());
    doc.EraseMember(it);
    return checksumOf(doc) == stored;
}

} // namespace reporting
} // namespace benchstat
