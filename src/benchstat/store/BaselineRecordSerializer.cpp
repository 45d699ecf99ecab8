#include "BaselineRecordSerializer.h"

#include <cmath>
#include <limits>

#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "BenchStatException.h"
#include "TimestampFormat.h"

using namespace rapidjson;

namespace benchstat
{
namespace store
{

using regression::BaselineRecord;
using regression::EnvironmentFingerprint;
using regression::ReproducibilityContext;

namespace
{
    const char* kOp = "BaselineRecordSerializer::fromJson";

    const Value& member(const Value& obj, const char* name, const std::string& id)
    {
        auto it = obj.FindMember(name);
        if (it == obj.MemberEnd())
            throw StoreException(kOp, id, std::string("missing field '") + name + "'");
        return it->value;
    }

    std::string getString(const Value& obj, const char* name, const std::string& id)
    {
        const Value& v = member(obj, name, id);
        if (!v.IsString())
            throw StoreException(kOp, id, std::string("field '") + name + "' must be a string");
        return std::string(v.GetString(), v.GetStringLength());
    }

    double getDouble(const Value& obj, const char* name, const std::string& id)
    {
        const Value& v = member(obj, name, id);
        if (!v.IsNumber())
            throw StoreException(kOp, id, std::string("field '") + name + "' must be a number");
        return v.GetDouble();
    }

    uint64_t getUint64(const Value& obj, const char* name, const std::string& id)
    {
        const Value& v = member(obj, name, id);
        if (!v.IsUint64())
            throw StoreException(kOp, id, std::string("field '") + name +
                                 "' must be a non-negative integer");
        return v.GetUint64();
    }
}

Value BaselineRecordSerializer::toValue(const BaselineRecord& record,
                                        Document::AllocatorType& allocator)
{
    const auto& stats = record.getStatistics();
    const auto& ci = record.getInterval();
    const auto& ctx = record.getContext();
    const auto& env = ctx.getEnvironment();

    Value obj(kObjectType);
    obj.AddMember("benchmark_id", Value(record.getBenchmarkId().c_str(), allocator), allocator);
    obj.AddMember("unit", Value(analysis::toString(record.getUnit()).c_str(), allocator), allocator);
    obj.AddMember("mean", stats.getMean(), allocator);
    if (stats.hasStddev())
        obj.AddMember("stddev", stats.getStddev(), allocator);
    else
        obj.AddMember("stddev", Value(kNullType), allocator);
    obj.AddMember("n", static_cast<uint64_t>(stats.getSampleSize()), allocator);

    obj.AddMember("ci_lower", ci.getLower(), allocator);
    obj.AddMember("ci_point", ci.getPointEstimate(), allocator);
    obj.AddMember("ci_upper", ci.getUpper(), allocator);
    obj.AddMember("ci_level", ci.getLevel(), allocator);

    obj.AddMember("bootstrap_resamples", static_cast<uint64_t>(record.getBootstrapResamples()), allocator);
    obj.AddMember("planned_minimum_n", static_cast<uint64_t>(record.getPlannedMinimumSamples()), allocator);

    obj.AddMember("seed", ctx.getSeed(), allocator);
    obj.AddMember("commit_hash", Value(ctx.getCommitHash().c_str(), allocator), allocator);
    obj.AddMember("hardware_tag", Value(ctx.getHardwareTag().c_str(), allocator), allocator);
    obj.AddMember("timestamp", Value(ctx.getTimestampIso8601().c_str(), allocator), allocator);

    Value envObj(kObjectType);
    envObj.AddMember("compiler", Value(env.getCompiler().c_str(), allocator), allocator);
    envObj.AddMember("os_name", Value(env.getOsName().c_str(), allocator), allocator);
    envObj.AddMember("os_release", Value(env.getOsRelease().c_str(), allocator), allocator);
    envObj.AddMember("machine", Value(env.getMachine().c_str(), allocator), allocator);
    envObj.AddMember("logical_cpus", env.getLogicalCpus(), allocator);
    obj.AddMember("environment", envObj, allocator);

    return obj;
}

std::string BaselineRecordSerializer::toJson(const BaselineRecord& record)
{
    Document doc;
    const Value obj = toValue(record, doc.GetAllocator());

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    obj.Accept(writer);
    return buffer.GetString();
}

BaselineRecord BaselineRecordSerializer::fromJson(const std::string& json)
{
    Document doc;
    doc.Parse<kParseFullPrecisionFlag>(json.c_str());
    if (doc.HasParseError())
    {
        throw StoreException(kOp, "", std::string("JSON parse error at offset ") +
                             std::to_string(doc.GetErrorOffset()) + ": " +
                             GetParseError_En(doc.GetParseError()));
    }
    return fromValue(doc);
}

BaselineRecord BaselineRecordSerializer::fromValue(const Value& json)
{
    if (!json.IsObject())
        throw StoreException(kOp, "", "baseline record must be a JSON object");

    const std::string id = getString(json, "benchmark_id", "");
    const std::size_t n = static_cast<std::size_t>(getUint64(json, "n", id));

    const Value& stddevValue = member(json, "stddev", id);
    double stddev = std::numeric_limits<double>::quiet_NaN();
    if (!stddevValue.IsNull())
    {
        if (!stddevValue.IsNumber())
            throw StoreException(kOp, id, "field 'stddev' must be a number or null");
        stddev = stddevValue.GetDouble();
    }

    const Value& envJson = member(json, "environment", id);
    if (!envJson.IsObject())
        throw StoreException(kOp, id, "field 'environment' must be an object");

    // Value-level validation failures become store errors: the file is corrupt.
    try
    {
        const auto unit = analysis::metricUnitFromString(getString(json, "unit", id));
        const auto stats = analysis::SummaryStatistics::fromMoments(getDouble(json, "mean", id), stddev, n);
        const analysis::ConfidenceInterval ci(getDouble(json, "ci_lower", id),
                                              getDouble(json, "ci_point", id),
                                              getDouble(json, "ci_upper", id),
                                              getDouble(json, "ci_level", id));

        EnvironmentFingerprint env(getString(envJson, "compiler", id),
                                   getString(envJson, "os_name", id),
                                   getString(envJson, "os_release", id),
                                   getString(envJson, "machine", id),
                                   static_cast<unsigned>(getUint64(envJson, "logical_cpus", id)));

        ReproducibilityContext ctx(getUint64(json, "seed", id),
                                   env,
                                   getString(json, "commit_hash", id),
                                   getString(json, "hardware_tag", id),
                                   regression::fromIso8601(getString(json, "timestamp", id)));

        return BaselineRecord(id, unit, stats, ci,
                              static_cast<std::size_t>(getUint64(json, "bootstrap_resamples", id)),
                              static_cast<std::size_t>(getUint64(json, "planned_minimum_n", id)),
                              ctx);
    }
    catch (const InvalidParameterException& e)
    {
        throw StoreException(kOp, id, std::string("invalid record: ") + e.what());
    }
    catch (const InsufficientSamplesException& e)
    {
        throw StoreException(kOp, id, std::string("invalid record: ") + e.what());
    }
}

} // namespace store
} // namespace benchstat
