#pragma once

#include <string>

#include <rapidjson/document.h>

#include "BaselineRecord.h"

namespace benchstat
{
namespace store
{

/**
 * @brief JSON form of a BaselineRecord.
 *
 * Schema (one object):
 *   benchmark_id, unit, mean, stddev (null when undefined), n,
 *   ci_lower, ci_point, ci_upper, ci_level, bootstrap_resamples,
 *   planned_minimum_n, seed, commit_hash, hardware_tag, timestamp (ISO-8601),
 *   environment { compiler, os_name, os_release, machine, logical_cpus }
 *
 * Doubles are written with round-trip precision and parsed with full
 * precision, so a record reloaded from JSON compares equal field by field.
 */
class BaselineRecordSerializer
{
public:
    static std::string toJson(const regression::BaselineRecord& record);

    /**
     * @throws benchstat::StoreException if the text is not valid JSON or a
     *         field is missing or has the wrong type
     */
    static regression::BaselineRecord fromJson(const std::string& json);

    static rapidjson::Value toValue(const regression::BaselineRecord& record,
                                    rapidjson::Document::AllocatorType& allocator);

    static regression::BaselineRecord fromValue(const rapidjson::Value& json);
};

} // namespace store
} // namespace benchstat
