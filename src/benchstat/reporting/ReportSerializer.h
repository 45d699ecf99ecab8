#pragma once

#include <string>

#include <rapidjson/document.h>

#include "RegressionReport.h"

namespace benchstat
{
namespace reporting
{

/**
 * @brief JSON rendering of a RegressionReport with an embedded checksum.
 *
 * The "checksum" member is the 64-bit digest (16 hex digits) of the compact
 * serialization of every other member, in document order. Non-finite numbers
 * (an undefined mean shift, an infinite effect size) are written as null or
 * as the strings "+inf" / "-inf".
 */
class ReportSerializer
{
public:
    static std::string toJson(const RegressionReport& report);

    /// Checksum the report would carry.
    static std::string computeChecksum(const RegressionReport& report);

    /**
     * @brief Recompute the checksum of a stored report and compare.
     * @return false when the document is not valid JSON, has no checksum, or
     *         its content has changed since it was written
     */
    static bool verifyChecksum(const std::string& json);

private:
    static void buildDocument(const RegressionReport& report, rapidjson::Document& doc);
    static std::string checksumOf(const rapidjson::Value& content);
};

} // namespace reporting
} // namespace benchstat
