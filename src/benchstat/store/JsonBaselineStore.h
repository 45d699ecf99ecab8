#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "IBaselineStore.h"

namespace benchstat
{
namespace store
{

/**
 * @brief IBaselineStore backed by one JSON document per record.
 *
 * Layout under the root directory:
 *
 *   <root>/<benchmark_id>/<dateTag>.json   one immutable record each
 *   <root>/<benchmark_id>/LATEST           date tag of the newest record
 *
 * Records and the LATEST pointer are written to a temporary file and renamed
 * into place, so readers never observe a partial file. The pointer only
 * moves forward: saving a backdated record leaves it unchanged.
 */
class JsonBaselineStore : public regression::IBaselineStore
{
public:
    static constexpr const char* kLatestFileName = "LATEST";
    static constexpr const char* kRecordExtension = ".json";

    /// Creates @p root if it does not exist.
    explicit JsonBaselineStore(std::filesystem::path root);

    std::optional<regression::BaselineRecord> load(const std::string& benchmarkId) const override;

    std::optional<regression::BaselineRecord> load(const std::string& benchmarkId,
                                                   const std::string& dateTag) const override;

    void save(const regression::BaselineRecord& record) override;

    std::vector<std::string> history(const std::string& benchmarkId) const override;

    const std::filesystem::path& getRoot() const { return mRoot; }

private:
    std::filesystem::path benchmarkDir(const std::string& benchmarkId) const;
    std::optional<std::string> readLatestTag(const std::string& benchmarkId) const;

    static void writeAtomically(const std::filesystem::path& target,
                                const std::string& content,
                                const std::string& benchmarkId);
    static std::string readFile(const std::filesystem::path& path,
                                const std::string& benchmarkId);

    std::filesystem::path mRoot;
    mutable std::mutex mMutex;
};

} // namespace store
} // namespace benchstat
