#pragma once

#include <optional>
#include <string>
#include <vector>

#include "BaselineRecord.h"

namespace benchstat
{
  namespace regression
  {
    /**
     * @brief Read/write contract the analysis needs from a baseline store.
     *
     * Implementations are append-only: save() adds a dated record and moves
     * the benchmark's "latest" pointer to the newest record in one atomic
     * step. Saving a (benchmark id, date tag) that already exists fails.
     * Every failure is reported as StoreException.
     */
    class IBaselineStore
    {
    public:
      virtual ~IBaselineStore() = default;

      /// Record the "latest" pointer refers to, or nullopt if none exists.
      virtual std::optional<BaselineRecord> load(const std::string& benchmarkId) const = 0;

      /// Historical record with the given date tag, or nullopt.
      virtual std::optional<BaselineRecord> load(const std::string& benchmarkId,
                                                 const std::string& dateTag) const = 0;

      virtual void save(const BaselineRecord& record) = 0;

      /// Date tags of every stored record for the benchmark, oldest first.
      virtual std::vector<std::string> history(const std::string& benchmarkId) const = 0;
    };
  } // namespace regression
} // namespace benchstat
