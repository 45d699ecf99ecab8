#pragma once

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "IBaselineStore.h"

namespace benchstat
{
  namespace regression
  {
    /**
     * @brief Process-local IBaselineStore.
     *
     * Records live in a per-benchmark map keyed by date tag (date tags sort
     * chronologically); a separate pointer table names the latest tag.
     */
    class InMemoryBaselineStore : public IBaselineStore
    {
    public:
      std::optional<BaselineRecord> load(const std::string& benchmarkId) const override
      {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto latest = m_latest.find(benchmarkId);
        if (latest == m_latest.end())
          return std::nullopt;
        return findLocked(benchmarkId, latest->second);
      }

      std::optional<BaselineRecord> load(const std::string& benchmarkId,
                                         const std::string& dateTag) const override
      {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return findLocked(benchmarkId, dateTag);
      }

      void save(const BaselineRecord& record) override
      {
        const std::string& id = record.getBenchmarkId();
        const std::string tag = record.getDateTag();

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto& dated = m_records[id];
        if (dated.count(tag) != 0)
          throw StoreException("InMemoryBaselineStore::save", id,
                               "record " + tag + " already exists; baselines are immutable");

        dated.emplace(tag, record);
        m_latest[id] = dated.rbegin()->first;
      }

      std::vector<std::string> history(const std::string& benchmarkId) const override
      {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<std::string> tags;
        auto it = m_records.find(benchmarkId);
        if (it != m_records.end())
          {
            for (const auto& entry : it->second)
              tags.push_back(entry.first);
          }
        return tags;
      }

    private:
      std::optional<BaselineRecord> findLocked(const std::string& benchmarkId,
                                               const std::string& dateTag) const
      {
        auto it = m_records.find(benchmarkId);
        if (it == m_records.end())
          return std::nullopt;
        auto rec = it->second.find(dateTag);
        if (rec == it->second.end())
          return std::nullopt;
        return rec->second;
      }

      mutable std::shared_mutex                                      m_mutex;
      std::map<std::string, std::map<std::string, BaselineRecord>>   m_records;
      std::map<std::string, std::string>                             m_latest;
    };
  } // namespace regression
} // namespace benchstat
