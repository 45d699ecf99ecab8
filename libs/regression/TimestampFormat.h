#pragma once

#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "BenchStatException.h"

namespace benchstat
{
  namespace regression
  {
    /// Current UTC time truncated to whole seconds.
    inline boost::posix_time::ptime currentUtcSeconds()
    {
      return boost::posix_time::second_clock::universal_time();
    }

    /// "2026-10-19T08:30:00Z"
    inline std::string toIso8601(const boost::posix_time::ptime& t)
    {
      return boost::posix_time::to_iso_extended_string(t) + "Z";
    }

    /**
     * @brief Parse the ISO-8601 extended form written by toIso8601().
     *
     * A trailing 'Z' is accepted and ignored; all stored times are UTC.
     */
    inline boost::posix_time::ptime fromIso8601(const std::string& text)
    {
      std::string body = text;
      if (!body.empty() && body.back() == 'Z')
        body.pop_back();

      boost::posix_time::ptime t;
      try
        {
          t = boost::posix_time::from_iso_extended_string(body);
        }
      catch (const std::exception& e)
        {
          throw InvalidParameterException("fromIso8601", "", "timestamp",
                                          "cannot parse '" + text + "': " + e.what());
        }

      if (t.is_special())
        throw InvalidParameterException("fromIso8601", "", "timestamp",
                                        "'" + text + "' is not a valid time");
      return t;
    }

    /// Compact sortable key for a record time, e.g. "20261019T083000".
    inline std::string toDateTag(const boost::posix_time::ptime& t)
    {
      return boost::posix_time::to_iso_string(t);
    }
  } // namespace regression
} // namespace benchstat
