#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>

#include <sys/utsname.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "RngUtils.h"
#include "TimestampFormat.h"

namespace benchstat
{
  namespace regression
  {
    /**
     * @brief Toolchain and host description captured once per run.
     */
    class EnvironmentFingerprint
    {
    public:
      EnvironmentFingerprint(std::string compiler,
                             std::string osName,
                             std::string osRelease,
                             std::string machine,
                             unsigned logicalCpus)
        : m_compiler(std::move(compiler)),
          m_osName(std::move(osName)),
          m_osRelease(std::move(osRelease)),
          m_machine(std::move(machine)),
          m_logicalCpus(logicalCpus)
      {}

      /// Describe the current process: compiler, uname(2) fields, CPU count.
      static EnvironmentFingerprint capture()
      {
#if defined(__VERSION__)
        std::string compiler = __VERSION__;
#else
        std::string compiler = "unknown";
#endif
        std::string osName = "unknown";
        std::string osRelease = "unknown";
        std::string machine = "unknown";

        struct utsname info;
        if (uname(&info) == 0)
          {
            osName = info.sysname;
            osRelease = info.release;
            machine = info.machine;
          }

        return EnvironmentFingerprint(compiler, osName, osRelease, machine,
                                      std::thread::hardware_concurrency());
      }

      const std::string& getCompiler() const noexcept { return m_compiler; }
      const std::string& getOsName() const noexcept { return m_osName; }
      const std::string& getOsRelease() const noexcept { return m_osRelease; }
      const std::string& getMachine() const noexcept { return m_machine; }
      unsigned getLogicalCpus() const noexcept { return m_logicalCpus; }

      /// Stable digest of all fields; equal environments give equal digests.
      uint64_t getDigest() const noexcept
      {
        return rng_utils::hash_combine64({
            rng_utils::digest_bytes(m_compiler),
            rng_utils::digest_bytes(m_osName),
            rng_utils::digest_bytes(m_osRelease),
            rng_utils::digest_bytes(m_machine),
            static_cast<uint64_t>(m_logicalCpus)
          });
      }

      std::string getDigestHex() const
      {
        std::ostringstream os;
        os << std::hex << std::setw(16) << std::setfill('0') << getDigest();
        return os.str();
      }

      std::string toString() const
      {
        std::ostringstream os;
        os << m_osName << " " << m_osRelease << " " << m_machine
           << ", " << m_logicalCpus << " cpu(s), " << m_compiler;
        return os.str();
      }

      bool operator==(const EnvironmentFingerprint& rhs) const
      {
        return m_compiler == rhs.m_compiler && m_osName == rhs.m_osName &&
               m_osRelease == rhs.m_osRelease && m_machine == rhs.m_machine &&
               m_logicalCpus == rhs.m_logicalCpus;
      }

      bool operator!=(const EnvironmentFingerprint& rhs) const
      {
        return !(*this == rhs);
      }

    private:
      std::string m_compiler;
      std::string m_osName;
      std::string m_osRelease;
      std::string m_machine;
      unsigned    m_logicalCpus;
    };

    /**
     * @brief Provenance attached read-only to every statistic and report of a run.
     *
     * Built once per invocation from explicit inputs; nothing here is read
     * from the process environment except the host description in capture().
     */
    class ReproducibilityContext
    {
    public:
      ReproducibilityContext(uint64_t seed,
                             EnvironmentFingerprint environment,
                             std::string commitHash,
                             std::string hardwareTag,
                             boost::posix_time::ptime timestamp)
        : m_seed(seed),
          m_environment(std::move(environment)),
          m_commitHash(std::move(commitHash)),
          m_hardwareTag(std::move(hardwareTag)),
          m_timestamp(timestamp)
      {
        if (m_timestamp.is_special())
          throw InvalidParameterException("ReproducibilityContext", "", "timestamp",
                                          "must be a real point in time");
      }

      static ReproducibilityContext capture(uint64_t seed,
                                            std::string commitHash,
                                            std::string hardwareTag)
      {
        return ReproducibilityContext(seed,
                                      EnvironmentFingerprint::capture(),
                                      std::move(commitHash),
                                      std::move(hardwareTag),
                                      currentUtcSeconds());
      }

      uint64_t getSeed() const noexcept { return m_seed; }
      const EnvironmentFingerprint& getEnvironment() const noexcept { return m_environment; }
      const std::string& getCommitHash() const noexcept { return m_commitHash; }
      const std::string& getHardwareTag() const noexcept { return m_hardwareTag; }
      const boost::posix_time::ptime& getTimestamp() const noexcept { return m_timestamp; }

      std::string getTimestampIso8601() const
      {
        return toIso8601(m_timestamp);
      }

      bool operator==(const ReproducibilityContext& rhs) const
      {
        return m_seed == rhs.m_seed && m_environment == rhs.m_environment &&
               m_commitHash == rhs.m_commitHash && m_hardwareTag == rhs.m_hardwareTag &&
               m_timestamp == rhs.m_timestamp;
      }

      bool operator!=(const ReproducibilityContext& rhs) const
      {
        return !(*this == rhs);
      }

    private:
      uint64_t                 m_seed;
      EnvironmentFingerprint   m_environment;
      std::string              m_commitHash;
      std::string              m_hardwareTag;
      boost::posix_time::ptime m_timestamp;
    };
  } // namespace regression
} // namespace benchstat
