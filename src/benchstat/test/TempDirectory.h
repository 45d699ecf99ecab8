#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

// Scratch directory removed (recursively) when the fixture goes out of scope.
namespace benchstat_test
{
  class TempDirectory
  {
  public:
    explicit TempDirectory(const std::string& prefix)
    {
      static std::atomic<unsigned> counter{0};
      const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
      m_path = std::filesystem::temp_directory_path() /
               (prefix + "-" + std::to_string(stamp) + "-" + std::to_string(counter++));
      std::filesystem::create_directories(m_path);
    }

    ~TempDirectory()
    {
      std::error_code ec;
      std::filesystem::remove_all(m_path, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }

  private:
    std::filesystem::path m_path;
  };
}
