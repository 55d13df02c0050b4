#pragma once

#include <epoch_monitor/report/report_base.h>
#include <filesystem>
#include <string>

namespace epoch_monitor::test {

// Unique directory under the system temp path, removed on destruction.
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "epoch_monitor_test")
        : m_path(std::filesystem::temp_directory_path() / (prefix + "_" + report::GenerateId())) {
        std::filesystem::create_directories(m_path);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& Path() const { return m_path; }

    std::filesystem::path operator/(const std::string& name) const { return m_path / name; }

private:
    std::filesystem::path m_path;
};

}  // namespace epoch_monitor::test
