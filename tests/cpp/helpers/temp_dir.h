#pragma once

#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

#include "gtest/gtest.h"

namespace diarizer {
namespace test {

// Per-test scratch directory under the system temp dir, removed on destruction
class TempDir {
   public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "scratch";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        path_ = std::filesystem::temp_directory_path() /
                ("diarizer_test_" + name + "_" + std::to_string(getpid()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const {
        return path_;
    }

    std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

    // Regular files currently in the directory
    size_t fileCount() const {
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            if (entry.is_regular_file()) {
                ++count;
            }
        }
        return count;
    }

   private:
    std::filesystem::path path_;
};

}  // namespace test
}  // namespace diarizer
