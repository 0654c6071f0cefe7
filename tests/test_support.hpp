#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace subscout {
namespace test {

// Scratch directory removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "subscout_test") {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string write(const std::string& name, const std::string& content, bool executable = false) const {
        auto file = path_ / name;
        {
            std::ofstream out(file, std::ios::trunc);
            out << content;
        }
        if (executable) {
            chmod(file.c_str(), 0755);
        }
        return file.string();
    }

private:
    std::filesystem::path path_;
};

}}
