#pragma once

#include <string>
#include <vector>

namespace subscout {
namespace common {

enum class InstallMode {
    SYSTEM,
    USER,
    PORTABLE
};

class PathManager {
public:
    static PathManager& instance();

    InstallMode detectMode();

    std::string getConfigDir() const;
    std::string getDataDir() const;
    std::string getLogDir() const;

    std::string getConfigFile() const;
    std::vector<std::string> getConfigSearchPaths() const;

    bool isSystemMode() const { return mode_ == InstallMode::SYSTEM; }

private:
    PathManager();
    InstallMode mode_;
};

}}
