#include "subscout/common/paths.hpp"
#include "subscout/common/constants.hpp"
#include <unistd.h>
#include <filesystem>
#include <cstdlib>
#include <cstring>

namespace subscout {
namespace common {

namespace {

// $<variable> when set, otherwise $HOME/<home_relative>.
std::string xdgBase(const char* variable, const char* home_relative) {
    const char* xdg = std::getenv(variable);
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/" + home_relative : "";
}

}

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

PathManager::PathManager() {
    mode_ = detectMode();
}

InstallMode PathManager::detectMode() {
    std::error_code ec;
    std::string exe_path = std::filesystem::read_symlink("/proc/self/exe", ec).parent_path();

    if (ec) {
        return getuid() == 0 ? InstallMode::SYSTEM : InstallMode::USER;
    }

    if (exe_path.find("/usr/") == 0 || exe_path.find("/opt/") == 0) {
        return InstallMode::SYSTEM;
    }

    const char* home = std::getenv("HOME");
    if (home && exe_path.find(std::string(home)) == 0) {
        return InstallMode::USER;
    }

    return InstallMode::PORTABLE;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (strlen(env) > 0) {
            paths.push_back(env);
        }
    }

    paths.push_back(getConfigFile());

    return paths;
}

std::string PathManager::getConfigDir() const {
    switch (mode_) {
        case InstallMode::SYSTEM:
            return "/etc/subscout";
        case InstallMode::USER:
            return xdgBase("XDG_CONFIG_HOME", ".config") + "/subscout";
        case InstallMode::PORTABLE:
            return "./config";
    }
    return "";
}

std::string PathManager::getDataDir() const {
    switch (mode_) {
        case InstallMode::SYSTEM:
            return "/var/lib/subscout";
        case InstallMode::USER:
            return xdgBase("XDG_DATA_HOME", ".local/share") + "/subscout";
        case InstallMode::PORTABLE:
            return "./data";
    }
    return "";
}

std::string PathManager::getLogDir() const {
    switch (mode_) {
        case InstallMode::SYSTEM:
            return "/var/log/subscout";
        case InstallMode::USER:
            return xdgBase("XDG_STATE_HOME", ".local/state") + "/subscout";
        case InstallMode::PORTABLE:
            return "./logs";
    }
    return "";
}

std::string PathManager::getConfigFile() const {
    return getConfigDir() + "/subscout.toml";
}

}}
