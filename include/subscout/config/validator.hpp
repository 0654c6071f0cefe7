#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace subscout {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    ValidationResult validateFile(const std::string& path);

    static bool validatePath(const std::string& path);
    static bool validatePort(uint16_t port);
    static bool validateUrl(const std::string& url);
    static bool canCreateDirectory(const std::string& path);
};

}}
