#include "subscout/common/hostname.hpp"
#include <idn2.h>
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace subscout {
namespace common {

namespace {

constexpr size_t MAX_HOSTNAME_LENGTH = 253;
constexpr size_t MAX_LABEL_LENGTH = 63;

bool isAscii(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
        [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

bool isValidLabel(const std::string& label) {
    if (label.empty() || label.size() > MAX_LABEL_LENGTH) {
        return false;
    }
    if (label.front() == '-' || label.back() == '-') {
        return false;
    }
    return std::all_of(label.begin(), label.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

bool isValidAsciiHostname(const std::string& name) {
    if (name.empty() || name.size() > MAX_HOSTNAME_LENGTH) {
        return false;
    }

    size_t start = 0;
    while (true) {
        size_t dot = name.find('.', start);
        std::string label = name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!isValidLabel(label)) {
            return false;
        }
        if (dot == std::string::npos) {
            return true;
        }
        start = dot + 1;
    }
}

std::optional<std::string> toAscii(const std::string& name) {
    if (isAscii(name)) {
        return name;
    }

    char* output = nullptr;
    int rc = idn2_to_ascii_8z(name.c_str(), &output, IDN2_NFC_INPUT | IDN2_NONTRANSITIONAL);
    if (rc != IDN2_OK || output == nullptr) {
        if (output) idn2_free(output);
        return std::nullopt;
    }

    std::string result(output);
    idn2_free(output);
    return toLower(result);
}

std::string stripDots(const std::string& value) {
    auto begin = value.find_first_not_of('.');
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of('.');
    return value.substr(begin, end - begin + 1);
}

std::string stripTrailingDots(std::string value) {
    while (!value.empty() && value.back() == '.') {
        value.pop_back();
    }
    return value;
}

}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

std::optional<std::string> normalizeHostname(const std::string& raw) {
    std::string value = toLower(trim(raw));
    if (value.empty()) {
        return std::nullopt;
    }

    if (value.rfind("*.", 0) == 0) {
        value.erase(0, 2);
    }

    value = stripDots(value);
    if (value.empty()) {
        return std::nullopt;
    }

    bool has_forbidden = std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return c == '\0' || std::isspace(c);
    });
    if (has_forbidden) {
        return std::nullopt;
    }

    auto ascii = toAscii(value);
    if (!ascii) {
        return std::nullopt;
    }

    std::string name = stripTrailingDots(*ascii);
    if (!isValidAsciiHostname(name)) {
        return std::nullopt;
    }

    return name;
}

std::optional<std::string> sanitizeDomain(const std::string& raw) {
    auto normalized = normalizeHostname(raw);
    if (!normalized || normalized->find('.') == std::string::npos) {
        return std::nullopt;
    }
    return normalized;
}

bool isSubdomain(const std::string& candidate, const std::string& root) {
    std::string c = toLower(stripTrailingDots(candidate));
    std::string r = toLower(stripTrailingDots(root));

    if (c == r) {
        return true;
    }

    std::string suffix = "." + r;
    return c.size() > suffix.size() &&
           c.compare(c.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> splitCertificateNames(const std::string& name_value) {
    std::vector<std::string> names;

    size_t start = 0;
    while (start <= name_value.size()) {
        size_t end = name_value.find_first_of("\r\n", start);
        std::string token = trim(name_value.substr(start, end == std::string::npos ? std::string::npos : end - start));

        if (!token.empty()) {
            if (token.rfind("*.", 0) == 0) {
                token.erase(0, 2);
            }
            names.push_back(token);
        }

        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    return names;
}

std::vector<std::string> uniqueEverseen(const std::vector<std::string>& items) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> output;
    output.reserve(items.size());

    for (const auto& item : items) {
        if (seen.insert(item).second) {
            output.push_back(item);
        }
    }

    return output;
}

std::vector<std::vector<std::string>> chunked(const std::vector<std::string>& items, int size) {
    size_t chunk_size = size <= 0 ? 1 : static_cast<size_t>(size);
    std::vector<std::vector<std::string>> chunks;

    for (size_t i = 0; i < items.size(); i += chunk_size) {
        auto last = std::min(items.size(), i + chunk_size);
        chunks.emplace_back(items.begin() + i, items.begin() + last);
    }

    return chunks;
}

}}
