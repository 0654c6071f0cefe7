#pragma once

#include <string>
#include <vector>
#include <optional>

namespace subscout {
namespace common {

// Canonical ASCII form of a hostname, or nullopt when the input cannot be one.
// Strips a leading "*." label and surrounding dots, lowercases, applies UTS#46
// IDNA encoding and checks RFC 1123 label syntax.
std::optional<std::string> normalizeHostname(const std::string& raw);

// Like normalizeHostname, but the result must contain at least one dot.
std::optional<std::string> sanitizeDomain(const std::string& raw);

bool isSubdomain(const std::string& candidate, const std::string& root);

// Splits a certificate name_value field into individual names. Names keep
// their case; a single leading wildcard label is removed.
std::vector<std::string> splitCertificateNames(const std::string& name_value);

std::vector<std::string> uniqueEverseen(const std::vector<std::string>& items);

std::vector<std::vector<std::string>> chunked(const std::vector<std::string>& items, int size);

std::string toLower(std::string value);
std::string trim(const std::string& value);

}}
