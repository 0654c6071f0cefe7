#pragma once

#include "error_codes.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace subscout {
namespace http {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

class HttpResponse {
public:
    static void sendSuccess(httplib::Response& res, const nlohmann::json& data);

    static void sendError(httplib::Response& res, ErrorCode code);

    static void sendError(httplib::Response& res,
                         ErrorCode code,
                         const nlohmann::json& details);

    static void sendError(httplib::Response& res,
                         ErrorCode code,
                         const std::string& custom_message,
                         const nlohmann::json& details = nlohmann::json());

    static void applyHeaders(httplib::Response& res, const HeaderList& headers);

    // Disables caching and proxy buffering so events reach the client as they are written.
    static void prepareEventStream(httplib::Response& res);
};

}}
