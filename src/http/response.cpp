#include "subscout/http/response.hpp"

namespace subscout {
namespace http {

void HttpResponse::sendSuccess(httplib::Response& res, const nlohmann::json& data) {
    nlohmann::json envelope;
    envelope["success"] = true;
    envelope["data"] = data;
    res.status = 200;
    res.set_content(envelope.dump(2), "application/json");
}

void HttpResponse::sendError(httplib::Response& res, ErrorCode code) {
    sendError(res, code, ErrorCodeHelper::getDefaultMessage(code), nlohmann::json());
}

void HttpResponse::sendError(httplib::Response& res, ErrorCode code, const nlohmann::json& details) {
    sendError(res, code, ErrorCodeHelper::getDefaultMessage(code), details);
}

void HttpResponse::sendError(httplib::Response& res, ErrorCode code, const std::string& custom_message, const nlohmann::json& details) {
    const auto& info = ErrorCodeHelper::getInfo(code);

    nlohmann::json error;
    error["code"] = info.code_str;
    error["message"] = custom_message.empty() ? std::string(info.default_message) : custom_message;
    if (!details.is_null() && !details.empty()) {
        error["details"] = details;
    }

    nlohmann::json envelope;
    envelope["success"] = false;
    envelope["error"] = std::move(error);

    res.status = info.http_status;
    res.set_content(envelope.dump(2), "application/json");
}

void HttpResponse::applyHeaders(httplib::Response& res, const HeaderList& headers) {
    for (const auto& [name, value] : headers) {
        res.set_header(name, value);
    }
}

void HttpResponse::prepareEventStream(httplib::Response& res) {
    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
}

}}
