#include "apisim/common/JsonUtil.h"

#include <sstream>

namespace apisim {
namespace common {

std::string ToCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

bool ParseJson(const std::string& text, Json::Value* out, std::string* errors) {
    Json::CharReaderBuilder builder;
    std::istringstream stream(text);
    std::string errs;
    if (!Json::parseFromStream(builder, stream, out, &errs)) {
        if (errors) *errors = errs;
        return false;
    }
    return true;
}

std::string ErrorBody(const std::string& code, const std::string& message) {
    Json::Value error(Json::objectValue);
    error["code"] = code;
    error["message"] = message;
    Json::Value body(Json::objectValue);
    body["error"] = error;
    return ToCompactJson(body);
}

} // namespace common
} // namespace apisim
