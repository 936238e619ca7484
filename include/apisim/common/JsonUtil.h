#pragma once

#include <json/json.h>

#include <string>

namespace apisim {
namespace common {

// Single-line JSON text.
std::string ToCompactJson(const Json::Value& value);

// False (with the reader's message in *errors when given) on malformed input.
bool ParseJson(const std::string& text, Json::Value* out, std::string* errors = nullptr);

// {"error": {"code": code, "message": message}}
std::string ErrorBody(const std::string& code, const std::string& message);

} // namespace common
} // namespace apisim
