#include "rest_api_handler_base.hpp"

namespace common {

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& error,
  const std::optional<std::string>& message) {

  nlohmann::json error_json = {
    {"error", error}
  };
  if (message) {
    error_json["message"] = *message;
  }
  return createJsonResponse(status, error_json);
}

}
