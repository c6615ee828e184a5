#pragma once
#include "application/download_service.hpp"
#include "common/restful/query_string.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include "domain/clock.hpp"
#include <memory>

namespace reel_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<ReelDownloadService> download_service,
                 std::shared_ptr<Clock> clock,
                 bool verbose_errors);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<ReelDownloadService> download_service_;
  std::shared_ptr<Clock> clock_;

  http::response<http::string_body> handleDownload(const common::RequestTarget &target);
  http::response<http::string_body> handleHealth();

  // One status code and body shape per error kind.
  http::response<http::string_body> createDownloadErrorResponse(const DownloadError &error);
};

} // namespace reel_service
