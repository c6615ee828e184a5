#include "curl_http_client.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string_view>

namespace reel_service {

namespace {

constexpr long kMaxRedirects = 5;

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

std::string toLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

}

CurlHttpClient::CurlHttpClient() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize CURL");
  }
}

CurlHttpClient::~CurlHttpClient() {
  curl_global_cleanup();
}

std::expected<HttpResponse, std::string> CurlHttpClient::get(const HttpRequest& request) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    return std::unexpected("Failed to initialize CURL handle");
  }

  Transfer transfer;
  transfer.max_body_size = request.max_body_size;
  char error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &transfer);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, kMaxRedirects);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  if (request.timeout.count() > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  }
  if (request.max_body_size > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_MAXFILESIZE_LARGE,
                     static_cast<curl_off_t>(request.max_body_size));
  }

  struct curl_slist* raw_headers = nullptr;
  for (const auto& [name, value] : request.headers) {
    raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, &curl_slist_free_all);
  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  auto res = curl_easy_perform(curl.get());

  if (transfer.size_exceeded || res == CURLE_FILESIZE_EXCEEDED) {
    return std::unexpected("maxContentLength size of " +
                           std::to_string(request.max_body_size) + " exceeded");
  }
  if (res == CURLE_OPERATION_TIMEDOUT) {
    return std::unexpected("timeout of " + std::to_string(request.timeout.count()) + "ms exceeded");
  }
  if (res != CURLE_OK) {
    std::string message = curl_easy_strerror(res);
    if (error_buffer[0] != '\0') {
      message += ": ";
      message += error_buffer;
    }
    return std::unexpected(message);
  }

  HttpResponse response;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  response.headers = std::move(transfer.headers);
  response.body = std::move(transfer.body);
  return response;
}

size_t CurlHttpClient::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* transfer = static_cast<Transfer*>(userdata);
  size_t bytes = size * nmemb;
  if (transfer->max_body_size > 0 && transfer->body.size() + bytes > transfer->max_body_size) {
    transfer->size_exceeded = true;
    return 0;  // aborts the transfer with CURLE_WRITE_ERROR
  }
  transfer->body.append(ptr, bytes);
  return bytes;
}

size_t CurlHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* transfer = static_cast<Transfer*>(userdata);
  size_t bytes = size * nitems;
  std::string_view line(buffer, bytes);

  // A new status line starts the headers of the next response in a redirect chain.
  if (line.starts_with("HTTP/")) {
    transfer->headers.clear();
    return bytes;
  }

  auto colon = line.find(':');
  if (colon != std::string_view::npos) {
    transfer->headers[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
  }
  return bytes;
}

}
