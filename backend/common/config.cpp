#include "common/config/config.hpp"
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <string_view>
#include <system_error>
#include <spdlog/spdlog.h>

namespace config {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  return value;
}

template <typename T>
T envNumberOr(const char* name, T fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  std::string_view text(value);
  T parsed{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc{} || ptr != text.data() + text.size() || parsed == 0) {
    spdlog::warn("Ignoring invalid value for {}: '{}'", name, text);
    return fallback;
  }
  return parsed;
}

} // namespace

std::string validLogLevel(const std::string& name) {
  // from_str maps unknown names to "off"
  if (name != "off" && spdlog::level::from_str(name) == spdlog::level::off) {
    spdlog::warn("Ignoring unknown LOG_LEVEL '{}', using 'info'", name);
    return "info";
  }
  return name;
}

  Config::Config() {
    server_ = {
      .host = envOr("HOST", "0.0.0.0"),
      .port = envNumberOr<unsigned short>("PORT", 3000),
      .worker_threads = envNumberOr<std::size_t>("WORKER_THREADS", 8),
      .environment = envOr("APP_ENV", "production")
    };

    resolver_ = {
      .endpoint = envOr("RESOLVER_ENDPOINT", "https://pragyaninstagr.vercel.app/"),
      .timeout = std::chrono::milliseconds(15000),
      .max_attempts = 3,
      .retry_delay = std::chrono::milliseconds(1000),
      .retry_status_codes = {408, 429}
    };

    fetcher_ = {
      .timeout = std::chrono::milliseconds(30000),
      .max_content_length = 100 * 1024 * 1024
    };

    log_ = {
      .level = validLogLevel(envOr("LOG_LEVEL", "info")),
      .pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"
    };

    user_agent_ = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                  "(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";
  }
}
