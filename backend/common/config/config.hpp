#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace config {

struct ServerConfig {
  std::string host;
  unsigned short port;
  std::size_t worker_threads;
  std::string environment;
};

struct ResolverConfig {
  std::string endpoint;
  std::chrono::milliseconds timeout;
  int max_attempts;
  std::chrono::milliseconds retry_delay;
  std::vector<int> retry_status_codes;  // exact codes, 5xx is always retried
};

struct FetcherConfig {
  std::chrono::milliseconds timeout;
  std::size_t max_content_length;
};

struct LogConfig {
  std::string level;
  std::string pattern;
};

// Returns name when spdlog knows the level, otherwise "info" (with a warning).
std::string validLogLevel(const std::string& name);

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const ServerConfig& getServer() const { return server_; }
const ResolverConfig& getResolver() const { return resolver_; }
const FetcherConfig& getFetcher() const { return fetcher_; }
const LogConfig& getLog() const { return log_; }
const std::string& getUserAgent() const { return user_agent_; }
bool isDevelopment() const { return server_.environment == "development"; }

private:
  Config();

  ServerConfig server_;
  ResolverConfig resolver_;
  FetcherConfig fetcher_;
  LogConfig log_;
  std::string user_agent_;
};

} // namespace config
