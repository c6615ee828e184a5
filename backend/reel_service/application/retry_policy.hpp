#pragma once
#include <algorithm>
#include <chrono>
#include <vector>
#include "common/config/config.hpp"

namespace reel_service {

// Fixed-delay retry for idempotent upstream GETs.
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds delay{1000};
  std::vector<int> retry_status_codes{408, 429};

  static RetryPolicy fromConfig(const config::ResolverConfig& cfg) {
    return RetryPolicy{cfg.max_attempts, cfg.retry_delay, cfg.retry_status_codes};
  }

  // 408, 429 and every 5xx by default.
  bool shouldRetry(long status) const {
    if (status >= 500 && status <= 599) {
      return true;
    }
    return std::find(retry_status_codes.begin(), retry_status_codes.end(), status)
           != retry_status_codes.end();
  }
};

}
