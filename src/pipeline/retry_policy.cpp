#include "pipeline/retry_policy.hpp"
#include "pipeline/tile_error.hpp"
#include <thread>
#include <boost/log/trivial.hpp>

namespace deepzoom {
namespace pipeline {

bool RetryPolicy::is_retryable(const std::exception& error) const {
  if (const auto* tile_error = dynamic_cast<const TileError*>(&error)) {
    return tile_error->kind() != ErrorKind::DUPLICATE && tile_error->kind() != ErrorKind::FORMAT;
  }
  return true;
}

void RetryPolicy::notify_retry(int attempt, const std::exception& error) const {
  BOOST_LOG_TRIVIAL(warning) << "Retry policy: Attempt " << attempt << " of " << max_attempts()
                             << " failed: " << error.what();
  if (on_retry_) {
    on_retry_(attempt, error);
  }
}

void RetryPolicy::sleep(std::chrono::milliseconds duration) const {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

FixedDelayRetry::FixedDelayRetry(int attempts, std::chrono::milliseconds delay)
  : attempts_(attempts < 1 ? 1 : attempts)
  , delay_(delay) {}

std::shared_ptr<RetryPolicy> make_no_retry() {
  return std::make_shared<NoRetry>();
}

std::shared_ptr<RetryPolicy> make_fixed_delay_retry(int attempts, std::chrono::milliseconds delay) {
  return std::make_shared<FixedDelayRetry>(attempts, delay);
}

} // namespace pipeline
} // namespace deepzoom
