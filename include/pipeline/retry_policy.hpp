#ifndef DEEPZOOM_RETRY_POLICY_HPP
#define DEEPZOOM_RETRY_POLICY_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

namespace deepzoom {
namespace pipeline {

// Decides whether a failed tile or image task runs again
class RetryPolicy {
public:
  virtual ~RetryPolicy() = default;

  // Total attempts including the first one
  virtual int max_attempts() const = 0;
  // Delay before the given retry (1-based)
  virtual std::chrono::milliseconds delay(int retry) const = 0;
  // FormatError and DuplicateError are never retried
  virtual bool is_retryable(const std::exception& error) const;

  // Runs task until it succeeds, the error is not retryable, or attempts run out.
  // The last error is rethrown.
  template <typename Task>
  auto run(Task&& task) const -> decltype(task());

  // Invoked before each retry with the attempt number and the error
  using RetryCallback = std::function<void(int, const std::exception&)>;
  void on_retry(RetryCallback callback) { on_retry_ = std::move(callback); }

protected:
  void notify_retry(int attempt, const std::exception& error) const;
  void sleep(std::chrono::milliseconds duration) const;

private:
  RetryCallback on_retry_;
};

class NoRetry : public RetryPolicy {
public:
  int max_attempts() const override { return 1; }
  std::chrono::milliseconds delay(int) const override { return std::chrono::milliseconds(0); }
};

class FixedDelayRetry : public RetryPolicy {
public:
  FixedDelayRetry(int attempts, std::chrono::milliseconds delay);

  int max_attempts() const override { return attempts_; }
  std::chrono::milliseconds delay(int) const override { return delay_; }

private:
  int attempts_;
  std::chrono::milliseconds delay_;
};

std::shared_ptr<RetryPolicy> make_no_retry();
std::shared_ptr<RetryPolicy> make_fixed_delay_retry(int attempts = 3,
                                                    std::chrono::milliseconds delay = std::chrono::seconds(2));

//==============================================
// IMPLEMENTATION
//==============================================

template <typename Task>
auto RetryPolicy::run(Task&& task) const -> decltype(task()) {
  const int attempts = max_attempts() < 1 ? 1 : max_attempts();
  for (int attempt = 1;; ++attempt) {
    try {
      return task();
    } catch (const std::exception& e) {
      if (attempt >= attempts || !is_retryable(e)) {
        throw;
      }
      notify_retry(attempt, e);
      sleep(delay(attempt));
    }
  }
}

} // namespace pipeline
} // namespace deepzoom

#endif // DEEPZOOM_RETRY_POLICY_HPP
