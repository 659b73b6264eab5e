#pragma once

#include "rtk/error.h"
#include "rtk/log.h"

#include <chrono>
#include <functional>
#include <string>
#include <utility>

namespace rtk {

using SleepFn = std::function<void(std::chrono::milliseconds)>;

SleepFn thread_sleep();

// Fixed delays issued after upstream calls to stay under rate limits.
class Pacer {
 public:
  explicit Pacer(SleepFn sleep = thread_sleep()) : sleep_(std::move(sleep)) {}

  void wait(std::chrono::milliseconds delay);
  std::chrono::milliseconds total_waited() const { return total_; }

 private:
  SleepFn sleep_;
  std::chrono::milliseconds total_{0};
};

struct RetryPolicy {
  int attempts = 5;
  std::chrono::milliseconds delay{30000};
};

// Runs attempt_fn until it succeeds or the policy's attempts are used up,
// waiting the fixed delay between attempts. Exhaustion turns the last error
// into ErrorKind::Transient.
template <typename AttemptFn>
bool retry_fixed(const RetryPolicy& policy, Pacer& pacer, const std::string& what,
                 AttemptFn&& attempt_fn, RunError& error) {
  const int attempts = policy.attempts < 1 ? 1 : policy.attempts;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    RunError attempt_error;
    if (attempt_fn(attempt_error)) {
      return true;
    }
    log::warn(what + " failed (" + std::to_string(attempt) + "/" + std::to_string(attempts) +
              "): " + describe(attempt_error));
    if (attempt_error.kind == ErrorKind::Auth) {
      error = std::move(attempt_error);
      return false;
    }
    if (attempt == attempts) {
      set_error(error, ErrorKind::Transient,
                what + " failed after " + std::to_string(attempts) + " attempts: " + attempt_error.message,
                attempt_error.http_status);
      return false;
    }
    pacer.wait(policy.delay);
  }
  return false;
}

} // namespace rtk
