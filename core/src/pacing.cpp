#include "rtk/pacing.h"

#include <thread>

namespace rtk {

SleepFn thread_sleep() {
  return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

void Pacer::wait(std::chrono::milliseconds delay) {
  if (delay.count() <= 0) return;
  total_ += delay;
  if (sleep_) {
    sleep_(delay);
  }
}

} // namespace rtk
