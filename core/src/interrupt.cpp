#include "rtk/interrupt.h"

#include <csignal>

namespace rtk::interrupt {

namespace {
volatile std::sig_atomic_t g_requested = 0;

void interrupt_handler(int) {
  g_requested = 1;
}
} // namespace

void install_handlers() {
  std::signal(SIGINT, interrupt_handler);
  std::signal(SIGTERM, interrupt_handler);
}

bool requested() {
  return g_requested != 0;
}

void request() {
  g_requested = 1;
}

void reset() {
  g_requested = 0;
}

} // namespace rtk::interrupt
