#include "collect/interrupt.hpp"

#include <atomic>
#include <csignal>

namespace rgwbundle::collect {

namespace {

std::atomic<bool> g_interrupt_requested{false};

void OnInterruptSignal(int /*signal_number*/) {
  g_interrupt_requested.store(true);
}

} // namespace

ScopedInterruptHandler::ScopedInterruptHandler() {
  ClearInterrupt();
  previous_sigint_ = std::signal(SIGINT, OnInterruptSignal);
  previous_sigterm_ = std::signal(SIGTERM, OnInterruptSignal);
}

ScopedInterruptHandler::~ScopedInterruptHandler() {
  if (previous_sigint_ != SIG_ERR) {
    std::signal(SIGINT, previous_sigint_);
  }
  if (previous_sigterm_ != SIG_ERR) {
    std::signal(SIGTERM, previous_sigterm_);
  }
}

bool InterruptRequested() {
  return g_interrupt_requested.load();
}

void RequestInterrupt() {
  g_interrupt_requested.store(true);
}

void ClearInterrupt() {
  g_interrupt_requested.store(false);
}

} // namespace rgwbundle::collect
