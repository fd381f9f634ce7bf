#pragma once

namespace rgwbundle::collect {

// Installs SIGINT/SIGTERM handlers that only record the request; the
// collector polls InterruptRequested() between steps and archive entries.
// Previous handlers are restored when the guard goes out of scope.
class ScopedInterruptHandler {
public:
  ScopedInterruptHandler();
  ~ScopedInterruptHandler();

  ScopedInterruptHandler(const ScopedInterruptHandler&) = delete;
  ScopedInterruptHandler& operator=(const ScopedInterruptHandler&) = delete;

private:
  using Handler = void (*)(int);
  Handler previous_sigint_ = nullptr;
  Handler previous_sigterm_ = nullptr;
};

bool InterruptRequested();

// Marks an interrupt as pending. Signal handlers call this; tests use it to
// simulate an operator abort deterministically.
void RequestInterrupt();

void ClearInterrupt();

} // namespace rgwbundle::collect
