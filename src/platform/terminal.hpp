#pragma once

namespace platform {

// RAII guard that turns Ctrl-C (SIGINT) into a flag instead of killing the
// process. The previous disposition is restored on destruction. Only one
// guard may be active at a time.
struct InterruptGuard {
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// True once SIGINT arrived while an InterruptGuard was active.
bool interrupt_requested();

void clear_interrupt();

} // namespace platform
