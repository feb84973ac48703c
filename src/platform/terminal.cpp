#include "terminal.hpp"
#include <csignal>
#include <signal.h>

namespace platform {

static volatile sig_atomic_t g_interrupt_flag = 0;

static void sigint_handler(int) {
    g_interrupt_flag = 1;
}

struct InterruptGuard::Impl {
    struct sigaction old_sa;
};

InterruptGuard::InterruptGuard() : impl_(new Impl) {
    g_interrupt_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;   // no SA_RESTART: blocking poll() returns EINTR
    sigaction(SIGINT, &sa, &impl_->old_sa);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &impl_->old_sa, nullptr);
    delete impl_;
}

bool interrupt_requested() {
    return g_interrupt_flag != 0;
}

void clear_interrupt() {
    g_interrupt_flag = 0;
}

} // namespace platform
