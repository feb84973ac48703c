#include <gtest/gtest.h>
#include <platform/terminal.hpp>
#include <csignal>
#include <signal.h>

TEST(InterruptGuard, CtrlCBecomesAFlag) {
    platform::clear_interrupt();
    {
        platform::InterruptGuard guard;
        EXPECT_FALSE(platform::interrupt_requested());
        std::raise(SIGINT);
        EXPECT_TRUE(platform::interrupt_requested());
    }
    platform::clear_interrupt();
    EXPECT_FALSE(platform::interrupt_requested());
}

TEST(InterruptGuard, RestoresPreviousHandler) {
    struct sigaction before {};
    sigaction(SIGINT, nullptr, &before);
    {
        platform::InterruptGuard guard;
    }
    struct sigaction after {};
    sigaction(SIGINT, nullptr, &after);
    EXPECT_EQ(before.sa_handler, after.sa_handler);
}
