#include "interrupt.hpp"
#include <csignal>

static InterruptFlag* g_flag = nullptr;

extern "C" void netrun_sigint_handler(int sig) {
    if (!g_flag) return;
    if (g_flag->is_set()) {
        std::signal(sig, SIG_DFL);
        return;
    }
    g_flag->trigger();
}

void install_interrupt_handler(InterruptFlag& flag) {
    g_flag = &flag;
    std::signal(SIGINT, netrun_sigint_handler);
}
