#pragma once

#include <atomic>

// Cooperative cancellation token. Set from a SIGINT handler (or a test) and
// polled by the harvester and the orchestrator at loop boundaries; nothing
// is pre-empted.
class InterruptFlag {
public:
    void trigger() { set_.store(true); }
    void reset() { set_.store(false); }
    bool is_set() const { return set_.load(); }

private:
    std::atomic<bool> set_{false};
};

// True if `flag` is non-null and set.
inline bool interrupted(const InterruptFlag* flag) {
    return flag && flag->is_set();
}

// Route SIGINT to `flag`. A second SIGINT while the flag is already set
// restores the default handler so the user can still force-quit.
void install_interrupt_handler(InterruptFlag& flag);
