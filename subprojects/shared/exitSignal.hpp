#ifndef EXIT_SIGNAL_HPP
#define EXIT_SIGNAL_HPP

#include <atomic>

/**
 * @brief One-shot cancellation flag shared by cooperating threads.
 *
 * Starts unset; set() flips it once. Workers poll is_set() between
 * bounded waits on their queue or socket.
 */
class ExitSignal {
public:
    ExitSignal() = default;
    ExitSignal(const ExitSignal&) = delete;
    ExitSignal& operator=(const ExitSignal&) = delete;

    /**
     * @brief Raise the signal.
     * @return true for the call that actually raised it, false if it was already set.
     */
    bool set() { return !set_.exchange(true, std::memory_order_acq_rel); }

    bool is_set() const { return set_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> set_{false};
};

#endif // EXIT_SIGNAL_HPP
