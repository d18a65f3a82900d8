#pragma once

#include <csignal>

#include <pthread.h>
#include <signal.h>


namespace hashfeed::examples {

    // SIGINT/SIGTERM without SA_RESTART: a read blocked on stdin returns
    // EINTR so Ctrl+C ends input immediately, not at the next line.
    inline bool install_interrupt_handler(void (*handler)(int)) noexcept {
        struct sigaction sa{};
        sa.sa_handler = handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        return ::sigaction(SIGINT, &sa, nullptr) == 0 && ::sigaction(SIGTERM, &sa, nullptr) == 0;
    }

    // Blocks SIGINT/SIGTERM in the calling thread until release(). Threads
    // started meanwhile (session scheduler, broker I/O) inherit the mask, so
    // the signal is delivered to the thread that released it.
    class InterruptsBlocked {
    public:
        InterruptsBlocked() noexcept {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);
            active_ = ::pthread_sigmask(SIG_BLOCK, &set, &previous_) == 0;
        }

        ~InterruptsBlocked() {
            release();
        }

        InterruptsBlocked(const InterruptsBlocked&) = delete;
        InterruptsBlocked& operator=(const InterruptsBlocked&) = delete;

        void release() noexcept {
            if (active_) {
                ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
                active_ = false;
            }
        }

    private:
        sigset_t previous_{};
        bool active_{false};
    };

} // namespace hashfeed::examples
