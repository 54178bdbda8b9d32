#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <atomic>
#include <chrono>

/**
 * @brief System thread handles and iteration counters
 */
struct SystemThreads {
    std::thread logger_thread;    // Logging system thread

    std::chrono::steady_clock::time_point start_time;  // Reported as run duration at shutdown
    std::atomic<unsigned long> logger_polls{0};        // Logger thread queue polls

    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}

    // Copy operations explicitly deleted
    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;
};

#endif // SYSTEM_THREADS_HPP
