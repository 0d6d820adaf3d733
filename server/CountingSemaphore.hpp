#pragma once

#include <mutex>
#include <condition_variable>
#include <cstddef>

namespace port_watch::server
{
    // Admission gate: at most `permits` holders at any instant.
    class CountingSemaphore
    {
    private:
        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::size_t m_available;

    public:
        explicit CountingSemaphore(std::size_t permits) : m_available(permits) {}

        CountingSemaphore(const CountingSemaphore &) = delete;
        CountingSemaphore &operator=(const CountingSemaphore &) = delete;

        void Acquire()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return m_available > 0; });
            --m_available;
        }

        void Release()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_available;
            }
            m_cv.notify_one();
        }
    };

    class SemaphoreGuard
    {
    private:
        CountingSemaphore &m_sem;

    public:
        explicit SemaphoreGuard(CountingSemaphore &sem) : m_sem(sem) { m_sem.Acquire(); }
        ~SemaphoreGuard() { m_sem.Release(); }

        SemaphoreGuard(const SemaphoreGuard &) = delete;
        SemaphoreGuard &operator=(const SemaphoreGuard &) = delete;
    };
}
