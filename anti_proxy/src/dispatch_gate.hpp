#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>

// Single-slot lock handing the slot to waiters in arrival order (ticket lock).
class DispatchGate {
public:
    // Holds the slot for the lifetime of the object
    class Permit {
    public:
        explicit Permit(DispatchGate& gate);
        ~Permit();

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        DispatchGate& gate_;
    };

    void acquire();
    void release();

    // Holder plus waiters
    std::uint64_t queue_depth() const;

private:
    // Release path for Permit, which always holds the slot
    void release_held() noexcept;

    mutable std::mutex mutex_;
    std::condition_variable turn_cv_;
    std::uint64_t next_ticket_ = 0;
    std::uint64_t now_serving_ = 0;
};
