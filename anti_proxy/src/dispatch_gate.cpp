#include "dispatch_gate.hpp"
#include <stdexcept>

DispatchGate::Permit::Permit(DispatchGate& gate) : gate_(gate) {
    gate_.acquire();
}

DispatchGate::Permit::~Permit() {
    gate_.release_held();
}

void DispatchGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::uint64_t ticket = next_ticket_++;
    turn_cv_.wait(lock, [this, ticket] { return now_serving_ == ticket; });
}

void DispatchGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (now_serving_ == next_ticket_) {
            throw std::logic_error("DispatchGate released without being held");
        }
    }
    release_held();
}

void DispatchGate::release_held() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++now_serving_;
    }
    turn_cv_.notify_all();
}

std::uint64_t DispatchGate::queue_depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_ticket_ - now_serving_;
}
