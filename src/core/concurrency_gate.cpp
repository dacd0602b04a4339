/**
 * @file concurrency_gate.cpp
 * @brief Counting semaphore with bounded wait queue
 *
 * @date 2025
 */

#include "coderunner/core/concurrency_gate.hpp"
#include "coderunner/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace coderunner {
namespace core {

ConcurrencyGate::Slot& ConcurrencyGate::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        Release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void ConcurrencyGate::Slot::Release() {
    if (gate_ != nullptr) {
        gate_->ReleaseOne();
        gate_ = nullptr;
    }
}

ConcurrencyGate::ConcurrencyGate(std::size_t limit, std::chrono::milliseconds queue_wait,
                                 std::size_t max_queue)
    : limit_(std::max<std::size_t>(limit, 1))
    , queue_wait_(queue_wait)
    , max_queue_(max_queue) {
}

ConcurrencyGate::Slot ConcurrencyGate::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (in_flight_ < limit_) {
        ++in_flight_;
        return Slot(this);
    }

    if (max_queue_ > 0 && waiting_ >= max_queue_) {
        spdlog::warn("Admission refused: {} runs in flight, {} waiting", in_flight_, waiting_);
        throw ResourceExhausted("Runner queue is full (" + std::to_string(waiting_) +
                                " requests waiting)");
    }

    ++waiting_;
    bool admitted = available_.wait_for(lock, queue_wait_, [this] { return in_flight_ < limit_; });
    --waiting_;

    if (!admitted) {
        spdlog::warn("Admission refused after waiting {} ms", queue_wait_.count());
        throw ResourceExhausted("No runner slot became free within " +
                                std::to_string(queue_wait_.count()) + " ms");
    }

    ++in_flight_;
    return Slot(this);
}

void ConcurrencyGate::ReleaseOne() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    available_.notify_one();
}

std::size_t ConcurrencyGate::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t ConcurrencyGate::Waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_;
}

} // namespace core
} // namespace coderunner
