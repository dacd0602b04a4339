/**
 * @file concurrency_gate.hpp
 * @brief Admission control for simultaneous runs
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace coderunner {
namespace core {

/**
 * @class ConcurrencyGate
 * @brief Counting semaphore with a bounded, time-capped wait queue
 *
 * At most Limit() slots are held at any time. A caller that cannot get a slot
 * within the queue-wait cap, or that arrives while max_queue callers are
 * already waiting, gets ResourceExhausted. No fairness beyond natural queuing.
 *
 * **Usage Example**:
 * @code
 * ConcurrencyGate gate(4, std::chrono::seconds(10), 32);
 * {
 *     auto slot = gate.Acquire();   // may throw ResourceExhausted
 *     RunContainer();
 * }                                 // slot released here, on every path
 * @endcode
 */
class ConcurrencyGate {
public:
    /**
     * @class Slot
     * @brief Scoped ownership of one admission slot (movable, not copyable)
     */
    class Slot {
    public:
        Slot() = default;
        ~Slot() { Release(); }

        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept;

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        /// Give the slot back early; idempotent
        void Release();

        bool Held() const { return gate_ != nullptr; }

    private:
        friend class ConcurrencyGate;
        explicit Slot(ConcurrencyGate* gate) : gate_(gate) {}

        ConcurrencyGate* gate_{nullptr};
    };

    /**
     * @param limit Simultaneous slots (at least 1)
     * @param queue_wait Longest time Acquire() blocks
     * @param max_queue Waiting callers allowed (0 = unbounded)
     */
    ConcurrencyGate(std::size_t limit, std::chrono::milliseconds queue_wait, std::size_t max_queue);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    /**
     * @brief Block until a slot is free
     * @throws ResourceExhausted when the queue is full or the wait cap elapses
     */
    Slot Acquire();

    std::size_t InFlight() const;
    std::size_t Waiting() const;
    std::size_t Limit() const { return limit_; }

private:
    void ReleaseOne();

    const std::size_t limit_;
    const std::chrono::milliseconds queue_wait_;
    const std::size_t max_queue_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::size_t in_flight_{0};
    std::size_t waiting_{0};
};

} // namespace core
} // namespace coderunner
