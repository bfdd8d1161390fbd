#ifndef HOOKGATE_GATE_HPP
#define HOOKGATE_GATE_HPP

#include <mutex>
#include <thread>
#include <vector>

#include "types.hpp"

namespace hookgate {

// =============================================================================
// ReentrancyGate - one active sequence across the whole manager
//
// A sequence is identified by the thread that opened it, the locker and the
// stack of extensions whose callbacks are currently running. Only those may
// re-enter; everyone else fails ALREADY_LOCKED without waiting.
// =============================================================================

class ReentrancyGate {
public:
    // Scoped hold on the gate. The outermost guard releases it.
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;
        ~Guard();

        SequenceId sequence() const { return sequence_; }
        bool outermost() const { return outermost_; }

    private:
        friend class ReentrancyGate;
        Guard(ReentrancyGate* gate, SequenceId sequence, bool outermost)
            : gate_(gate), sequence_(sequence), outermost_(outermost) {}

        ReentrancyGate* gate_;
        SequenceId sequence_;
        bool outermost_;
    };

    // Marks an extension callback as executing for its lifetime
    class CallbackFrame {
    public:
        CallbackFrame(CallbackFrame&& other) noexcept;
        CallbackFrame(const CallbackFrame&) = delete;
        CallbackFrame& operator=(const CallbackFrame&) = delete;
        CallbackFrame& operator=(CallbackFrame&&) = delete;
        ~CallbackFrame();

    private:
        friend class ReentrancyGate;
        explicit CallbackFrame(ReentrancyGate* gate) : gate_(gate) {}

        ReentrancyGate* gate_;
    };

    ReentrancyGate() = default;

    ReentrancyGate(const ReentrancyGate&) = delete;
    ReentrancyGate& operator=(const ReentrancyGate&) = delete;

    // Throws ProtocolError(ALREADY_LOCKED) when held by another sequence or
    // when `caller` is not part of the running sequence
    Guard enter(const Address& caller);

    // Throws ProtocolError(NOT_LOCKED) unless the current thread holds the gate
    CallbackFrame open_callback(const Address& extension);

    bool is_locked() const;
    SequenceId current_sequence() const;  // 0 when unlocked
    Address locker() const;
    bool held_by_current_thread() const;
    uint32_t depth() const;

private:
    void exit();
    void pop_frame();
    bool reachable(const Address& caller) const;

    mutable std::mutex mutex_;
    bool locked_ = false;
    SequenceId sequence_ = 0;
    SequenceId next_sequence_ = 1;
    std::thread::id owner_;
    Address locker_{};
    uint32_t depth_ = 0;
    std::vector<Address> frames_;
};

} // namespace hookgate

#endif // HOOKGATE_GATE_HPP
