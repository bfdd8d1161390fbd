// =============================================================================
// gate.cpp - Sequence lock with explicit re-entrancy identity
// =============================================================================

#include "hookgate/gate.hpp"

#include <algorithm>
#include <utility>

#include "hookgate/log.hpp"

namespace hookgate {

// =============================================================================
// Guard / CallbackFrame
// =============================================================================

ReentrancyGate::Guard::Guard(Guard&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)),
      sequence_(other.sequence_),
      outermost_(other.outermost_) {}

ReentrancyGate::Guard::~Guard() {
    if (gate_) gate_->exit();
}

ReentrancyGate::CallbackFrame::CallbackFrame(CallbackFrame&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)) {}

ReentrancyGate::CallbackFrame::~CallbackFrame() {
    if (gate_) gate_->pop_frame();
}

// =============================================================================
// Enter / Exit
// =============================================================================

ReentrancyGate::Guard ReentrancyGate::enter(const Address& caller) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!locked_) {
        locked_ = true;
        sequence_ = next_sequence_++;
        owner_ = std::this_thread::get_id();
        locker_ = caller;
        depth_ = 1;
        frames_.clear();
        HG_LOG_DEBUG("sequence %llu opened by %s",
                     static_cast<unsigned long long>(sequence_), addresses::to_hex(caller).c_str());
        return Guard(this, sequence_, true);
    }

    if (owner_ != std::this_thread::get_id() || !reachable(caller)) {
        throw ProtocolError(errors::ALREADY_LOCKED,
                            "sequence " + std::to_string(sequence_) + " is held by " +
                            addresses::to_hex(locker_));
    }

    ++depth_;
    return Guard(this, sequence_, false);
}

void ReentrancyGate::exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (depth_ == 0) return;
    if (--depth_ == 0) {
        HG_LOG_DEBUG("sequence %llu released", static_cast<unsigned long long>(sequence_));
        locked_ = false;
        sequence_ = 0;
        owner_ = std::thread::id();
        locker_ = Address{};
        frames_.clear();
    }
}

bool ReentrancyGate::reachable(const Address& caller) const {
    if (caller == locker_) return true;
    return std::find(frames_.begin(), frames_.end(), caller) != frames_.end();
}

// =============================================================================
// Callback Frames
// =============================================================================

ReentrancyGate::CallbackFrame ReentrancyGate::open_callback(const Address& extension) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!locked_ || owner_ != std::this_thread::get_id()) {
        throw ProtocolError(errors::NOT_LOCKED, "callback outside of an active sequence");
    }
    frames_.push_back(extension);
    return CallbackFrame(this);
}

void ReentrancyGate::pop_frame() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!frames_.empty()) frames_.pop_back();
}

// =============================================================================
// Queries
// =============================================================================

bool ReentrancyGate::is_locked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

SequenceId ReentrancyGate::current_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

Address ReentrancyGate::locker() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locker_;
}

bool ReentrancyGate::held_by_current_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_ && owner_ == std::this_thread::get_id();
}

uint32_t ReentrancyGate::depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return depth_;
}

} // namespace hookgate
