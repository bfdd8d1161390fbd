// =============================================================================
// ledger.cpp - Sequence-scoped delta accounting and settlement
// =============================================================================

#include "hookgate/ledger.hpp"

#include "hookgate/log.hpp"

namespace hookgate {

const char* entry_kind_name(EntryKind kind) {
    switch (kind) {
    case EntryKind::Core: return "core";
    case EntryKind::HookAdjustment: return "hook-adjustment";
    case EntryKind::Payment: return "payment";
    }
    return "unknown";
}

// =============================================================================
// Sequence Lifecycle
// =============================================================================

void DeltaLedger::begin(SequenceId sequence, const Address& locker) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        throw ProtocolError(errors::ALREADY_LOCKED,
                            "ledger already tracks sequence " + std::to_string(sequence_));
    }
    reset();
    active_ = true;
    sequence_ = sequence;
    locker_ = locker;
}

bool DeltaLedger::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

SequenceId DeltaLedger::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

void DeltaLedger::require_active(SequenceId sequence) const {
    if (!active_ || sequence != sequence_) {
        throw ProtocolError(errors::NOT_LOCKED,
                            "sequence " + std::to_string(sequence) + " is not active");
    }
}

void DeltaLedger::reset() {
    active_ = false;
    sequence_ = 0;
    locker_ = Address{};
    deltas_.clear();
    entries_.clear();
    transfers_.clear();
    failure_ = nullptr;
}

void DeltaLedger::fail(SequenceId sequence, std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || sequence != sequence_ || failure_) return;
    failure_ = std::move(error);
}

bool DeltaLedger::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(failure_);
}

void DeltaLedger::discard() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset();
}

// =============================================================================
// Accumulation
// =============================================================================

void DeltaLedger::accumulate(SequenceId sequence, EntryKind kind, const Address& account,
                             const Currency& currency, I128 amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_active(sequence);
    if (amount == 0) return;

    entries_.push_back(Entry{kind, account, currency, amount});
    auto key = std::make_pair(account, currency);
    I128 next = deltas_[key] + amount;
    if (next == 0) {
        deltas_.erase(key);
    } else {
        deltas_[key] = next;
    }
}

void DeltaLedger::record_transfer(SequenceId sequence, const Transfer& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_active(sequence);
    if (transfer.amount == 0) return;
    transfers_.push_back(transfer);
}

DeltaLedger::Checkpoint DeltaLedger::checkpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Checkpoint{entries_.size(), transfers_.size()};
}

void DeltaLedger::rollback(const Checkpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    while (entries_.size() > checkpoint.entries) {
        const Entry& entry = entries_.back();
        auto key = std::make_pair(entry.account, entry.currency);
        I128 next = deltas_[key] - entry.amount;
        if (next == 0) {
            deltas_.erase(key);
        } else {
            deltas_[key] = next;
        }
        entries_.pop_back();
    }
    if (transfers_.size() > checkpoint.transfers) {
        transfers_.resize(checkpoint.transfers);
    }
}

// =============================================================================
// Queries
// =============================================================================

I128 DeltaLedger::delta(const Address& account, const Currency& currency) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deltas_.find(std::make_pair(account, currency));
    return it != deltas_.end() ? it->second : 0;
}

size_t DeltaLedger::nonzero_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deltas_.size();
}

// =============================================================================
// Settlement
// =============================================================================

Settlement DeltaLedger::settle(SequenceId sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_active(sequence);
    if (failure_) {
        HG_LOG_WARN("sequence %llu refused: an operation inside it failed",
                    static_cast<unsigned long long>(sequence_));
        std::rethrow_exception(failure_);
    }

    // Every account other than the locker must have cleared its position
    for (const auto& [key, amount] : deltas_) {
        if (key.first != locker_) {
            throw ProtocolError(errors::UNBALANCED,
                                "account " + addresses::to_hex(key.first) + " holds " +
                                to_string(amount) + " of " + addresses::to_hex(key.second.addr));
        }
    }

    // Conservation per currency
    std::map<Currency, I128> core_total;
    std::map<Currency, I128> adjustment_total;
    for (const Entry& entry : entries_) {
        if (entry.kind == EntryKind::Core) {
            core_total[entry.currency] += entry.amount;
        } else if (entry.kind == EntryKind::HookAdjustment) {
            adjustment_total[entry.currency] += entry.amount;
        }
    }
    for (const auto& [currency, total] : adjustment_total) {
        if (total != 0) {
            throw ProtocolError(errors::UNBALANCED,
                                "extension adjustments do not net to zero in " +
                                addresses::to_hex(currency.addr));
        }
    }

    Settlement result;
    result.transfers = transfers_;
    for (const auto& [key, amount] : deltas_) {
        result.owed[key.second] = amount;
        result.transfers.push_back(Transfer{locker_, key.second, amount});
    }

    std::map<Currency, I128> moved;
    for (const Transfer& t : result.transfers) {
        moved[t.currency] += t.amount;
    }
    for (const auto& [currency, total] : core_total) {
        auto it = moved.find(currency);
        I128 paid = it != moved.end() ? it->second : 0;
        if (paid != total) {
            throw ProtocolError(errors::UNBALANCED,
                                "transfers do not match core deltas in " + addresses::to_hex(currency.addr));
        }
    }
    for (const auto& [currency, total] : moved) {
        if (total != 0 && core_total.find(currency) == core_total.end()) {
            throw ProtocolError(errors::UNBALANCED,
                                "unbacked transfers in " + addresses::to_hex(currency.addr));
        }
    }

    HG_LOG_DEBUG("sequence %llu settled: %zu transfers",
                 static_cast<unsigned long long>(sequence_), result.transfers.size());
    reset();
    return result;
}

} // namespace hookgate
