#ifndef HOOKGATE_LEDGER_HPP
#define HOOKGATE_LEDGER_HPP

#include <exception>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "types.hpp"

namespace hookgate {

// =============================================================================
// Ledger Entries
// =============================================================================

enum class EntryKind : uint8_t {
    Core = 0,            // Realized core transition
    HookAdjustment = 1,  // Extension adjustment (both legs)
    Payment = 2          // take / settle
};

const char* entry_kind_name(EntryKind kind);

// Token movement between an account and the manager's reserve.
// Positive = the account pays the manager, negative = the manager pays out.
struct Transfer {
    Address account;
    Currency currency;
    I128 amount;
};

struct Settlement {
    std::map<Currency, I128> owed;     // Locker's net per currency (non-zero only)
    std::vector<Transfer> transfers;   // Payments plus the locker's final transfer

    bool empty() const { return owed.empty() && transfers.empty(); }
};

// =============================================================================
// DeltaLedger - per-sequence signed balances
//
// Positive delta = the account owes the manager. Every write is journaled so
// an aborted operation can roll back to its checkpoint.
// =============================================================================

class DeltaLedger {
public:
    struct Checkpoint {
        size_t entries;
        size_t transfers;
    };

    DeltaLedger() = default;

    DeltaLedger(const DeltaLedger&) = delete;
    DeltaLedger& operator=(const DeltaLedger&) = delete;

    // Throws ProtocolError(ALREADY_LOCKED) while another sequence is active
    void begin(SequenceId sequence, const Address& locker);

    bool active() const;
    SequenceId sequence() const;

    // Throws ProtocolError(NOT_LOCKED) unless `sequence` is the active one
    void accumulate(SequenceId sequence, EntryKind kind, const Address& account,
                    const Currency& currency, I128 amount);
    void record_transfer(SequenceId sequence, const Transfer& transfer);

    Checkpoint checkpoint() const;
    void rollback(const Checkpoint& checkpoint);

    I128 delta(const Address& account, const Currency& currency) const;
    size_t nonzero_count() const;

    // Marks the active sequence as failed; the first failure is kept and
    // rethrown by settle. Ignored when `sequence` is not the active one.
    void fail(SequenceId sequence, std::exception_ptr error);
    bool failed() const;

    // Rethrows the recorded failure, if any. Throws ProtocolError(UNBALANCED)
    // when an account other than the locker is left non-zero or value is not
    // conserved. Clears the ledger on success.
    Settlement settle(SequenceId sequence);

    // Drops the active sequence without settling
    void discard();

private:
    struct Entry {
        EntryKind kind;
        Address account;
        Currency currency;
        I128 amount;
    };

    void require_active(SequenceId sequence) const;
    void reset();

    mutable std::mutex mutex_;
    bool active_ = false;
    SequenceId sequence_ = 0;
    Address locker_{};

    std::map<std::pair<Address, Currency>, I128> deltas_;
    std::vector<Entry> entries_;
    std::vector<Transfer> transfers_;
    std::exception_ptr failure_;
};

} // namespace hookgate

#endif // HOOKGATE_LEDGER_HPP
