#pragma once

#include "core/ledger_store.h"
#include "core/ledger_events.h"
#include "core/registry.h"
#include "infrastructure/error_handling.h"
#include <functional>

namespace sciencefund {
namespace core {

struct FeeSplit {
    Amount fee = 0;
    Amount researcherShare = 0;
};

// Consulted once per credit before a payout is committed. A failure aborts
// the whole payout and everything staged with it.
using TransferCheck = std::function<Result<void>(const Principal& recipient, Amount amount)>;

// Holds the pooled balance that contributions flow into and milestone
// payouts are drawn from. There is no per-project sub-balance.
class EscrowEngine {
public:
    EscrowEngine(LedgerStore& store, ResearcherRegistry& registry);

    // floor(amount * bps / 10000) without intermediate overflow.
    static FeeSplit computeFeeSplit(Amount amount, uint64_t feeBps);

    Result<void> deposit(Amount amount);

    // Pays out a milestone whose verified flag is already staged. Moves the
    // researcher share and the fee out of the pool and bumps reputation.
    Result<FeeSplit> releaseMilestoneFunds(MilestoneId milestoneId, uint64_t now,
                                           std::vector<LedgerEvent>& events);

    Result<Amount> emergencyWithdraw(const Principal& caller, uint64_t now,
                                     std::vector<LedgerEvent>& events);

    Amount balanceOf(const Principal& id) const;
    Amount poolBalance() const;

    void setTransferCheck(TransferCheck check);

private:
    Result<void> credit(const Principal& recipient, Amount amount);

    LedgerStore& store_;
    ResearcherRegistry& registry_;
    TransferCheck transferCheck_;
};

}
}
