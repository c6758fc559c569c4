#include "core/escrow.h"
#include "core/access_control.h"
#include "utils/logger.h"
#include <cstdint>
#include <exception>

namespace sciencefund {
namespace core {

static bool safeAddU64(uint64_t a, uint64_t b, uint64_t& out) {
    if (a > UINT64_MAX - b) return false;
    out = a + b;
    return true;
}

EscrowEngine::EscrowEngine(LedgerStore& store, ResearcherRegistry& registry)
    : store_(store), registry_(registry) {}

FeeSplit EscrowEngine::computeFeeSplit(Amount amount, uint64_t feeBps) {
    FeeSplit split;
    split.fee = (amount / BPS_DENOMINATOR) * feeBps + (amount % BPS_DENOMINATOR) * feeBps / BPS_DENOMINATOR;
    split.researcherShare = amount - split.fee;
    return split;
}

Result<void> EscrowEngine::deposit(Amount amount) {
    uint64_t pool = 0;
    if (!safeAddU64(store_.poolBalance(), amount, pool)) {
        return makeError(ErrorCode::LIMIT_EXCEEDED, "pool balance overflow");
    }
    store_.setPoolBalance(pool);
    return Result<void>();
}

Result<void> EscrowEngine::credit(const Principal& recipient, Amount amount) {
    if (amount == 0) return Result<void>();
    if (transferCheck_) {
        Result<void> accepted;
        try {
            accepted = transferCheck_(recipient, amount);
        } catch (const std::exception& e) {
            LOG_WARN("escrow", "transfer check for " + recipient + " threw: " + e.what());
            return makeError(ErrorCode::TRANSFER_FAILED, std::string("transfer check threw: ") + e.what(), recipient);
        }
        if (accepted.failed()) {
            return makeError(ErrorCode::TRANSFER_FAILED, accepted.error().message, recipient);
        }
    }
    uint64_t balance = 0;
    if (!safeAddU64(store_.balanceOf(recipient), amount, balance)) {
        return makeError(ErrorCode::LIMIT_EXCEEDED, "recipient balance overflow", recipient);
    }
    store_.setBalance(recipient, balance);
    return Result<void>();
}

Result<FeeSplit> EscrowEngine::releaseMilestoneFunds(MilestoneId milestoneId, uint64_t now,
                                                     std::vector<LedgerEvent>& events) {
    const Milestone* milestone = store_.findMilestone(milestoneId);
    if (!milestone) return makeError(ErrorCode::NOT_FOUND, "milestone not found");
    if (!milestone->verified) return makeError(ErrorCode::INVALID_STATE, "milestone is not verified");
    const Project* project = store_.findProject(milestone->projectId);
    if (!project) return makeError(ErrorCode::NOT_FOUND, "project not found");

    Amount amount = milestone->fundingAmount;
    ProjectId projectId = project->id;
    Principal researcher = project->researcher;
    Principal recipient = store_.feeRecipient();
    FeeSplit split = computeFeeSplit(amount, store_.feeBps());

    if (store_.poolBalance() < amount) {
        return makeError(ErrorCode::TRANSFER_FAILED, "pooled balance cannot cover payout");
    }
    store_.setPoolBalance(store_.poolBalance() - amount);

    auto paid = credit(researcher, split.researcherShare);
    if (paid.failed()) return paid.error();
    auto feePaid = credit(recipient, split.fee);
    if (feePaid.failed()) return feePaid.error();

    auto reputation = registry_.bumpReputation(researcher, REPUTATION_PER_RELEASE);
    if (reputation.failed()) return reputation.error();

    LedgerEvent ev;
    ev.type = LedgerEventType::FUNDS_RELEASED;
    ev.timestamp = now;
    ev.actor = researcher;
    ev.projectId = projectId;
    ev.milestoneId = milestoneId;
    ev.amount = amount;
    ev.data["researcher_share"] = std::to_string(split.researcherShare);
    ev.data["fee"] = std::to_string(split.fee);
    ev.data["fee_recipient"] = recipient;
    ev.data["reputation"] = std::to_string(reputation.value());
    events.push_back(std::move(ev));
    return split;
}

Result<Amount> EscrowEngine::emergencyWithdraw(const Principal& caller, uint64_t now,
                                               std::vector<LedgerEvent>& events) {
    auto auth = authorize(store_, Operation::EMERGENCY_WITHDRAW, caller);
    if (auth.failed()) return auth.error();

    Amount swept = store_.poolBalance();
    store_.setPoolBalance(0);
    uint64_t balance = 0;
    if (!safeAddU64(store_.balanceOf(caller), swept, balance)) {
        return makeError(ErrorCode::LIMIT_EXCEEDED, "owner balance overflow");
    }
    store_.setBalance(caller, balance);

    LedgerEvent ev;
    ev.type = LedgerEventType::EMERGENCY_WITHDRAWAL;
    ev.timestamp = now;
    ev.actor = caller;
    ev.amount = swept;
    events.push_back(std::move(ev));
    return swept;
}

Amount EscrowEngine::balanceOf(const Principal& id) const {
    return store_.balanceOf(id);
}

Amount EscrowEngine::poolBalance() const {
    return store_.poolBalance();
}

void EscrowEngine::setTransferCheck(TransferCheck check) {
    transferCheck_ = std::move(check);
}

}
}
