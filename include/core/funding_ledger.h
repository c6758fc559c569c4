#pragma once

#include "core/ledger_store.h"
#include "core/ledger_events.h"
#include "core/escrow.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace sciencefund {
namespace core {

// Boundary of the crowdfunding ledger. Every operation takes the already
// authenticated caller, runs under one lock as a single store transaction and
// publishes its events only after the commit, with the lock released.
class FundingLedger {
public:
    using Clock = std::function<uint64_t()>;

    FundingLedger();
    ~FundingLedger();

    FundingLedger(const FundingLedger&) = delete;
    FundingLedger& operator=(const FundingLedger&) = delete;

    // params seed a fresh database and are ignored for an existing one.
    Result<void> open(const std::string& dbPath, const PlatformParams& params);
    Result<void> openInMemory(const PlatformParams& params);
    void close();
    bool isOpen() const;

    void setClock(Clock clock);
    void setTransferCheck(TransferCheck check);
    LedgerEventBus& events();

    Result<void> registerResearcher(const Principal& caller, const std::string& name,
                                    const std::string& institution,
                                    const std::vector<std::string>& expertise);
    Result<ProjectId> createProject(const Principal& caller, const std::string& title,
                                    const std::string& description, const std::string& researchArea,
                                    Amount fundingGoal, uint64_t durationDays,
                                    const std::vector<std::string>& milestoneTexts);
    Result<void> fundProject(const Principal& caller, ProjectId projectId, Amount amount);
    Result<MilestoneId> createMilestone(const Principal& caller, ProjectId projectId,
                                        const std::string& description, Amount fundingAmount);
    Result<void> completeMilestone(const Principal& caller, MilestoneId milestoneId, const std::string& evidence);
    Result<void> verifyMilestone(const Principal& caller, MilestoneId milestoneId);

    Result<void> setVerifier(const Principal& caller, const Principal& verifier, bool enabled);
    Result<void> setPlatformFee(const Principal& caller, uint64_t feeBps);
    Result<void> setFeeRecipient(const Principal& caller, const Principal& recipient);
    Result<Amount> emergencyWithdraw(const Principal& caller);

    Result<Project> getProject(ProjectId projectId) const;
    Result<std::vector<Principal>> getProjectContributors(ProjectId projectId) const;
    Result<Amount> getContribution(ProjectId projectId, const Principal& contributor) const;
    Result<Researcher> getResearcher(const Principal& id) const;
    Result<Milestone> getMilestone(MilestoneId milestoneId) const;
    Result<std::vector<MilestoneId>> getProjectMilestones(ProjectId projectId) const;
    Result<Amount> getMilestoneAllocation(ProjectId projectId) const;
    uint64_t getTotalProjects() const;
    uint64_t getTotalMilestones() const;

    bool isVerifier(const Principal& id) const;
    uint64_t getPlatformFee() const;
    Principal getFeeRecipient() const;
    Principal getOwner() const;
    Amount getBalance(const Principal& id) const;
    Amount getPoolBalance() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
