#pragma once

#include "core/ledger_store.h"
#include "core/ledger_events.h"
#include "core/project_engine.h"
#include "core/escrow.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>

namespace sciencefund {
namespace core {

class MilestoneEngine {
public:
    MilestoneEngine(LedgerStore& store, ProjectEngine& projects, EscrowEngine& escrow);

    // The amount is not checked against the project's funding or against
    // other milestones of the same project.
    Result<MilestoneId> createMilestone(const Principal& caller, ProjectId projectId,
                                        const std::string& description, Amount fundingAmount,
                                        std::vector<LedgerEvent>& events);

    Result<void> completeMilestone(const Principal& caller, MilestoneId milestoneId,
                                   const std::string& evidence, uint64_t now,
                                   std::vector<LedgerEvent>& events);

    // Stages verified=true and then releases funds inside the caller's
    // transaction. A payout failure fails the whole call.
    Result<FeeSplit> verifyMilestone(const Principal& caller, MilestoneId milestoneId, uint64_t now,
                                     std::vector<LedgerEvent>& events);

    Result<Milestone> getMilestone(MilestoneId milestoneId) const;
    Result<std::vector<Milestone>> getProjectMilestones(ProjectId projectId) const;

    // Sum of fundingAmount over the project's milestones, saturating.
    Result<Amount> allocation(ProjectId projectId) const;

private:
    LedgerStore& store_;
    ProjectEngine& projects_;
    EscrowEngine& escrow_;
};

}
}
