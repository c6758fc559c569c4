#include "core/milestone_engine.h"
#include "core/access_control.h"

namespace sciencefund {
namespace core {

MilestoneEngine::MilestoneEngine(LedgerStore& store, ProjectEngine& projects, EscrowEngine& escrow)
    : store_(store), projects_(projects), escrow_(escrow) {}

Result<MilestoneId> MilestoneEngine::createMilestone(const Principal& caller, ProjectId projectId,
                                                     const std::string& description, Amount fundingAmount,
                                                     std::vector<LedgerEvent>& events) {
    const Project* project = store_.findProject(projectId);
    if (!project) return makeError(ErrorCode::NOT_FOUND, "project not found");

    auto auth = authorize(store_, Operation::CREATE_MILESTONE, caller, project->researcher);
    if (auth.failed()) return auth.error();
    if (project->status != ProjectStatus::FUNDED && project->status != ProjectStatus::IN_PROGRESS) {
        return makeError(ErrorCode::INVALID_STATE, "project is not funded");
    }
    if (description.empty()) return makeError(ErrorCode::INVALID_INPUT, "description must not be empty");
    if (fundingAmount == 0) return makeError(ErrorCode::INVALID_INPUT, "funding amount must be positive");

    Milestone milestone;
    milestone.id = store_.nextMilestoneId();
    milestone.projectId = projectId;
    milestone.description = description;
    milestone.fundingAmount = fundingAmount;
    store_.putMilestone(milestone);

    LedgerEvent ev;
    ev.type = LedgerEventType::MILESTONE_CREATED;
    ev.actor = caller;
    ev.projectId = projectId;
    ev.milestoneId = milestone.id;
    ev.amount = fundingAmount;
    events.push_back(std::move(ev));
    return milestone.id;
}

Result<void> MilestoneEngine::completeMilestone(const Principal& caller, MilestoneId milestoneId,
                                                const std::string& evidence, uint64_t now,
                                                std::vector<LedgerEvent>& events) {
    const Milestone* found = store_.findMilestone(milestoneId);
    if (!found) return makeError(ErrorCode::NOT_FOUND, "milestone not found");
    const Project* project = store_.findProject(found->projectId);
    if (!project) return makeError(ErrorCode::NOT_FOUND, "project not found");

    auto auth = authorize(store_, Operation::COMPLETE_MILESTONE, caller, project->researcher);
    if (auth.failed()) return auth;
    SCIENCEFUND_CHECK(!found->completed, ErrorCode::INVALID_STATE, "milestone already completed");
    SCIENCEFUND_CHECK(!evidence.empty(), ErrorCode::INVALID_INPUT, "evidence must not be empty");

    Milestone milestone = *found;
    milestone.completed = true;
    milestone.completedAt = now;
    milestone.evidence = evidence;
    store_.putMilestone(milestone);

    LedgerEvent ev;
    ev.type = LedgerEventType::MILESTONE_COMPLETED;
    ev.timestamp = now;
    ev.actor = caller;
    ev.projectId = milestone.projectId;
    ev.milestoneId = milestoneId;
    ev.data["evidence"] = evidence;
    events.push_back(std::move(ev));

    projects_.markInProgress(milestone.projectId, caller, events);
    return Result<void>();
}

Result<FeeSplit> MilestoneEngine::verifyMilestone(const Principal& caller, MilestoneId milestoneId, uint64_t now,
                                                  std::vector<LedgerEvent>& events) {
    auto auth = authorize(store_, Operation::VERIFY_MILESTONE, caller);
    if (auth.failed()) return auth.error();
    const Milestone* found = store_.findMilestone(milestoneId);
    if (!found) return makeError(ErrorCode::NOT_FOUND, "milestone not found");
    if (!found->completed) return makeError(ErrorCode::INVALID_STATE, "milestone not completed");
    if (found->verified) return makeError(ErrorCode::INVALID_STATE, "milestone already verified");

    Milestone milestone = *found;
    milestone.verified = true;
    store_.putMilestone(milestone);

    LedgerEvent ev;
    ev.type = LedgerEventType::MILESTONE_VERIFIED;
    ev.timestamp = now;
    ev.actor = caller;
    ev.projectId = milestone.projectId;
    ev.milestoneId = milestoneId;
    events.push_back(std::move(ev));

    return escrow_.releaseMilestoneFunds(milestoneId, now, events);
}

Result<Milestone> MilestoneEngine::getMilestone(MilestoneId milestoneId) const {
    const Milestone* m = store_.findMilestone(milestoneId);
    if (!m) return makeError(ErrorCode::NOT_FOUND, "milestone not found");
    return *m;
}

Result<std::vector<Milestone>> MilestoneEngine::getProjectMilestones(ProjectId projectId) const {
    if (!store_.findProject(projectId)) return makeError(ErrorCode::NOT_FOUND, "project not found");
    std::vector<Milestone> out;
    for (MilestoneId id : store_.milestonesOf(projectId)) {
        const Milestone* m = store_.findMilestone(id);
        if (m) out.push_back(*m);
    }
    return out;
}

Result<Amount> MilestoneEngine::allocation(ProjectId projectId) const {
    auto milestones = getProjectMilestones(projectId);
    if (milestones.failed()) return milestones.error();
    Amount total = 0;
    for (const auto& m : milestones.value()) {
        total = (total > UINT64_MAX - m.fundingAmount) ? UINT64_MAX : total + m.fundingAmount;
    }
    return total;
}

}
}
