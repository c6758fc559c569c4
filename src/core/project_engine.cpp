#include "core/project_engine.h"
#include "core/access_control.h"

namespace sciencefund {
namespace core {

ProjectEngine::ProjectEngine(LedgerStore& store, ResearcherRegistry& registry)
    : store_(store), registry_(registry) {}

Result<ProjectId> ProjectEngine::createProject(const Principal& caller, const ProjectDraft& draft, uint64_t now,
                                               std::vector<LedgerEvent>& events) {
    auto auth = authorize(store_, Operation::CREATE_PROJECT, caller);
    if (auth.failed()) return auth.error();
    if (draft.title.empty()) return makeError(ErrorCode::INVALID_INPUT, "title must not be empty");
    if (draft.fundingGoal == 0) return makeError(ErrorCode::INVALID_INPUT, "funding goal must be positive");
    if (draft.durationDays == 0) return makeError(ErrorCode::INVALID_INPUT, "duration must be positive");

    if (draft.durationDays > (UINT64_MAX - now) / SECONDS_PER_DAY) {
        return makeError(ErrorCode::LIMIT_EXCEEDED, "deadline overflows the clock");
    }

    Project project;
    project.id = store_.nextProjectId();
    project.researcher = caller;
    project.title = draft.title;
    project.description = draft.description;
    project.researchArea = draft.researchArea;
    project.fundingGoal = draft.fundingGoal;
    project.deadline = now + draft.durationDays * SECONDS_PER_DAY;
    project.status = ProjectStatus::ACTIVE;
    project.createdAt = now;
    project.milestoneTexts = draft.milestoneTexts;
    store_.putProject(project);

    auto linked = registry_.addProject(caller, project.id);
    if (linked.failed()) return linked.error();

    LedgerEvent ev;
    ev.type = LedgerEventType::PROJECT_CREATED;
    ev.timestamp = now;
    ev.actor = caller;
    ev.projectId = project.id;
    ev.amount = project.fundingGoal;
    ev.data["title"] = project.title;
    ev.data["deadline"] = std::to_string(project.deadline);
    events.push_back(std::move(ev));
    return project.id;
}

Result<void> ProjectEngine::fundProject(const Principal& caller, ProjectId projectId, Amount amount, uint64_t now,
                                        std::vector<LedgerEvent>& events) {
    const Project* found = store_.findProject(projectId);
    if (!found) return makeError(ErrorCode::NOT_FOUND, "project not found");

    auto auth = authorize(store_, Operation::FUND_PROJECT, caller);
    if (auth.failed()) return auth;
    SCIENCEFUND_CHECK(amount > 0, ErrorCode::INVALID_INPUT, "amount must be positive");
    SCIENCEFUND_CHECK(found->status == ProjectStatus::ACTIVE, ErrorCode::INVALID_STATE, "project is not accepting funds");
    SCIENCEFUND_CHECK(now < found->deadline, ErrorCode::INVALID_STATE, "funding deadline has passed");
    SCIENCEFUND_CHECK(found->currentFunding() < found->fundingGoal, ErrorCode::INVALID_STATE, "funding goal already reached");

    Project project = *found;
    if (!project.recordContribution(caller, amount)) {
        return makeError(ErrorCode::LIMIT_EXCEEDED, "contribution overflows project funding");
    }

    LedgerEvent ev;
    ev.type = LedgerEventType::PROJECT_FUNDED;
    ev.timestamp = now;
    ev.actor = caller;
    ev.projectId = projectId;
    ev.amount = amount;
    ev.data["total"] = std::to_string(project.currentFunding());
    events.push_back(std::move(ev));

    if (project.currentFunding() >= project.fundingGoal) {
        changeStatus(project, ProjectStatus::FUNDED, caller, events);
    }
    store_.putProject(project);
    return Result<void>();
}

void ProjectEngine::markInProgress(ProjectId projectId, const Principal& actor, std::vector<LedgerEvent>& events) {
    const Project* found = store_.findProject(projectId);
    if (!found || found->status != ProjectStatus::FUNDED) return;
    Project project = *found;
    changeStatus(project, ProjectStatus::IN_PROGRESS, actor, events);
    store_.putProject(project);
}

void ProjectEngine::changeStatus(Project& project, ProjectStatus to, const Principal& actor,
                                 std::vector<LedgerEvent>& events) {
    LedgerEvent ev;
    ev.type = LedgerEventType::PROJECT_STATUS_CHANGED;
    ev.actor = actor;
    ev.projectId = project.id;
    ev.data["from"] = projectStatusName(project.status);
    ev.data["to"] = projectStatusName(to);
    project.status = to;
    events.push_back(std::move(ev));
}

Result<Project> ProjectEngine::getProject(ProjectId projectId) const {
    const Project* p = store_.findProject(projectId);
    if (!p) return makeError(ErrorCode::NOT_FOUND, "project not found");
    return *p;
}

Result<std::vector<Principal>> ProjectEngine::contributors(ProjectId projectId) const {
    const Project* p = store_.findProject(projectId);
    if (!p) return makeError(ErrorCode::NOT_FOUND, "project not found");
    return p->contributors();
}

Result<Amount> ProjectEngine::contribution(ProjectId projectId, const Principal& contributor) const {
    const Project* p = store_.findProject(projectId);
    if (!p) return makeError(ErrorCode::NOT_FOUND, "project not found");
    return p->contributionOf(contributor);
}

}
}
