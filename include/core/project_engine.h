#pragma once

#include "core/ledger_store.h"
#include "core/ledger_events.h"
#include "core/registry.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>

namespace sciencefund {
namespace core {

struct ProjectDraft {
    std::string title;
    std::string description;
    std::string researchArea;
    Amount fundingGoal = 0;
    uint64_t durationDays = 0;
    std::vector<std::string> milestoneTexts;
};

class ProjectEngine {
public:
    ProjectEngine(LedgerStore& store, ResearcherRegistry& registry);

    Result<ProjectId> createProject(const Principal& caller, const ProjectDraft& draft, uint64_t now,
                                    std::vector<LedgerEvent>& events);

    // Accepts the full amount even past the goal. The goal check runs on the
    // post-increment total and flips ACTIVE to FUNDED.
    Result<void> fundProject(const Principal& caller, ProjectId projectId, Amount amount, uint64_t now,
                             std::vector<LedgerEvent>& events);

    // FUNDED -> IN_PROGRESS on the first milestone completion. No-op for any
    // other status.
    void markInProgress(ProjectId projectId, const Principal& actor, std::vector<LedgerEvent>& events);

    Result<Project> getProject(ProjectId projectId) const;
    Result<std::vector<Principal>> contributors(ProjectId projectId) const;
    Result<Amount> contribution(ProjectId projectId, const Principal& contributor) const;

private:
    void changeStatus(Project& project, ProjectStatus to, const Principal& actor,
                      std::vector<LedgerEvent>& events);

    LedgerStore& store_;
    ResearcherRegistry& registry_;
};

}
}
