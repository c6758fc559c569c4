#pragma once

#include "core/ledger_store.h"
#include "core/ledger_events.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>

namespace sciencefund {
namespace core {

class ResearcherRegistry {
public:
    explicit ResearcherRegistry(LedgerStore& store);

    // Creates or fully overwrites the caller's record. Reputation goes back to
    // INITIAL_REPUTATION; owned projects and the verified flag are kept.
    Result<void> registerResearcher(const Principal& caller, const std::string& name,
                                    const std::string& institution,
                                    const std::vector<std::string>& expertise,
                                    std::vector<LedgerEvent>& events);

    Result<Researcher> getResearcher(const Principal& id) const;
    bool isRegistered(const Principal& id) const;

    Result<void> addProject(const Principal& id, ProjectId projectId);
    Result<uint64_t> bumpReputation(const Principal& id, uint64_t delta);

private:
    LedgerStore& store_;
};

}
}
