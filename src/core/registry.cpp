#include "core/registry.h"
#include "core/access_control.h"

namespace sciencefund {
namespace core {

ResearcherRegistry::ResearcherRegistry(LedgerStore& store) : store_(store) {}

Result<void> ResearcherRegistry::registerResearcher(const Principal& caller, const std::string& name,
                                                    const std::string& institution,
                                                    const std::vector<std::string>& expertise,
                                                    std::vector<LedgerEvent>& events) {
    auto auth = authorize(store_, Operation::REGISTER_RESEARCHER, caller);
    if (auth.failed()) return auth;
    SCIENCEFUND_CHECK(!name.empty(), ErrorCode::INVALID_INPUT, "name must not be empty");
    SCIENCEFUND_CHECK(!institution.empty(), ErrorCode::INVALID_INPUT, "institution must not be empty");

    Researcher record;
    const Researcher* existing = store_.findResearcher(caller);
    if (existing) {
        record.projects = existing->projects;
        record.verified = existing->verified;
    }
    record.id = caller;
    record.name = name;
    record.institution = institution;
    record.expertise = expertise;
    record.reputation = INITIAL_REPUTATION;
    store_.putResearcher(record);

    LedgerEvent ev;
    ev.type = LedgerEventType::RESEARCHER_REGISTERED;
    ev.actor = caller;
    ev.data["name"] = name;
    ev.data["institution"] = institution;
    ev.data["reregistration"] = existing ? "true" : "false";
    events.push_back(std::move(ev));
    return Result<void>();
}

Result<Researcher> ResearcherRegistry::getResearcher(const Principal& id) const {
    const Researcher* r = store_.findResearcher(id);
    if (!r) return makeError(ErrorCode::NOT_FOUND, "researcher not registered");
    return *r;
}

bool ResearcherRegistry::isRegistered(const Principal& id) const {
    return store_.findResearcher(id) != nullptr;
}

Result<void> ResearcherRegistry::addProject(const Principal& id, ProjectId projectId) {
    const Researcher* r = store_.findResearcher(id);
    if (!r) return makeError(ErrorCode::NOT_FOUND, "researcher not registered");
    Researcher updated = *r;
    updated.projects.push_back(projectId);
    store_.putResearcher(updated);
    return Result<void>();
}

Result<uint64_t> ResearcherRegistry::bumpReputation(const Principal& id, uint64_t delta) {
    const Researcher* r = store_.findResearcher(id);
    if (!r) return makeError(ErrorCode::NOT_FOUND, "researcher not registered");
    if (r->reputation > UINT64_MAX - delta) {
        return makeError(ErrorCode::LIMIT_EXCEEDED, "reputation overflow");
    }
    Researcher updated = *r;
    updated.reputation += delta;
    store_.putResearcher(updated);
    return updated.reputation;
}

}
}
