#include "core/registry.h"
#include "core/ledger_store.h"
#include "core/ledger_events.h"
#include <cassert>
#include <string>
#include <vector>

using namespace sciencefund;
using namespace sciencefund::core;

static void openStore(LedgerStore& store) {
    assert(store.open(":memory:").ok());
    PlatformParams params;
    params.owner = "owner";
    StoreTransaction tx(store);
    assert(store.initialize(params).ok());
    assert(tx.commit().ok());
}

static void testRegisterCreatesRecord() {
    LedgerStore store;
    openStore(store);
    ResearcherRegistry registry(store);
    std::vector<LedgerEvent> events;

    StoreTransaction tx(store);
    auto r = registry.registerResearcher("r1", "Ada", "Analytical Engines", {"math"}, events);
    assert(r.ok());
    assert(tx.commit().ok());

    assert(registry.isRegistered("r1"));
    auto rec = registry.getResearcher("r1");
    assert(rec.ok());
    assert(rec.value().name == "Ada");
    assert(rec.value().institution == "Analytical Engines");
    assert(rec.value().expertise == std::vector<std::string>{"math"});
    assert(rec.value().reputation == INITIAL_REPUTATION);
    assert(!rec.value().verified);
    assert(rec.value().projects.empty());

    assert(events.size() == 1);
    assert(events[0].type == LedgerEventType::RESEARCHER_REGISTERED);
    assert(events[0].actor == "r1");
    assert(events[0].data.at("reregistration") == "false");
}

static void testRegisterValidatesInput() {
    LedgerStore store;
    openStore(store);
    ResearcherRegistry registry(store);
    std::vector<LedgerEvent> events;
    StoreTransaction tx(store);

    assert(registry.registerResearcher("r1", "", "Inst", {}, events).code() == ErrorCode::INVALID_INPUT);
    assert(registry.registerResearcher("r1", "Ada", "", {}, events).code() == ErrorCode::INVALID_INPUT);
    assert(registry.registerResearcher("", "Ada", "Inst", {}, events).code() == ErrorCode::UNAUTHORIZED);
    assert(!registry.isRegistered("r1"));
    assert(events.empty());
}

static void testReregistrationOverwritesAndResetsReputation() {
    LedgerStore store;
    openStore(store);
    ResearcherRegistry registry(store);
    std::vector<LedgerEvent> events;

    StoreTransaction tx(store);
    assert(registry.registerResearcher("r1", "Ada", "Inst", {"math"}, events).ok());
    assert(registry.addProject("r1", 7).ok());
    auto bumped = registry.bumpReputation("r1", REPUTATION_PER_RELEASE);
    assert(bumped.ok() && bumped.value() == 110);

    assert(registry.registerResearcher("r1", "Ada L.", "Other Inst", {"poetry"}, events).ok());
    auto rec = registry.getResearcher("r1");
    assert(rec.value().name == "Ada L.");
    assert(rec.value().institution == "Other Inst");
    assert(rec.value().expertise == std::vector<std::string>{"poetry"});
    assert(rec.value().reputation == INITIAL_REPUTATION);
    assert(rec.value().projects == std::vector<ProjectId>{7});
    assert(events.back().data.at("reregistration") == "true");
}

static void testUnknownResearcher() {
    LedgerStore store;
    openStore(store);
    ResearcherRegistry registry(store);
    StoreTransaction tx(store);

    assert(registry.getResearcher("ghost").code() == ErrorCode::NOT_FOUND);
    assert(registry.addProject("ghost", 1).code() == ErrorCode::NOT_FOUND);
    assert(registry.bumpReputation("ghost", 10).code() == ErrorCode::NOT_FOUND);
}

static void testReputationOverflowRejected() {
    LedgerStore store;
    openStore(store);
    ResearcherRegistry registry(store);
    std::vector<LedgerEvent> events;
    StoreTransaction tx(store);

    assert(registry.registerResearcher("r1", "Ada", "Inst", {}, events).ok());
    Researcher r = registry.getResearcher("r1").value();
    r.reputation = UINT64_MAX - 5;
    store.putResearcher(r);

    assert(registry.bumpReputation("r1", 10).code() == ErrorCode::LIMIT_EXCEEDED);
    assert(registry.getResearcher("r1").value().reputation == UINT64_MAX - 5);
}

int main() {
    testRegisterCreatesRecord();
    testRegisterValidatesInput();
    testReregistrationOverwritesAndResetsReputation();
    testUnknownResearcher();
    testReputationOverflowRejected();
    return 0;
}
