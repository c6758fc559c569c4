#include "core/funding_ledger.h"
#include <cassert>
#include <string>
#include <vector>

using namespace sciencefund;
using namespace sciencefund::core;

struct Fixture {
    FundingLedger ledger;
    uint64_t now = 5000;
    ProjectId project = 0;

    Fixture() {
        PlatformParams p;
        p.owner = "owner";
        p.verifiers = {"v1"};
        assert(ledger.openInMemory(p).ok());
        ledger.setClock([this]() { return now; });
        assert(ledger.registerResearcher("r1", "Ada", "Inst", {}).ok());
        assert(ledger.registerResearcher("r2", "Grace", "Navy", {}).ok());
        project = ledger.createProject("r1", "Engine", "", "", 1000, 30, {}).value();
    }

    void fundFully() {
        assert(ledger.fundProject("f1", project, 1000).ok());
    }
};

static void testCreateRequiresFundedProject() {
    Fixture fx;
    assert(fx.ledger.createMilestone("r1", fx.project, "gears", 100).code() == ErrorCode::INVALID_STATE);
    fx.fundFully();

    auto id = fx.ledger.createMilestone("r1", fx.project, "gears", 100);
    assert(id.ok() && id.value() == 1);
    auto m = fx.ledger.getMilestone(1);
    assert(m.ok());
    assert(m.value().projectId == fx.project);
    assert(m.value().description == "gears");
    assert(m.value().fundingAmount == 100);
    assert(!m.value().completed && !m.value().verified);
    assert(fx.ledger.getTotalMilestones() == 1);
}

static void testCreateRejections() {
    Fixture fx;
    fx.fundFully();

    assert(fx.ledger.createMilestone("r1", 77, "gears", 100).code() == ErrorCode::NOT_FOUND);
    assert(fx.ledger.createMilestone("r2", fx.project, "gears", 100).code() == ErrorCode::UNAUTHORIZED);
    assert(fx.ledger.createMilestone("owner", fx.project, "gears", 100).code() == ErrorCode::UNAUTHORIZED);
    assert(fx.ledger.createMilestone("r1", fx.project, "", 100).code() == ErrorCode::INVALID_INPUT);
    assert(fx.ledger.createMilestone("r1", fx.project, "gears", 0).code() == ErrorCode::INVALID_INPUT);
    assert(fx.ledger.getTotalMilestones() == 0);
    assert(fx.ledger.getMilestone(1).code() == ErrorCode::NOT_FOUND);
}

static void testAllocationIsNotBoundedByFunding() {
    Fixture fx;
    fx.fundFully();

    assert(fx.ledger.createMilestone("r1", fx.project, "a", 800).ok());
    assert(fx.ledger.createMilestone("r1", fx.project, "b", 800).ok());
    auto allocated = fx.ledger.getMilestoneAllocation(fx.project);
    assert(allocated.ok() && allocated.value() == 1600);
    assert(fx.ledger.getProject(fx.project).value().currentFunding() == 1000);

    auto ids = fx.ledger.getProjectMilestones(fx.project);
    assert(ids.ok());
    assert(ids.value() == (std::vector<MilestoneId>{1, 2}));
    assert(fx.ledger.getProjectMilestones(9).code() == ErrorCode::NOT_FOUND);
}

static void testCompleteMovesProjectInProgress() {
    Fixture fx;
    fx.fundFully();
    MilestoneId first = fx.ledger.createMilestone("r1", fx.project, "a", 100).value();
    MilestoneId second = fx.ledger.createMilestone("r1", fx.project, "b", 100).value();

    fx.now = 6000;
    assert(fx.ledger.completeMilestone("r1", first, "ipfs://a").ok());
    auto m = fx.ledger.getMilestone(first).value();
    assert(m.completed);
    assert(!m.verified);
    assert(m.completedAt == 6000);
    assert(m.evidence == "ipfs://a");
    assert(fx.ledger.getProject(fx.project).value().status == ProjectStatus::IN_PROGRESS);

    std::vector<LedgerEvent> seen;
    fx.ledger.events().subscribe(LedgerEventType::PROJECT_STATUS_CHANGED,
        [&seen](const LedgerEvent& ev) { seen.push_back(ev); });
    assert(fx.ledger.completeMilestone("r1", second, "ipfs://b").ok());
    assert(seen.empty());
    assert(fx.ledger.getProject(fx.project).value().status == ProjectStatus::IN_PROGRESS);

    assert(fx.ledger.createMilestone("r1", fx.project, "c", 10).ok());
}

static void testCompleteRejections() {
    Fixture fx;
    fx.fundFully();
    MilestoneId id = fx.ledger.createMilestone("r1", fx.project, "a", 100).value();

    assert(fx.ledger.completeMilestone("r1", 99, "ipfs://a").code() == ErrorCode::NOT_FOUND);
    assert(fx.ledger.completeMilestone("r2", id, "ipfs://a").code() == ErrorCode::UNAUTHORIZED);
    assert(fx.ledger.completeMilestone("r1", id, "").code() == ErrorCode::INVALID_INPUT);
    assert(fx.ledger.getProject(fx.project).value().status == ProjectStatus::FUNDED);

    assert(fx.ledger.completeMilestone("r1", id, "ipfs://a").ok());
    assert(fx.ledger.completeMilestone("r1", id, "ipfs://again").code() == ErrorCode::INVALID_STATE);
    assert(fx.ledger.getMilestone(id).value().evidence == "ipfs://a");
}

static void testVerifyGates() {
    Fixture fx;
    fx.fundFully();
    MilestoneId id = fx.ledger.createMilestone("r1", fx.project, "a", 100).value();

    assert(fx.ledger.verifyMilestone("r1", id).code() == ErrorCode::UNAUTHORIZED);
    assert(fx.ledger.verifyMilestone("v1", 99).code() == ErrorCode::NOT_FOUND);
    assert(fx.ledger.verifyMilestone("v1", id).code() == ErrorCode::INVALID_STATE);
    assert(!fx.ledger.getMilestone(id).value().verified);

    assert(fx.ledger.completeMilestone("r1", id, "ipfs://a").ok());
    assert(fx.ledger.verifyMilestone("v1", id).ok());
    auto m = fx.ledger.getMilestone(id).value();
    assert(m.verified && m.completed);
    assert(fx.ledger.verifyMilestone("v1", id).code() == ErrorCode::INVALID_STATE);
}

static void testRevokedVerifierDenied() {
    Fixture fx;
    fx.fundFully();
    MilestoneId id = fx.ledger.createMilestone("r1", fx.project, "a", 100).value();
    assert(fx.ledger.completeMilestone("r1", id, "ipfs://a").ok());

    assert(fx.ledger.setVerifier("owner", "v1", false).ok());
    assert(!fx.ledger.isVerifier("v1"));
    assert(fx.ledger.verifyMilestone("v1", id).code() == ErrorCode::UNAUTHORIZED);

    assert(fx.ledger.setVerifier("owner", "v2", true).ok());
    assert(fx.ledger.verifyMilestone("v2", id).ok());
}

int main() {
    testCreateRequiresFundedProject();
    testCreateRejections();
    testAllocationIsNotBoundedByFunding();
    testCompleteMovesProjectInProgress();
    testCompleteRejections();
    testVerifyGates();
    testRevokedVerifierDenied();
    return 0;
}
