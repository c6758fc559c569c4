#include "core/funding_ledger.h"
#include <atomic>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

using namespace sciencefund;
using namespace sciencefund::core;

static PlatformParams params() {
    PlatformParams p;
    p.owner = "owner";
    p.verifiers = {"v1"};
    return p;
}

static void openLedger(FundingLedger& ledger, std::atomic<uint64_t>& now) {
    assert(ledger.openInMemory(params()).ok());
    ledger.setClock([&now]() { return now.load(); });
    assert(ledger.registerResearcher("r1", "Ada", "Inst", {"math"}).ok());
}

static void testCreateProject() {
    std::atomic<uint64_t> now{1000};
    FundingLedger ledger;
    openLedger(ledger, now);

    auto id = ledger.createProject("r1", "Engine", "Build it", "computing", 1000, 30, {"gears", "crank"});
    assert(id.ok());
    assert(id.value() == 1);
    auto second = ledger.createProject("r1", "Engine 2", "", "", 5, 1, {});
    assert(second.ok() && second.value() == 2);
    assert(ledger.getTotalProjects() == 2);

    auto p = ledger.getProject(1);
    assert(p.ok());
    assert(p.value().researcher == "r1");
    assert(p.value().status == ProjectStatus::ACTIVE);
    assert(p.value().deadline == 1000 + 30 * SECONDS_PER_DAY);
    assert(p.value().createdAt == 1000);
    assert(p.value().currentFunding() == 0);
    assert(p.value().milestoneTexts.size() == 2);

    auto researcher = ledger.getResearcher("r1");
    assert(researcher.value().projects == (std::vector<ProjectId>{1, 2}));
}

static void testCreateProjectRejections() {
    std::atomic<uint64_t> now{1000};
    FundingLedger ledger;
    openLedger(ledger, now);

    assert(ledger.createProject("stranger", "T", "", "", 10, 1, {}).code() == ErrorCode::UNAUTHORIZED);
    assert(ledger.createProject("", "T", "", "", 10, 1, {}).code() == ErrorCode::UNAUTHORIZED);
    assert(ledger.createProject("r1", "", "", "", 10, 1, {}).code() == ErrorCode::INVALID_INPUT);
    assert(ledger.createProject("r1", "T", "", "", 0, 1, {}).code() == ErrorCode::INVALID_INPUT);
    assert(ledger.createProject("r1", "T", "", "", 10, 0, {}).code() == ErrorCode::INVALID_INPUT);
    assert(ledger.createProject("r1", "T", "", "", 10, UINT64_MAX, {}).code() == ErrorCode::LIMIT_EXCEEDED);

    assert(ledger.getTotalProjects() == 0);
    assert(ledger.getResearcher("r1").value().projects.empty());
    assert(ledger.getProject(1).code() == ErrorCode::NOT_FOUND);
    assert(ledger.getProject(0).code() == ErrorCode::NOT_FOUND);

    auto id = ledger.createProject("r1", "T", "", "", 10, 1, {});
    assert(id.ok() && id.value() == 1);
}

static void testFundingReachesGoalWithOvershoot() {
    std::atomic<uint64_t> now{1000};
    FundingLedger ledger;
    openLedger(ledger, now);
    ProjectId id = ledger.createProject("r1", "Engine", "", "", 1000, 30, {}).value();

    assert(ledger.fundProject("f1", id, 600).ok());
    assert(ledger.getProject(id).value().status == ProjectStatus::ACTIVE);
    assert(ledger.fundProject("f2", id, 500).ok());

    auto p = ledger.getProject(id).value();
    assert(p.status == ProjectStatus::FUNDED);
    assert(p.currentFunding() == 1100);
    assert(p.fundingConsistent());
    assert(ledger.getPoolBalance() == 1100);

    assert(ledger.fundProject("f3", id, 1).code() == ErrorCode::INVALID_STATE);
    assert(ledger.getProject(id).value().currentFunding() == 1100);
    assert(ledger.getContribution(id, "f3").value() == 0);
    assert(ledger.getPoolBalance() == 1100);
}

static void testContributorsTracked() {
    std::atomic<uint64_t> now{1000};
    FundingLedger ledger;
    openLedger(ledger, now);
    ProjectId id = ledger.createProject("r1", "Engine", "", "", 1000, 30, {}).value();

    assert(ledger.fundProject("f1", id, 10).ok());
    assert(ledger.fundProject("f2", id, 20).ok());
    assert(ledger.fundProject("f1", id, 30).ok());

    auto contributors = ledger.getProjectContributors(id);
    assert(contributors.ok());
    assert(contributors.value() == (std::vector<Principal>{"f1", "f2"}));
    assert(ledger.getContribution(id, "f1").value() == 40);
    assert(ledger.getContribution(id, "f2").value() == 20);
    assert(ledger.getProject(id).value().currentFunding() == 60);

    assert(ledger.getProjectContributors(99).code() == ErrorCode::NOT_FOUND);
    assert(ledger.getContribution(99, "f1").code() == ErrorCode::NOT_FOUND);
}

static void testFundingRejections() {
    std::atomic<uint64_t> now{1000};
    FundingLedger ledger;
    openLedger(ledger, now);
    ProjectId id = ledger.createProject("r1", "Engine", "", "", 1000, 1, {}).value();

    assert(ledger.fundProject("f1", 42, 10).code() == ErrorCode::NOT_FOUND);
    assert(ledger.fundProject("f1", id, 0).code() == ErrorCode::INVALID_INPUT);
    assert(ledger.fundProject("", id, 10).code() == ErrorCode::UNAUTHORIZED);

    now = 1000 + SECONDS_PER_DAY - 1;
    assert(ledger.fundProject("f1", id, 10).ok());
    now = 1000 + SECONDS_PER_DAY;
    assert(ledger.fundProject("f1", id, 10).code() == ErrorCode::INVALID_STATE);

    auto p = ledger.getProject(id).value();
    assert(p.currentFunding() == 10);
    assert(p.status == ProjectStatus::ACTIVE);
    assert(ledger.getPoolBalance() == 10);
}

static void testFundingOverflowRejected() {
    std::atomic<uint64_t> now{1000};
    FundingLedger ledger;
    openLedger(ledger, now);
    ProjectId id = ledger.createProject("r1", "Engine", "", "", UINT64_MAX, 30, {}).value();

    assert(ledger.fundProject("f1", id, UINT64_MAX - 1).ok());
    assert(ledger.fundProject("f2", id, 2).code() == ErrorCode::LIMIT_EXCEEDED);
    assert(ledger.getProject(id).value().currentFunding() == UINT64_MAX - 1);
    assert(ledger.getContribution(id, "f2").value() == 0);
}

static void testConcurrentFundersStopAtGoal() {
    std::atomic<uint64_t> now{1000};
    FundingLedger ledger;
    openLedger(ledger, now);
    ProjectId id = ledger.createProject("r1", "Engine", "", "", 1000, 30, {}).value();

    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> rejected{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            std::string funder = "funder" + std::to_string(t);
            for (int i = 0; i < 10; ++i) {
                auto r = ledger.fundProject(funder, id, 50);
                if (r.ok()) {
                    accepted += 50;
                } else {
                    assert(r.code() == ErrorCode::INVALID_STATE);
                    rejected++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    auto p = ledger.getProject(id).value();
    assert(p.status == ProjectStatus::FUNDED);
    assert(p.currentFunding() == 1000);
    assert(accepted.load() == 1000);
    assert(rejected.load() == 60);
    assert(p.fundingConsistent());
    assert(ledger.getPoolBalance() == 1000);

    uint64_t sum = 0;
    for (const auto& c : p.contributors()) sum += p.contributionOf(c);
    assert(sum == p.currentFunding());
}

static void testStatusEventsPublished() {
    std::atomic<uint64_t> now{1000};
    FundingLedger ledger;
    openLedger(ledger, now);
    ProjectId id = ledger.createProject("r1", "Engine", "", "", 100, 30, {}).value();

    std::vector<LedgerEvent> seen;
    ledger.events().subscribeAll([&seen](const LedgerEvent& ev) { seen.push_back(ev); });

    assert(ledger.fundProject("f1", id, 60).ok());
    assert(ledger.fundProject("f1", id, 60).ok());
    assert(ledger.fundProject("f1", id, 60).failed());

    assert(seen.size() == 3);
    assert(seen[0].type == LedgerEventType::PROJECT_FUNDED);
    assert(seen[0].amount == 60);
    assert(seen[0].timestamp == 1000);
    assert(seen[1].type == LedgerEventType::PROJECT_FUNDED);
    assert(seen[2].type == LedgerEventType::PROJECT_STATUS_CHANGED);
    assert(seen[2].data.at("from") == "Active");
    assert(seen[2].data.at("to") == "Funded");
    assert(seen[0].sequence < seen[1].sequence);
}

int main() {
    testCreateProject();
    testCreateProjectRejections();
    testFundingReachesGoalWithOvershoot();
    testContributorsTracked();
    testFundingRejections();
    testFundingOverflowRejected();
    testConcurrentFundersStopAtGoal();
    testStatusEventsPublished();
    return 0;
}
