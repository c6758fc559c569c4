#include "core/funding_ledger.h"
#include "core/access_control.h"
#include "core/registry.h"
#include "core/project_engine.h"
#include "core/milestone_engine.h"
#include "utils/logger.h"
#include <atomic>
#include <mutex>
#include <thread>
#include <ctime>

namespace sciencefund {
namespace core {

struct FundingLedger::Impl {
    mutable std::mutex mtx;
    // Thread currently running a mutation, so hooks invoked under the lock
    // (the transfer check) can call back into the ledger without deadlocking.
    std::atomic<std::thread::id> writer{};
    LedgerStore store;
    ResearcherRegistry registry;
    ProjectEngine projects;
    EscrowEngine escrow;
    MilestoneEngine milestones;
    LedgerEventBus bus;
    Clock clock;

    Impl()
        : registry(store),
          projects(store, registry),
          escrow(store, registry),
          milestones(store, projects, escrow),
          clock([]() { return static_cast<uint64_t>(std::time(nullptr)); }) {}

    Result<void> openStore(const std::string& dbPath, const PlatformParams& params) {
        std::lock_guard<std::mutex> lock(mtx);
        auto opened = store.open(dbPath);
        if (opened.failed()) return opened;
        if (store.isInitialized()) return Result<void>();

        StoreTransaction tx(store);
        if (tx.started().failed()) {
            store.close();
            return tx.started();
        }
        auto seeded = store.initialize(params);
        if (seeded.failed()) {
            store.close();
            return seeded;
        }
        auto committed = tx.commit();
        if (committed.failed()) {
            store.close();
            return committed;
        }
        LOG_INFO("ledger", "initialized ledger owned by " + params.owner);
        return Result<void>();
    }

    // Runs body as one store transaction under the lock. Events collected by
    // the body are published only if the commit succeeds.
    template<typename T, typename Body>
    Result<T> mutate(Operation op, const Principal& caller, Body body) {
        std::vector<LedgerEvent> events;
        uint64_t now = 0;
        Result<T> result = [&]() -> Result<T> {
            if (reentered()) {
                return makeError(ErrorCode::INVALID_STATE, "ledger operation already in progress on this thread");
            }
            std::lock_guard<std::mutex> lock(mtx);
            WriterScope scope(writer);
            if (!store.isOpen()) return makeError(ErrorCode::INVALID_STATE, "ledger is not open");
            StoreTransaction tx(store);
            if (tx.started().failed()) return tx.started().error();
            now = clock();
            Result<T> r = body(now, events);
            if (r.failed()) return r;
            auto committed = tx.commit();
            if (committed.failed()) return committed.error();
            return r;
        }();

        if (result.failed()) {
            LOG_WARN("ledger",
                std::string(operationName(op)) + " by " + caller + " rejected: " + describe(result.error()));
            return result;
        }

        LOG_INFO("ledger", std::string(operationName(op)) + " by " + caller);
        for (auto& ev : events) {
            if (ev.timestamp == 0) ev.timestamp = now;
        }
        bus.publishAll(std::move(events));
        return result;
    }

    // A view issued from inside a mutation reads the uncommitted state of
    // that mutation; the lock is already held by the calling thread.
    template<typename Fn>
    auto view(Fn fn) const -> decltype(fn()) {
        if (reentered()) return fn();
        std::lock_guard<std::mutex> lock(mtx);
        return fn();
    }

    bool reentered() const {
        return writer.load() == std::this_thread::get_id();
    }

    struct WriterScope {
        std::atomic<std::thread::id>& slot;
        explicit WriterScope(std::atomic<std::thread::id>& s) : slot(s) { slot = std::this_thread::get_id(); }
        ~WriterScope() { slot = std::thread::id(); }
    };
};

FundingLedger::FundingLedger() : impl_(std::make_unique<Impl>()) {}

FundingLedger::~FundingLedger() {
    close();
}

Result<void> FundingLedger::open(const std::string& dbPath, const PlatformParams& params) {
    return impl_->openStore(dbPath, params);
}

Result<void> FundingLedger::openInMemory(const PlatformParams& params) {
    return impl_->openStore(":memory:", params);
}

void FundingLedger::close() {
    if (impl_->reentered()) {
        LOG_WARN("ledger", "close ignored while an operation is in progress");
        return;
    }
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->store.isOpen()) impl_->store.close();
}

bool FundingLedger::isOpen() const {
    return impl_->view([&]() { return impl_->store.isOpen(); });
}

void FundingLedger::setClock(Clock clock) {
    if (impl_->reentered()) {
        LOG_WARN("ledger", "clock change ignored while an operation is in progress");
        return;
    }
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->clock = std::move(clock);
}

void FundingLedger::setTransferCheck(TransferCheck check) {
    if (impl_->reentered()) {
        LOG_WARN("ledger", "transfer check change ignored while an operation is in progress");
        return;
    }
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->escrow.setTransferCheck(std::move(check));
}

LedgerEventBus& FundingLedger::events() {
    return impl_->bus;
}

Result<void> FundingLedger::registerResearcher(const Principal& caller, const std::string& name,
                                               const std::string& institution,
                                               const std::vector<std::string>& expertise) {
    return impl_->mutate<void>(Operation::REGISTER_RESEARCHER, caller,
        [&](uint64_t, std::vector<LedgerEvent>& events) {
            return impl_->registry.registerResearcher(caller, name, institution, expertise, events);
        });
}

Result<ProjectId> FundingLedger::createProject(const Principal& caller, const std::string& title,
                                               const std::string& description, const std::string& researchArea,
                                               Amount fundingGoal, uint64_t durationDays,
                                               const std::vector<std::string>& milestoneTexts) {
    ProjectDraft draft;
    draft.title = title;
    draft.description = description;
    draft.researchArea = researchArea;
    draft.fundingGoal = fundingGoal;
    draft.durationDays = durationDays;
    draft.milestoneTexts = milestoneTexts;
    return impl_->mutate<ProjectId>(Operation::CREATE_PROJECT, caller,
        [&](uint64_t now, std::vector<LedgerEvent>& events) {
            return impl_->projects.createProject(caller, draft, now, events);
        });
}

Result<void> FundingLedger::fundProject(const Principal& caller, ProjectId projectId, Amount amount) {
    return impl_->mutate<void>(Operation::FUND_PROJECT, caller,
        [&](uint64_t now, std::vector<LedgerEvent>& events) -> Result<void> {
            auto funded = impl_->projects.fundProject(caller, projectId, amount, now, events);
            if (funded.failed()) return funded;
            return impl_->escrow.deposit(amount);
        });
}

Result<MilestoneId> FundingLedger::createMilestone(const Principal& caller, ProjectId projectId,
                                                   const std::string& description, Amount fundingAmount) {
    return impl_->mutate<MilestoneId>(Operation::CREATE_MILESTONE, caller,
        [&](uint64_t, std::vector<LedgerEvent>& events) {
            return impl_->milestones.createMilestone(caller, projectId, description, fundingAmount, events);
        });
}

Result<void> FundingLedger::completeMilestone(const Principal& caller, MilestoneId milestoneId,
                                              const std::string& evidence) {
    return impl_->mutate<void>(Operation::COMPLETE_MILESTONE, caller,
        [&](uint64_t now, std::vector<LedgerEvent>& events) {
            return impl_->milestones.completeMilestone(caller, milestoneId, evidence, now, events);
        });
}

Result<void> FundingLedger::verifyMilestone(const Principal& caller, MilestoneId milestoneId) {
    return impl_->mutate<void>(Operation::VERIFY_MILESTONE, caller,
        [&](uint64_t now, std::vector<LedgerEvent>& events) -> Result<void> {
            auto released = impl_->milestones.verifyMilestone(caller, milestoneId, now, events);
            if (released.failed()) return released.error();
            return Result<void>();
        });
}

Result<void> FundingLedger::setVerifier(const Principal& caller, const Principal& verifier, bool enabled) {
    return impl_->mutate<void>(Operation::SET_VERIFIER, caller,
        [&](uint64_t, std::vector<LedgerEvent>& events) -> Result<void> {
            auto auth = authorize(impl_->store, Operation::SET_VERIFIER, caller);
            if (auth.failed()) return auth;
            SCIENCEFUND_CHECK(!verifier.empty(), ErrorCode::INVALID_INPUT, "verifier must not be empty");
            impl_->store.setVerifier(verifier, enabled);

            LedgerEvent ev;
            ev.type = LedgerEventType::VERIFIER_UPDATED;
            ev.actor = caller;
            ev.data["verifier"] = verifier;
            ev.data["enabled"] = enabled ? "true" : "false";
            events.push_back(std::move(ev));
            return Result<void>();
        });
}

Result<void> FundingLedger::setPlatformFee(const Principal& caller, uint64_t feeBps) {
    return impl_->mutate<void>(Operation::SET_PLATFORM_FEE, caller,
        [&](uint64_t, std::vector<LedgerEvent>& events) -> Result<void> {
            auto auth = authorize(impl_->store, Operation::SET_PLATFORM_FEE, caller);
            if (auth.failed()) return auth;
            SCIENCEFUND_CHECK(feeBps <= MAX_FEE_BPS, ErrorCode::LIMIT_EXCEEDED, "platform fee above cap");
            uint64_t previous = impl_->store.feeBps();
            impl_->store.setFeeBps(feeBps);

            LedgerEvent ev;
            ev.type = LedgerEventType::PLATFORM_FEE_UPDATED;
            ev.actor = caller;
            ev.amount = feeBps;
            ev.data["previous"] = std::to_string(previous);
            events.push_back(std::move(ev));
            return Result<void>();
        });
}

Result<void> FundingLedger::setFeeRecipient(const Principal& caller, const Principal& recipient) {
    return impl_->mutate<void>(Operation::SET_FEE_RECIPIENT, caller,
        [&](uint64_t, std::vector<LedgerEvent>& events) -> Result<void> {
            auto auth = authorize(impl_->store, Operation::SET_FEE_RECIPIENT, caller);
            if (auth.failed()) return auth;
            SCIENCEFUND_CHECK(!recipient.empty(), ErrorCode::INVALID_INPUT, "fee recipient must not be empty");
            impl_->store.setFeeRecipient(recipient);

            LedgerEvent ev;
            ev.type = LedgerEventType::FEE_RECIPIENT_UPDATED;
            ev.actor = caller;
            ev.data["recipient"] = recipient;
            events.push_back(std::move(ev));
            return Result<void>();
        });
}

Result<Amount> FundingLedger::emergencyWithdraw(const Principal& caller) {
    return impl_->mutate<Amount>(Operation::EMERGENCY_WITHDRAW, caller,
        [&](uint64_t now, std::vector<LedgerEvent>& events) {
            return impl_->escrow.emergencyWithdraw(caller, now, events);
        });
}

Result<Project> FundingLedger::getProject(ProjectId projectId) const {
    return impl_->view([&]() { return impl_->projects.getProject(projectId); });
}

Result<std::vector<Principal>> FundingLedger::getProjectContributors(ProjectId projectId) const {
    return impl_->view([&]() { return impl_->projects.contributors(projectId); });
}

Result<Amount> FundingLedger::getContribution(ProjectId projectId, const Principal& contributor) const {
    return impl_->view([&]() { return impl_->projects.contribution(projectId, contributor); });
}

Result<Researcher> FundingLedger::getResearcher(const Principal& id) const {
    return impl_->view([&]() { return impl_->registry.getResearcher(id); });
}

Result<Milestone> FundingLedger::getMilestone(MilestoneId milestoneId) const {
    return impl_->view([&]() { return impl_->milestones.getMilestone(milestoneId); });
}

Result<std::vector<MilestoneId>> FundingLedger::getProjectMilestones(ProjectId projectId) const {
    return impl_->view([&]() -> Result<std::vector<MilestoneId>> {
        auto milestones = impl_->milestones.getProjectMilestones(projectId);
        if (milestones.failed()) return milestones.error();
        std::vector<MilestoneId> ids;
        for (const auto& m : milestones.value()) ids.push_back(m.id);
        return ids;
    });
}

Result<Amount> FundingLedger::getMilestoneAllocation(ProjectId projectId) const {
    return impl_->view([&]() { return impl_->milestones.allocation(projectId); });
}

uint64_t FundingLedger::getTotalProjects() const {
    return impl_->view([&]() { return impl_->store.projectCount(); });
}

uint64_t FundingLedger::getTotalMilestones() const {
    return impl_->view([&]() { return impl_->store.milestoneCount(); });
}

bool FundingLedger::isVerifier(const Principal& id) const {
    return impl_->view([&]() { return impl_->store.isVerifier(id); });
}

uint64_t FundingLedger::getPlatformFee() const {
    return impl_->view([&]() { return impl_->store.feeBps(); });
}

Principal FundingLedger::getFeeRecipient() const {
    return impl_->view([&]() { return Principal(impl_->store.feeRecipient()); });
}

Principal FundingLedger::getOwner() const {
    return impl_->view([&]() { return Principal(impl_->store.owner()); });
}

Amount FundingLedger::getBalance(const Principal& id) const {
    return impl_->view([&]() { return impl_->escrow.balanceOf(id); });
}

Amount FundingLedger::getPoolBalance() const {
    return impl_->view([&]() { return impl_->escrow.poolBalance(); });
}

}
}
