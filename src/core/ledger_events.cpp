#include "core/ledger_events.h"
#include "utils/logger.h"
#include <algorithm>
#include <exception>

namespace sciencefund {
namespace core {

const char* ledgerEventName(LedgerEventType type) {
    switch (type) {
        case LedgerEventType::RESEARCHER_REGISTERED: return "ResearcherRegistered";
        case LedgerEventType::PROJECT_CREATED: return "ProjectCreated";
        case LedgerEventType::PROJECT_FUNDED: return "ProjectFunded";
        case LedgerEventType::PROJECT_STATUS_CHANGED: return "ProjectStatusChanged";
        case LedgerEventType::MILESTONE_CREATED: return "MilestoneCreated";
        case LedgerEventType::MILESTONE_COMPLETED: return "MilestoneCompleted";
        case LedgerEventType::MILESTONE_VERIFIED: return "MilestoneVerified";
        case LedgerEventType::FUNDS_RELEASED: return "FundsReleased";
        case LedgerEventType::VERIFIER_UPDATED: return "VerifierUpdated";
        case LedgerEventType::PLATFORM_FEE_UPDATED: return "PlatformFeeUpdated";
        case LedgerEventType::FEE_RECIPIENT_UPDATED: return "FeeRecipientUpdated";
        case LedgerEventType::EMERGENCY_WITHDRAWAL: return "EmergencyWithdrawal";
        default: return "Unknown";
    }
}

LedgerEventBus::LedgerEventBus() : nextSubscriptionId_(1), sequence_(0) {}

uint64_t LedgerEventBus::addSubscription(Subscription sub) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = nextSubscriptionId_++;
    sub.id = id;
    subscriptions_.push_back(std::move(sub));
    std::stable_sort(subscriptions_.begin(), subscriptions_.end(),
        [](const Subscription& a, const Subscription& b) {
            return a.priority > b.priority;
        });
    return id;
}

uint64_t LedgerEventBus::subscribe(LedgerEventType type, LedgerEventHandler handler, int priority) {
    return addSubscription(Subscription{0, false, type, std::move(handler), priority});
}

uint64_t LedgerEventBus::subscribeAll(LedgerEventHandler handler, int priority) {
    return addSubscription(Subscription{0, true, LedgerEventType::RESEARCHER_REGISTERED, std::move(handler), priority});
}

bool LedgerEventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(subscriptions_.begin(), subscriptions_.end(),
        [id](const Subscription& s) { return s.id == id; });
    bool found = it != subscriptions_.end();
    subscriptions_.erase(it, subscriptions_.end());
    return found;
}

void LedgerEventBus::publish(LedgerEvent event) {
    std::vector<Subscription> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.sequence = ++sequence_;
        for (const auto& sub : subscriptions_) {
            if (sub.allTypes || sub.type == event.type) targets.push_back(sub);
        }
    }

    for (const auto& sub : targets) {
        try {
            sub.handler(event);
        } catch (const std::exception& e) {
            LOG_WARN("events",
                std::string("handler for ") + ledgerEventName(event.type) + " threw: " + e.what());
        }
    }
}

void LedgerEventBus::publishAll(std::vector<LedgerEvent> events) {
    for (auto& event : events) publish(std::move(event));
}

uint64_t LedgerEventBus::publishedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

size_t LedgerEventBus::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

}
}
