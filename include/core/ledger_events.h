#pragma once

#include "core/ledger_store.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <functional>
#include <cstdint>

namespace sciencefund {
namespace core {

enum class LedgerEventType : uint8_t {
    RESEARCHER_REGISTERED,
    PROJECT_CREATED,
    PROJECT_FUNDED,
    PROJECT_STATUS_CHANGED,
    MILESTONE_CREATED,
    MILESTONE_COMPLETED,
    MILESTONE_VERIFIED,
    FUNDS_RELEASED,
    VERIFIER_UPDATED,
    PLATFORM_FEE_UPDATED,
    FEE_RECIPIENT_UPDATED,
    EMERGENCY_WITHDRAWAL
};

const char* ledgerEventName(LedgerEventType type);

struct LedgerEvent {
    LedgerEventType type = LedgerEventType::RESEARCHER_REGISTERED;
    uint64_t sequence = 0;
    uint64_t timestamp = 0;
    Principal actor;
    ProjectId projectId = 0;
    MilestoneId milestoneId = 0;
    Amount amount = 0;
    std::map<std::string, std::string> data;
};

using LedgerEventHandler = std::function<void(const LedgerEvent&)>;

// Synchronous fan-out of committed ledger changes. Handlers run on the
// publishing thread with no bus or ledger lock held, so they may call back
// into the ledger.
class LedgerEventBus {
public:
    LedgerEventBus();

    uint64_t subscribe(LedgerEventType type, LedgerEventHandler handler, int priority = 0);
    uint64_t subscribeAll(LedgerEventHandler handler, int priority = 0);
    bool unsubscribe(uint64_t id);

    void publish(LedgerEvent event);
    void publishAll(std::vector<LedgerEvent> events);

    uint64_t publishedCount() const;
    size_t subscriptionCount() const;

private:
    struct Subscription {
        uint64_t id;
        bool allTypes;
        LedgerEventType type;
        LedgerEventHandler handler;
        int priority;
    };

    uint64_t addSubscription(Subscription sub);

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    uint64_t nextSubscriptionId_;
    uint64_t sequence_;
};

}
}
