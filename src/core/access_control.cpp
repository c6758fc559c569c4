#include "core/access_control.h"

namespace sciencefund {
namespace core {

namespace {

struct OperationPolicy {
    Operation op;
    const char* name;
    Capability capability;
};

const OperationPolicy POLICIES[] = {
    {Operation::REGISTER_RESEARCHER, "registerResearcher", Capability::ANYONE},
    {Operation::CREATE_PROJECT, "createProject", Capability::REGISTERED_RESEARCHER},
    {Operation::FUND_PROJECT, "fundProject", Capability::ANYONE},
    {Operation::CREATE_MILESTONE, "createMilestone", Capability::PROJECT_RESEARCHER},
    {Operation::COMPLETE_MILESTONE, "completeMilestone", Capability::PROJECT_RESEARCHER},
    {Operation::VERIFY_MILESTONE, "verifyMilestone", Capability::TRUSTED_VERIFIER},
    {Operation::SET_VERIFIER, "setVerifier", Capability::PLATFORM_OWNER},
    {Operation::SET_PLATFORM_FEE, "setPlatformFee", Capability::PLATFORM_OWNER},
    {Operation::SET_FEE_RECIPIENT, "setFeeRecipient", Capability::PLATFORM_OWNER},
    {Operation::EMERGENCY_WITHDRAW, "emergencyWithdraw", Capability::PLATFORM_OWNER},
};

const OperationPolicy& policyFor(Operation op) {
    for (const auto& p : POLICIES) {
        if (p.op == op) return p;
    }
    return POLICIES[0];
}

}

const char* operationName(Operation op) {
    return policyFor(op).name;
}

Capability requiredCapability(Operation op) {
    return policyFor(op).capability;
}

Result<void> authorize(const LedgerStore& store, Operation op, const Principal& caller,
                       const Principal& projectResearcher) {
    const OperationPolicy& policy = policyFor(op);
    if (caller.empty()) {
        return makeError(ErrorCode::UNAUTHORIZED, "anonymous caller", policy.name);
    }

    switch (policy.capability) {
        case Capability::ANYONE:
            return Result<void>();
        case Capability::REGISTERED_RESEARCHER:
            SCIENCEFUND_CHECK(store.findResearcher(caller) != nullptr, ErrorCode::UNAUTHORIZED,
                              "caller is not a registered researcher");
            return Result<void>();
        case Capability::PROJECT_RESEARCHER:
            SCIENCEFUND_CHECK(!projectResearcher.empty() && caller == projectResearcher, ErrorCode::UNAUTHORIZED,
                              "caller is not the project researcher");
            return Result<void>();
        case Capability::TRUSTED_VERIFIER:
            SCIENCEFUND_CHECK(store.isVerifier(caller), ErrorCode::UNAUTHORIZED,
                              "caller is not a trusted verifier");
            return Result<void>();
        case Capability::PLATFORM_OWNER:
            SCIENCEFUND_CHECK(caller == store.owner(), ErrorCode::UNAUTHORIZED,
                              "caller is not the platform owner");
            return Result<void>();
    }
    return makeError(ErrorCode::INTERNAL_ERROR, "unknown capability", policy.name);
}

}
}
