#pragma once

#include "core/ledger_store.h"
#include "infrastructure/error_handling.h"

namespace sciencefund {
namespace core {

enum class Operation : uint8_t {
    REGISTER_RESEARCHER,
    CREATE_PROJECT,
    FUND_PROJECT,
    CREATE_MILESTONE,
    COMPLETE_MILESTONE,
    VERIFY_MILESTONE,
    SET_VERIFIER,
    SET_PLATFORM_FEE,
    SET_FEE_RECIPIENT,
    EMERGENCY_WITHDRAW
};

enum class Capability : uint8_t {
    ANYONE,
    REGISTERED_RESEARCHER,
    PROJECT_RESEARCHER,
    TRUSTED_VERIFIER,
    PLATFORM_OWNER
};

const char* operationName(Operation op);
Capability requiredCapability(Operation op);

// Checks the caller against the capability the operation requires.
// projectResearcher is the owning researcher for project-scoped operations
// and is ignored otherwise. Every denial is UNAUTHORIZED.
Result<void> authorize(const LedgerStore& store, Operation op, const Principal& caller,
                       const Principal& projectResearcher = Principal());

}
}
