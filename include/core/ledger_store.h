#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <cstdint>

namespace sciencefund {
namespace core {

using Principal = std::string;
using Amount = uint64_t;
using ProjectId = uint64_t;
using MilestoneId = uint64_t;

constexpr uint64_t INITIAL_REPUTATION = 100;
constexpr uint64_t REPUTATION_PER_RELEASE = 10;
constexpr uint64_t BPS_DENOMINATOR = 10000;
constexpr uint64_t MAX_FEE_BPS = 1000;
constexpr uint64_t DEFAULT_FEE_BPS = 250;
constexpr uint64_t SECONDS_PER_DAY = 86400;

// COMPLETED and CANCELLED are never entered by a ledger operation.
enum class ProjectStatus : uint8_t {
    ACTIVE = 0,
    FUNDED = 1,
    IN_PROGRESS = 2,
    COMPLETED = 3,
    CANCELLED = 4
};

const char* projectStatusName(ProjectStatus status);

struct Researcher {
    Principal id;
    std::string name;
    std::string institution;
    std::vector<std::string> expertise;
    uint64_t reputation = INITIAL_REPUTATION;
    bool verified = false;
    std::vector<ProjectId> projects;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, Researcher& out);
};

class Project {
public:
    ProjectId id = 0;
    Principal researcher;
    std::string title;
    std::string description;
    std::string researchArea;
    Amount fundingGoal = 0;
    uint64_t deadline = 0;
    ProjectStatus status = ProjectStatus::ACTIVE;
    uint64_t createdAt = 0;
    std::vector<std::string> milestoneTexts;

    Amount currentFunding() const { return currentFunding_; }
    const std::vector<Principal>& contributors() const { return contributors_; }
    Amount contributionOf(const Principal& contributor) const;

    // Adds amount to the contributor's running total and to currentFunding.
    // Returns false without changing anything on zero amount or overflow.
    bool recordContribution(const Principal& contributor, Amount amount);

    // currentFunding == sum(contributions) and contributor list matches the
    // non-zero entries of the contribution map.
    bool fundingConsistent() const;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, Project& out);

private:
    Amount currentFunding_ = 0;
    std::vector<Principal> contributors_;
    std::map<Principal, Amount> contributions_;
};

struct Milestone {
    MilestoneId id = 0;
    ProjectId projectId = 0;
    std::string description;
    Amount fundingAmount = 0;
    bool completed = false;
    bool verified = false;
    uint64_t completedAt = 0;
    std::string evidence;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, Milestone& out);
};

struct PlatformParams {
    Principal owner;
    uint64_t feeBps = DEFAULT_FEE_BPS;
    Principal feeRecipient;
    std::vector<Principal> verifiers;
};

// Monotonic id source. 0 is never issued.
class IdSequence {
public:
    IdSequence() : last_(0) {}
    explicit IdSequence(uint64_t last) : last_(last) {}

    uint64_t next() { return ++last_; }
    uint64_t last() const { return last_; }
    bool contains(uint64_t id) const { return id >= 1 && id <= last_; }

private:
    uint64_t last_;
};

// Durable home of every ledger entity. Reads are served from memory; writes
// are only accepted between begin() and commit()/rollback(), and commit()
// persists the touched records to SQLite in one transaction. Not thread safe:
// the owner serializes access.
class LedgerStore {
public:
    static constexpr uint64_t SCHEMA_VERSION = 1;

    LedgerStore();
    ~LedgerStore();

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    Result<void> open(const std::string& dbPath);
    void close();
    bool isOpen() const;
    bool isInitialized() const;

    // Seeds platform parameters and verifier set of a fresh database.
    Result<void> initialize(const PlatformParams& params);

    Result<void> begin();
    Result<void> commit();
    void rollback();
    bool inTransaction() const;

    const Researcher* findResearcher(const Principal& id) const;
    void putResearcher(const Researcher& researcher);

    const Project* findProject(ProjectId id) const;
    void putProject(const Project& project);
    ProjectId nextProjectId();
    uint64_t projectCount() const;

    const Milestone* findMilestone(MilestoneId id) const;
    void putMilestone(const Milestone& milestone);
    MilestoneId nextMilestoneId();
    uint64_t milestoneCount() const;
    std::vector<MilestoneId> milestonesOf(ProjectId projectId) const;

    bool isVerifier(const Principal& id) const;
    void setVerifier(const Principal& id, bool enabled);

    const Principal& owner() const;
    uint64_t feeBps() const;
    void setFeeBps(uint64_t bps);
    const Principal& feeRecipient() const;
    void setFeeRecipient(const Principal& recipient);

    Amount balanceOf(const Principal& id) const;
    void setBalance(const Principal& id, Amount amount);
    Amount poolBalance() const;
    void setPoolBalance(Amount amount);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Begins on construction and rolls back on destruction unless committed.
class StoreTransaction {
public:
    explicit StoreTransaction(LedgerStore& store);
    ~StoreTransaction();

    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    const Result<void>& started() const { return started_; }
    Result<void> commit();

private:
    LedgerStore& store_;
    Result<void> started_;
    bool done_;
};

}
}
