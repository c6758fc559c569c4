#include "core/ledger_store.h"
#include "database/database.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <optional>
#include <stdexcept>
#include <cstdio>

namespace sciencefund {
namespace core {

using utils::ByteReader;
using utils::ByteWriter;

static const char* KEY_SCHEMA = "meta:schema_version";
static const char* KEY_OWNER = "meta:owner";
static const char* KEY_FEE_BPS = "meta:fee_bps";
static const char* KEY_FEE_RECIPIENT = "meta:fee_recipient";
static const char* KEY_POOL = "meta:pool";
static const char* KEY_LAST_PROJECT = "meta:last_project_id";
static const char* KEY_LAST_MILESTONE = "meta:last_milestone_id";

static const std::string PREFIX_RESEARCHER = "researcher:";
static const std::string PREFIX_PROJECT = "project:";
static const std::string PREFIX_MILESTONE = "milestone:";
static const std::string PREFIX_VERIFIER = "verifier:";
static const std::string PREFIX_BALANCE = "balance:";

static std::string idKey(const std::string& prefix, uint64_t id) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(id));
    return prefix + buf;
}

static std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static std::string stringOf(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

const char* projectStatusName(ProjectStatus status) {
    switch (status) {
        case ProjectStatus::ACTIVE: return "Active";
        case ProjectStatus::FUNDED: return "Funded";
        case ProjectStatus::IN_PROGRESS: return "InProgress";
        case ProjectStatus::COMPLETED: return "Completed";
        case ProjectStatus::CANCELLED: return "Cancelled";
        default: return "Unknown";
    }
}

std::vector<uint8_t> Researcher::serialize() const {
    ByteWriter w;
    w.writeString(id);
    w.writeString(name);
    w.writeString(institution);
    w.writeStringList(expertise);
    w.writeUint64(reputation);
    w.writeBool(verified);
    w.writeVarInt(projects.size());
    for (ProjectId pid : projects) w.writeUint64(pid);
    return w.take();
}

bool Researcher::deserialize(const std::vector<uint8_t>& data, Researcher& out) {
    ByteReader r(data);
    Researcher res;
    uint64_t projectCount = 0;
    if (!r.readString(res.id) || !r.readString(res.name) || !r.readString(res.institution)) return false;
    if (!r.readStringList(res.expertise)) return false;
    if (!r.readUint64(res.reputation) || !r.readBool(res.verified)) return false;
    if (!r.readVarInt(projectCount) || projectCount > r.remaining() / 8) return false;
    for (uint64_t i = 0; i < projectCount; i++) {
        uint64_t pid = 0;
        if (!r.readUint64(pid)) return false;
        res.projects.push_back(pid);
    }
    if (!r.atEnd()) return false;
    out = std::move(res);
    return true;
}

Amount Project::contributionOf(const Principal& contributor) const {
    auto it = contributions_.find(contributor);
    return it != contributions_.end() ? it->second : 0;
}

bool Project::recordContribution(const Principal& contributor, Amount amount) {
    if (amount == 0) return false;
    if (currentFunding_ > UINT64_MAX - amount) return false;
    Amount previous = contributionOf(contributor);
    if (previous > UINT64_MAX - amount) return false;

    if (previous == 0) contributors_.push_back(contributor);
    contributions_[contributor] = previous + amount;
    currentFunding_ += amount;
    return true;
}

bool Project::fundingConsistent() const {
    if (contributors_.size() != contributions_.size()) return false;
    Amount sum = 0;
    for (const auto& c : contributors_) {
        auto it = contributions_.find(c);
        if (it == contributions_.end() || it->second == 0) return false;
        if (sum > UINT64_MAX - it->second) return false;
        sum += it->second;
    }
    return sum == currentFunding_;
}

std::vector<uint8_t> Project::serialize() const {
    ByteWriter w;
    w.writeUint64(id);
    w.writeString(researcher);
    w.writeString(title);
    w.writeString(description);
    w.writeString(researchArea);
    w.writeUint64(fundingGoal);
    w.writeUint64(currentFunding_);
    w.writeUint64(deadline);
    w.writeUint8(static_cast<uint8_t>(status));
    w.writeUint64(createdAt);
    w.writeStringList(milestoneTexts);
    w.writeVarInt(contributors_.size());
    for (const auto& c : contributors_) {
        w.writeString(c);
        w.writeUint64(contributionOf(c));
    }
    return w.take();
}

bool Project::deserialize(const std::vector<uint8_t>& data, Project& out) {
    ByteReader r(data);
    Project p;
    uint8_t status = 0;
    uint64_t contributorCount = 0;
    if (!r.readUint64(p.id) || !r.readString(p.researcher) || !r.readString(p.title) ||
        !r.readString(p.description) || !r.readString(p.researchArea)) {
        return false;
    }
    if (!r.readUint64(p.fundingGoal) || !r.readUint64(p.currentFunding_) || !r.readUint64(p.deadline)) return false;
    if (!r.readUint8(status) || status > static_cast<uint8_t>(ProjectStatus::CANCELLED)) return false;
    p.status = static_cast<ProjectStatus>(status);
    if (!r.readUint64(p.createdAt) || !r.readStringList(p.milestoneTexts)) return false;
    if (!r.readVarInt(contributorCount) || contributorCount > r.remaining()) return false;
    for (uint64_t i = 0; i < contributorCount; i++) {
        std::string contributor;
        Amount amount = 0;
        if (!r.readString(contributor) || !r.readUint64(amount)) return false;
        if (p.contributions_.count(contributor)) return false;
        p.contributors_.push_back(contributor);
        p.contributions_[contributor] = amount;
    }
    if (!r.atEnd()) return false;
    out = std::move(p);
    return true;
}

std::vector<uint8_t> Milestone::serialize() const {
    ByteWriter w;
    w.writeUint64(id);
    w.writeUint64(projectId);
    w.writeString(description);
    w.writeUint64(fundingAmount);
    w.writeBool(completed);
    w.writeBool(verified);
    w.writeUint64(completedAt);
    w.writeString(evidence);
    return w.take();
}

bool Milestone::deserialize(const std::vector<uint8_t>& data, Milestone& out) {
    ByteReader r(data);
    Milestone m;
    if (!r.readUint64(m.id) || !r.readUint64(m.projectId) || !r.readString(m.description) ||
        !r.readUint64(m.fundingAmount) || !r.readBool(m.completed) || !r.readBool(m.verified) ||
        !r.readUint64(m.completedAt) || !r.readString(m.evidence)) {
        return false;
    }
    if (!r.atEnd()) return false;
    out = std::move(m);
    return true;
}

namespace {

// Live values plus the pre-transaction value of every key written since begin().
template <typename K, typename V>
struct TrackedMap {
    std::map<K, V> live;
    std::map<K, std::optional<V>> undo;

    const V* find(const K& key) const {
        auto it = live.find(key);
        return it != live.end() ? &it->second : nullptr;
    }

    void put(const K& key, const V& value) {
        if (undo.find(key) == undo.end()) {
            auto it = live.find(key);
            undo.emplace(key, it == live.end() ? std::optional<V>() : std::optional<V>(it->second));
        }
        live[key] = value;
    }

    void rollback() {
        for (auto& [key, old] : undo) {
            if (old) live[key] = *old;
            else live.erase(key);
        }
        undo.clear();
    }

    void accept() { undo.clear(); }
};

struct Meta {
    bool initialized = false;
    Principal owner;
    uint64_t feeBps = DEFAULT_FEE_BPS;
    Principal feeRecipient;
    Amount pool = 0;
    IdSequence projectIds;
    IdSequence milestoneIds;
};

}

struct LedgerStore::Impl {
    database::Database db;
    bool open = false;
    bool inTxn = false;

    TrackedMap<Principal, Researcher> researchers;
    TrackedMap<ProjectId, Project> projects;
    TrackedMap<MilestoneId, Milestone> milestones;
    TrackedMap<Principal, bool> verifiers;
    TrackedMap<Principal, Amount> balances;
    Meta meta;
    Meta metaSnapshot;

    void requireTxn() const {
        if (!inTxn) throw std::logic_error("ledger store write outside a transaction");
    }

    void reset() {
        researchers = {};
        projects = {};
        milestones = {};
        verifiers = {};
        balances = {};
        meta = Meta{};
        metaSnapshot = Meta{};
        inTxn = false;
    }

    Error fail(const std::string& message) {
        Error err = makeError(ErrorCode::DATABASE_ERROR, message, "store");
        ErrorHandler::instance().report(err);
        return err;
    }

    Result<void> load();
    void stage(database::WriteBatch& batch) const;
};

Result<void> LedgerStore::Impl::load() {
    std::vector<uint8_t> raw;
    if (!db.get(KEY_SCHEMA, raw)) return Result<void>();

    uint64_t version = 0;
    if (!utils::decodeU64(raw, version) || version != SCHEMA_VERSION) {
        return fail("unsupported ledger schema version");
    }

    uint64_t lastProject = 0, lastMilestone = 0;
    if (!db.get(KEY_OWNER, raw)) return fail("missing owner record");
    meta.owner = stringOf(raw);
    if (!db.get(KEY_FEE_RECIPIENT, raw)) return fail("missing fee recipient record");
    meta.feeRecipient = stringOf(raw);
    if (!db.get(KEY_FEE_BPS, raw) || !utils::decodeU64(raw, meta.feeBps)) return fail("missing fee record");
    if (!db.get(KEY_POOL, raw) || !utils::decodeU64(raw, meta.pool)) return fail("missing pool record");
    if (!db.get(KEY_LAST_PROJECT, raw) || !utils::decodeU64(raw, lastProject)) return fail("missing project sequence");
    if (!db.get(KEY_LAST_MILESTONE, raw) || !utils::decodeU64(raw, lastMilestone)) return fail("missing milestone sequence");
    if (meta.owner.empty() || meta.feeRecipient.empty() || meta.feeBps > MAX_FEE_BPS) {
        return fail("invalid platform parameters on disk");
    }
    meta.projectIds = IdSequence(lastProject);
    meta.milestoneIds = IdSequence(lastMilestone);
    meta.initialized = true;

    std::string badKey;
    bool scanned = db.forEach(PREFIX_RESEARCHER, [&](const std::string& key, const std::vector<uint8_t>& value) {
        Researcher r;
        if (!Researcher::deserialize(value, r) || key != PREFIX_RESEARCHER + r.id) {
            badKey = key;
            return false;
        }
        researchers.live[r.id] = std::move(r);
        return true;
    });
    scanned = scanned && badKey.empty() && db.forEach(PREFIX_PROJECT, [&](const std::string& key, const std::vector<uint8_t>& value) {
        Project p;
        if (!Project::deserialize(value, p) || key != idKey(PREFIX_PROJECT, p.id) ||
            !meta.projectIds.contains(p.id) || !p.fundingConsistent()) {
            badKey = key;
            return false;
        }
        projects.live[p.id] = std::move(p);
        return true;
    });
    scanned = scanned && badKey.empty() && db.forEach(PREFIX_MILESTONE, [&](const std::string& key, const std::vector<uint8_t>& value) {
        Milestone m;
        if (!Milestone::deserialize(value, m) || key != idKey(PREFIX_MILESTONE, m.id) ||
            !meta.milestoneIds.contains(m.id) || (m.verified && !m.completed) ||
            projects.live.find(m.projectId) == projects.live.end()) {
            badKey = key;
            return false;
        }
        milestones.live[m.id] = std::move(m);
        return true;
    });
    scanned = scanned && badKey.empty() && db.forEach(PREFIX_VERIFIER, [&](const std::string& key, const std::vector<uint8_t>& value) {
        if (value.size() != 1) {
            badKey = key;
            return false;
        }
        verifiers.live[key.substr(PREFIX_VERIFIER.size())] = value[0] != 0;
        return true;
    });
    scanned = scanned && badKey.empty() && db.forEach(PREFIX_BALANCE, [&](const std::string& key, const std::vector<uint8_t>& value) {
        Amount amount = 0;
        if (!utils::decodeU64(value, amount)) {
            badKey = key;
            return false;
        }
        balances.live[key.substr(PREFIX_BALANCE.size())] = amount;
        return true;
    });

    if (!badKey.empty()) return fail("corrupt ledger record " + badKey);
    if (!scanned) return fail("ledger scan failed: " + db.lastError());
    return Result<void>();
}

void LedgerStore::Impl::stage(database::WriteBatch& batch) const {
    for (const auto& [id, old] : researchers.undo) {
        batch.put(PREFIX_RESEARCHER + id, researchers.live.at(id).serialize());
    }
    for (const auto& [id, old] : projects.undo) {
        batch.put(idKey(PREFIX_PROJECT, id), projects.live.at(id).serialize());
    }
    for (const auto& [id, old] : milestones.undo) {
        batch.put(idKey(PREFIX_MILESTONE, id), milestones.live.at(id).serialize());
    }
    for (const auto& [id, old] : verifiers.undo) {
        batch.put(PREFIX_VERIFIER + id, std::vector<uint8_t>{static_cast<uint8_t>(verifiers.live.at(id) ? 1 : 0)});
    }
    for (const auto& [id, old] : balances.undo) {
        batch.put(PREFIX_BALANCE + id, utils::encodeU64(balances.live.at(id)));
    }
    if (meta.initialized) {
        batch.put(KEY_SCHEMA, utils::encodeU64(SCHEMA_VERSION));
        batch.put(KEY_OWNER, bytesOf(meta.owner));
        batch.put(KEY_FEE_BPS, utils::encodeU64(meta.feeBps));
        batch.put(KEY_FEE_RECIPIENT, bytesOf(meta.feeRecipient));
        batch.put(KEY_POOL, utils::encodeU64(meta.pool));
        batch.put(KEY_LAST_PROJECT, utils::encodeU64(meta.projectIds.last()));
        batch.put(KEY_LAST_MILESTONE, utils::encodeU64(meta.milestoneIds.last()));
    }
}

LedgerStore::LedgerStore() : impl_(std::make_unique<Impl>()) {}

LedgerStore::~LedgerStore() { close(); }

Result<void> LedgerStore::open(const std::string& dbPath) {
    if (impl_->open) return makeError(ErrorCode::INVALID_STATE, "ledger store already open");
    if (!impl_->db.open(dbPath)) {
        return impl_->fail("cannot open ledger database " + dbPath + ": " + impl_->db.lastError());
    }
    impl_->reset();
    auto loaded = impl_->load();
    if (loaded.failed()) {
        impl_->db.close();
        impl_->reset();
        return loaded;
    }
    impl_->open = true;
    LOG_DEBUG("store",
        "opened " + dbPath + " with " + std::to_string(impl_->projects.live.size()) + " projects");
    return Result<void>();
}

void LedgerStore::close() {
    if (impl_->inTxn) rollback();
    impl_->db.close();
    impl_->open = false;
}

bool LedgerStore::isOpen() const {
    return impl_->open;
}

bool LedgerStore::isInitialized() const {
    return impl_->meta.initialized;
}

Result<void> LedgerStore::initialize(const PlatformParams& params) {
    impl_->requireTxn();
    if (impl_->meta.initialized) return makeError(ErrorCode::INVALID_STATE, "ledger already initialized");
    if (params.owner.empty()) return makeError(ErrorCode::INVALID_INPUT, "owner must not be empty");
    if (params.feeBps > MAX_FEE_BPS) return makeError(ErrorCode::LIMIT_EXCEEDED, "platform fee above cap");

    impl_->meta.initialized = true;
    impl_->meta.owner = params.owner;
    impl_->meta.feeBps = params.feeBps;
    impl_->meta.feeRecipient = params.feeRecipient.empty() ? params.owner : params.feeRecipient;
    impl_->verifiers.put(params.owner, true);
    for (const auto& v : params.verifiers) {
        if (!v.empty()) impl_->verifiers.put(v, true);
    }
    return Result<void>();
}

Result<void> LedgerStore::begin() {
    if (!impl_->open) return makeError(ErrorCode::INVALID_STATE, "ledger store not open");
    if (impl_->inTxn) return makeError(ErrorCode::INTERNAL_ERROR, "nested ledger transaction");
    impl_->metaSnapshot = impl_->meta;
    impl_->inTxn = true;
    return Result<void>();
}

Result<void> LedgerStore::commit() {
    if (!impl_->inTxn) return makeError(ErrorCode::INTERNAL_ERROR, "commit without transaction");

    database::WriteBatch batch;
    impl_->stage(batch);
    if (batch.size() > 0 && !impl_->db.write(batch)) {
        std::string cause = impl_->db.lastError();
        rollback();
        return impl_->fail("ledger commit failed: " + cause);
    }

    impl_->researchers.accept();
    impl_->projects.accept();
    impl_->milestones.accept();
    impl_->verifiers.accept();
    impl_->balances.accept();
    impl_->inTxn = false;
    return Result<void>();
}

void LedgerStore::rollback() {
    if (!impl_->inTxn) return;
    impl_->researchers.rollback();
    impl_->projects.rollback();
    impl_->milestones.rollback();
    impl_->verifiers.rollback();
    impl_->balances.rollback();
    impl_->meta = impl_->metaSnapshot;
    impl_->inTxn = false;
}

bool LedgerStore::inTransaction() const {
    return impl_->inTxn;
}

const Researcher* LedgerStore::findResearcher(const Principal& id) const {
    return impl_->researchers.find(id);
}

void LedgerStore::putResearcher(const Researcher& researcher) {
    impl_->requireTxn();
    impl_->researchers.put(researcher.id, researcher);
}

const Project* LedgerStore::findProject(ProjectId id) const {
    return impl_->projects.find(id);
}

void LedgerStore::putProject(const Project& project) {
    impl_->requireTxn();
    impl_->projects.put(project.id, project);
}

ProjectId LedgerStore::nextProjectId() {
    impl_->requireTxn();
    return impl_->meta.projectIds.next();
}

uint64_t LedgerStore::projectCount() const {
    return impl_->meta.projectIds.last();
}

const Milestone* LedgerStore::findMilestone(MilestoneId id) const {
    return impl_->milestones.find(id);
}

void LedgerStore::putMilestone(const Milestone& milestone) {
    impl_->requireTxn();
    impl_->milestones.put(milestone.id, milestone);
}

MilestoneId LedgerStore::nextMilestoneId() {
    impl_->requireTxn();
    return impl_->meta.milestoneIds.next();
}

uint64_t LedgerStore::milestoneCount() const {
    return impl_->meta.milestoneIds.last();
}

std::vector<MilestoneId> LedgerStore::milestonesOf(ProjectId projectId) const {
    std::vector<MilestoneId> ids;
    for (const auto& [id, m] : impl_->milestones.live) {
        if (m.projectId == projectId) ids.push_back(id);
    }
    return ids;
}

bool LedgerStore::isVerifier(const Principal& id) const {
    const bool* flag = impl_->verifiers.find(id);
    return flag && *flag;
}

void LedgerStore::setVerifier(const Principal& id, bool enabled) {
    impl_->requireTxn();
    impl_->verifiers.put(id, enabled);
}

const Principal& LedgerStore::owner() const {
    return impl_->meta.owner;
}

uint64_t LedgerStore::feeBps() const {
    return impl_->meta.feeBps;
}

void LedgerStore::setFeeBps(uint64_t bps) {
    impl_->requireTxn();
    impl_->meta.feeBps = bps;
}

const Principal& LedgerStore::feeRecipient() const {
    return impl_->meta.feeRecipient;
}

void LedgerStore::setFeeRecipient(const Principal& recipient) {
    impl_->requireTxn();
    impl_->meta.feeRecipient = recipient;
}

Amount LedgerStore::balanceOf(const Principal& id) const {
    const Amount* amount = impl_->balances.find(id);
    return amount ? *amount : 0;
}

void LedgerStore::setBalance(const Principal& id, Amount amount) {
    impl_->requireTxn();
    impl_->balances.put(id, amount);
}

Amount LedgerStore::poolBalance() const {
    return impl_->meta.pool;
}

void LedgerStore::setPoolBalance(Amount amount) {
    impl_->requireTxn();
    impl_->meta.pool = amount;
}

StoreTransaction::StoreTransaction(LedgerStore& store)
    : store_(store), started_(store.begin()), done_(false) {}

StoreTransaction::~StoreTransaction() {
    if (!done_ && started_.ok()) store_.rollback();
}

Result<void> StoreTransaction::commit() {
    if (started_.failed()) return started_;
    if (done_) return makeError(ErrorCode::INTERNAL_ERROR, "transaction already finished");
    done_ = true;
    return store_.commit();
}

}
}
