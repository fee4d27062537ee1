#include "clue_protocol.hpp"

#include "protocol_error.hpp"

#include <sstream>
#include <stdexcept>

namespace bc {

namespace {

std::string checkedIdentityTag(const ProtocolConfig& cfg) {
    validateConfig(cfg);
    return buildIdentityTag(cfg);
}

std::vector<OpaqueValue> toVector(const ClueTriple& triple) {
    return std::vector<OpaqueValue>(triple.begin(), triple.end());
}

} // namespace

const char* toString(AccusationStatus status) {
    switch (status) {
    case AccusationStatus::Pending:
        return "pending";
    case AccusationStatus::Correct:
        return "correct";
    case AccusationStatus::Incorrect:
        return "incorrect";
    case AccusationStatus::Voided:
        return "voided";
    }
    return "unknown";
}

ClueProtocol::ClueProtocol(const ProtocolConfig& cfg,
                           Identity owner,
                           ComputeBackendPtr backend,
                           DisclosureOraclePtr oracle)
    : config_(cfg)
    , identityTag_(checkedIdentityTag(cfg))
    , backend_(std::move(backend))
    , auditLog_()
    , access_(std::move(owner), cfg.cooldownSeconds)
    , batches_(access_, cfg.maxBatchSize)
    , aggregation_(batches_, backend_)
    , disclosure_(std::move(oracle), identityTag_, auditLog_)
    , currentVersion_(1) {}

bool ClueProtocol::addProvider(const Identity& caller, const Identity& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool added = access_.addProvider(caller, provider);
    if (added) {
        auditLog_.append("provider-added:identity=" + provider);
    }
    return added;
}

bool ClueProtocol::removeProvider(const Identity& caller, const Identity& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = access_.removeProvider(caller, provider);
    if (removed) {
        auditLog_.append("provider-removed:identity=" + provider);
    }
    return removed;
}

void ClueProtocol::pause(const Identity& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_.setPaused(caller, true);
    auditLog_.append("paused:by=" + caller);
}

void ClueProtocol::unpause(const Identity& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_.setPaused(caller, false);
    auditLog_.append("unpaused:by=" + caller);
}

void ClueProtocol::setCooldownSeconds(const Identity& caller, std::uint64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_.setCooldownSeconds(caller, seconds);
    auditLog_.append("cooldown-set:seconds=" + std::to_string(seconds));
}

BatchId ClueProtocol::openBatch(const Identity& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    BatchId id = batches_.openBatch(caller);
    auditLog_.append("batch-opened:batch=" + std::to_string(id));
    return id;
}

void ClueProtocol::closeBatch(const Identity& caller, BatchId batchId) {
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.closeBatch(caller, batchId);
    std::ostringstream record;
    record << "batch-closed:batch=" << batchId
           << ";submissions=" << batches_.batch(batchId).submissionCount;
    auditLog_.append(record.str());
}

std::uint64_t ClueProtocol::bumpVersion(const Identity& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_.authorize(caller, Role::Owner);
    ++currentVersion_;
    auditLog_.append("version-bumped:version=" + std::to_string(currentVersion_));
    return currentVersion_;
}

void ClueProtocol::submitContribution(const Identity& caller,
                                      BatchId batchId,
                                      const ClueTriple& contribution,
                                      std::uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_.requireUnpaused();
    access_.authorize(caller, Role::Provider);
    access_.checkCooldown(caller, ActionCategory::Submission, now);
    batches_.checkSubmission(batchId, caller);

    aggregation_.accumulate(batchId, contribution);
    batches_.recordSubmission(batchId, caller);
    access_.checkAndUpdateCooldown(caller, ActionCategory::Submission, now);

    const Batch& batch = batches_.batch(batchId);
    std::ostringstream record;
    record << "contribution:batch=" << batchId << ";from=" << caller
           << ";count=" << batch.submissionCount;
    for (ClueField field : kClueFields) {
        record << ";" << toString(field) << "=" << batch.aggregates[fieldIndex(field)]->handle;
    }
    auditLog_.append(record.str());
}

RequestId ClueProtocol::submitAccusation(const Identity& caller,
                                         BatchId batchId,
                                         const ClueTriple& guess,
                                         std::uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_.requireUnpaused();
    access_.checkCooldown(caller, ActionCategory::Request, now);
    batches_.checkAccusation(batchId, caller);

    OpaqueValue verdict = evaluateAccusation(aggregation_.currentAggregates(batchId), guess);
    RequestId requestId = disclosure_.requestDisclosure(
        batchId, { verdict }, DisclosureKind::Accusation, caller, currentVersion_);

    batches_.recordAccusation(batchId, caller);
    access_.checkAndUpdateCooldown(caller, ActionCategory::Request, now);

    AccusationRecord record;
    record.player = caller;
    record.batchId = batchId;
    record.guess = guess;
    record.verdict = verdict;
    record.requestId = requestId;
    record.submittedAt = now;
    accusations_.push_back(std::move(record));
    accusationByRequest_[requestId] = accusations_.size() - 1;

    std::ostringstream audit;
    audit << "accusation:batch=" << batchId << ";from=" << caller << ";request=" << requestId;
    auditLog_.append(audit.str());
    disclosure_.publishPending();
    return requestId;
}

RequestId ClueProtocol::requestSolution(const Identity& caller, BatchId batchId, std::uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_.requireUnpaused();
    access_.checkCooldown(caller, ActionCategory::Request, now);
    batches_.checkDisclosureRequest(batchId, caller);

    RequestId requestId = disclosure_.requestDisclosure(
        batchId, rebuildSolution(batchId), DisclosureKind::Solution, caller, currentVersion_);

    batches_.recordDisclosureRequest(batchId, caller);
    access_.checkAndUpdateCooldown(caller, ActionCategory::Request, now);
    disclosure_.publishPending();
    return requestId;
}

DisclosureResult ClueProtocol::settle(const DisclosureReplyMessage& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    const DecryptionContext& ctx = disclosure_.context(reply.requestId);

    RebuildFn rebuild;
    if (ctx.kind == DisclosureKind::Accusation) {
        auto found = accusationByRequest_.find(reply.requestId);
        if (found == accusationByRequest_.end()) {
            throw std::logic_error("accusation context without a casebook entry");
        }
        std::size_t index = found->second;
        rebuild = [this, index]() {
            const AccusationRecord& record = accusations_[index];
            ClueTriple aggregates = aggregation_.currentAggregates(record.batchId);
            return std::vector<OpaqueValue>{ evaluateAccusation(aggregates, record.guess) };
        };
    } else {
        BatchId batchId = ctx.batchId;
        rebuild = [this, batchId]() { return rebuildSolution(batchId); };
    }

    DisclosureResult result = disclosure_.settle(
        reply.requestId, reply.cleartextHex, reply.proofHex, currentVersion_, rebuild);

    if (result.kind == DisclosureKind::Accusation) {
        AccusationRecord& record = accusations_[accusationByRequest_.at(reply.requestId)];
        record.status = result.accusationCorrect ? AccusationStatus::Correct
                                                 : AccusationStatus::Incorrect;
    } else {
        solutions_[reply.requestId] = SolutionRecord{ result.batchId, result.requestId, result.solution };
    }
    disclosure_.publishPending();
    return result;
}

void ClueProtocol::subscribe(EventSubscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    disclosure_.subscribe(std::move(subscriber));
}

OpaqueValue ClueProtocol::evaluateAccusation(const ClueTriple& aggregates, const ClueTriple& guess) {
    OpaqueValue verdict = backend_->constantBool(true);
    for (ClueField field : kClueFields) {
        std::size_t i = fieldIndex(field);
        verdict = backend_->logicalAnd(verdict, backend_->compareEqual(aggregates[i], guess[i]));
    }
    return verdict;
}

std::vector<OpaqueValue> ClueProtocol::rebuildSolution(BatchId batchId) const {
    return toVector(aggregation_.currentAggregates(batchId));
}

AccusationStatus ClueProtocol::resolvedStatus(const AccusationRecord& record) const {
    if (record.status == AccusationStatus::Pending &&
        disclosure_.isStale(record.requestId, currentVersion_)) {
        return AccusationStatus::Voided;
    }
    return record.status;
}

Batch ClueProtocol::batch(BatchId batchId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_.batch(batchId);
}

std::size_t ClueProtocol::batchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_.batchCount();
}

DecryptionContext ClueProtocol::context(RequestId requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disclosure_.context(requestId);
}

bool ClueProtocol::isStale(RequestId requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disclosure_.isStale(requestId, currentVersion_);
}

std::vector<AccusationRecord> ClueProtocol::accusations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AccusationRecord> out = accusations_;
    for (auto& record : out) {
        record.status = resolvedStatus(record);
    }
    return out;
}

CasebookStats ClueProtocol::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CasebookStats stats;
    for (const auto& record : accusations_) {
        ++stats.total;
        switch (resolvedStatus(record)) {
        case AccusationStatus::Pending:
            ++stats.pending;
            break;
        case AccusationStatus::Correct:
            ++stats.correct;
            break;
        case AccusationStatus::Incorrect:
            ++stats.incorrect;
            break;
        case AccusationStatus::Voided:
            ++stats.voided;
            break;
        }
    }
    return stats;
}

std::optional<SolutionRecord> ClueProtocol::solution(RequestId requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = solutions_.find(requestId);
    if (it == solutions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::uint64_t ClueProtocol::currentVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentVersion_;
}

bool ClueProtocol::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return access_.isPaused();
}

bool ClueProtocol::isProvider(const Identity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return access_.isProvider(identity);
}

std::uint64_t ClueProtocol::cooldownSeconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return access_.cooldownSeconds();
}

std::string ClueProtocol::auditRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auditLog_.merkleRoot();
}

std::vector<std::string> ClueProtocol::auditRecords() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auditLog_.records();
}

std::vector<std::string> ClueProtocol::auditProof(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auditLog_.merkleProof(index);
}

} // namespace bc
