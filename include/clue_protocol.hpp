#pragma once

#include "access_guard.hpp"
#include "aggregation_engine.hpp"
#include "audit_log.hpp"
#include "batch_store.hpp"
#include "compute_backend.hpp"
#include "disclosure_coordinator.hpp"
#include "disclosure_oracle.hpp"
#include "opaque_value.hpp"
#include "protocol_config.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bc {

enum class AccusationStatus { Pending, Correct, Incorrect, Voided };

const char* toString(AccusationStatus status);

struct AccusationRecord {
    Identity player;
    BatchId batchId = 0;
    ClueTriple guess;
    OpaqueValue verdict;
    RequestId requestId = 0;
    AccusationStatus status = AccusationStatus::Pending;
    std::uint64_t submittedAt = 0;
};

struct SolutionRecord {
    BatchId batchId = 0;
    RequestId requestId = 0;
    std::array<std::uint64_t, kClueFieldCount> values{}; // indexed by ClueField
};

struct CasebookStats {
    std::size_t total = 0;
    std::size_t correct = 0;
    std::size_t incorrect = 0;
    std::size_t pending = 0;
    std::size_t voided = 0;
};

// The protocol state object. Every counter (batch ids, protocol version) lives here and every
// operation runs under one lock, validating fully before it mutates anything.
class ClueProtocol {
public:
    ClueProtocol(const ProtocolConfig& cfg,
                 Identity owner,
                 ComputeBackendPtr backend,
                 DisclosureOraclePtr oracle);

    // Administrative surface, owner only. Not blocked by pause.
    bool addProvider(const Identity& caller, const Identity& provider);
    bool removeProvider(const Identity& caller, const Identity& provider);
    void pause(const Identity& caller);
    void unpause(const Identity& caller);
    void setCooldownSeconds(const Identity& caller, std::uint64_t seconds);
    BatchId openBatch(const Identity& caller);
    void closeBatch(const Identity& caller, BatchId batchId);
    // Voids every outstanding disclosure at once.
    std::uint64_t bumpVersion(const Identity& caller);

    void submitContribution(const Identity& caller,
                            BatchId batchId,
                            const ClueTriple& contribution,
                            std::uint64_t now);
    RequestId submitAccusation(const Identity& caller,
                               BatchId batchId,
                               const ClueTriple& guess,
                               std::uint64_t now);
    RequestId requestSolution(const Identity& caller, BatchId batchId, std::uint64_t now);

    DisclosureResult settle(const DisclosureReplyMessage& reply);

    // Subscribers run under the protocol lock, after the operation's state changes are complete, and
    // must not call back into the protocol. A throwing subscriber is logged as subscriber-failed and
    // does not fail the operation.
    void subscribe(EventSubscriber subscriber);

    Batch batch(BatchId batchId) const;
    std::size_t batchCount() const;
    DecryptionContext context(RequestId requestId) const;
    bool isStale(RequestId requestId) const;
    std::vector<AccusationRecord> accusations() const;
    CasebookStats stats() const;
    std::optional<SolutionRecord> solution(RequestId requestId) const;
    std::uint64_t currentVersion() const;
    bool isPaused() const;
    bool isProvider(const Identity& identity) const;
    std::uint64_t cooldownSeconds() const;

    std::string auditRoot() const;
    std::vector<std::string> auditRecords() const;
    std::vector<std::string> auditProof(std::size_t index) const;

    const std::string& identityTag() const { return identityTag_; }
    const ComputeBackendPtr& backend() const { return backend_; }

private:
    OpaqueValue evaluateAccusation(const ClueTriple& aggregates, const ClueTriple& guess);
    std::vector<OpaqueValue> rebuildSolution(BatchId batchId) const;
    AccusationStatus resolvedStatus(const AccusationRecord& record) const;

    mutable std::mutex mutex_;
    ProtocolConfig config_;
    std::string identityTag_;
    ComputeBackendPtr backend_;
    AuditLog auditLog_;
    AccessGuard access_;
    BatchStore batches_;
    AggregationEngine aggregation_;
    DisclosureCoordinator disclosure_;
    std::uint64_t currentVersion_;

    std::vector<AccusationRecord> accusations_;
    std::map<RequestId, std::size_t> accusationByRequest_;
    std::map<RequestId, SolutionRecord> solutions_;
};

} // namespace bc
