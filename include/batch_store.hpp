#pragma once

#include "access_guard.hpp"
#include "opaque_value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>

namespace bc {

struct Batch {
    BatchId id = 0;
    bool isOpen = false;
    std::uint32_t submissionCount = 0;
    std::array<std::optional<OpaqueValue>, kClueFieldCount> aggregates;
    std::set<Identity> submittedAddresses;
    std::set<Identity> requestedAddresses;
    std::set<Identity> accusers;

    bool hasSubmitted(const Identity& identity) const { return submittedAddresses.count(identity) != 0; }
    bool hasRequested(const Identity& identity) const { return requestedAddresses.count(identity) != 0; }
    bool hasAccused(const Identity& identity) const { return accusers.count(identity) != 0; }
};

// Owns every batch ever opened. Batches are closed, never deleted.
class BatchStore {
public:
    BatchStore(AccessGuard& access, std::uint32_t maxBatchSize);

    BatchId openBatch(const Identity& caller);
    void closeBatch(const Identity& caller, BatchId id);

    void checkSubmission(BatchId id, const Identity& identity) const;
    void recordSubmission(BatchId id, const Identity& identity);

    void checkDisclosureRequest(BatchId id, const Identity& identity) const;
    void recordDisclosureRequest(BatchId id, const Identity& identity);

    void checkAccusation(BatchId id, const Identity& identity) const;
    void recordAccusation(BatchId id, const Identity& identity);

    // Aggregates only move while the batch is open.
    void setAggregate(BatchId id, ClueField field, OpaqueValue value);

    const Batch& batch(BatchId id) const;
    bool contains(BatchId id) const { return batches_.count(id) != 0; }
    std::size_t batchCount() const { return batches_.size(); }
    std::uint32_t maxBatchSize() const { return maxBatchSize_; }

private:
    Batch& find(BatchId id);
    const Batch& find(BatchId id) const;

    AccessGuard& access_;
    std::uint32_t maxBatchSize_;
    BatchId nextBatchId_;
    std::map<BatchId, Batch> batches_;
};

} // namespace bc
