#pragma once

#include "batch_store.hpp"
#include "compute_backend.hpp"
#include "opaque_value.hpp"

namespace bc {

class AggregationEngine {
public:
    AggregationEngine(BatchStore& batches, ComputeBackendPtr backend);

    // Seeds an uninitialized aggregate with the additive identity, then folds the contribution in.
    void combineIfNeeded(BatchId batchId, ClueField field, const OpaqueValue& contribution);

    // Folds all three fields. Nothing is stored unless every backend call succeeded.
    void accumulate(BatchId batchId, const ClueTriple& contribution);

    // Live aggregates; InvalidBatch while any field is still uninitialized.
    ClueTriple currentAggregates(BatchId batchId) const;

private:
    OpaqueValue combined(const Batch& batch, ClueField field, const OpaqueValue& contribution) const;

    BatchStore& batches_;
    ComputeBackendPtr backend_;
};

} // namespace bc
