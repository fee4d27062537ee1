#include "aggregation_engine.hpp"

#include "protocol_error.hpp"

#include <stdexcept>
#include <string>

namespace bc {

AggregationEngine::AggregationEngine(BatchStore& batches, ComputeBackendPtr backend)
    : batches_(batches), backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("AggregationEngine requires a compute backend");
    }
}

void AggregationEngine::combineIfNeeded(BatchId batchId,
                                        ClueField field,
                                        const OpaqueValue& contribution) {
    const Batch& batch = batches_.batch(batchId);
    if (!batch.isOpen) {
        throw ProtocolError(ProtocolErrorCode::BatchClosed,
                            "batch " + std::to_string(batchId) + " is closed");
    }
    batches_.setAggregate(batchId, field, combined(batch, field, contribution));
}

void AggregationEngine::accumulate(BatchId batchId, const ClueTriple& contribution) {
    const Batch& batch = batches_.batch(batchId);
    if (!batch.isOpen) {
        throw ProtocolError(ProtocolErrorCode::BatchClosed,
                            "batch " + std::to_string(batchId) + " is closed");
    }
    ClueTriple next;
    for (ClueField field : kClueFields) {
        next[fieldIndex(field)] = combined(batch, field, contribution[fieldIndex(field)]);
    }
    for (ClueField field : kClueFields) {
        batches_.setAggregate(batchId, field, std::move(next[fieldIndex(field)]));
    }
}

ClueTriple AggregationEngine::currentAggregates(BatchId batchId) const {
    const Batch& batch = batches_.batch(batchId);
    ClueTriple out;
    for (ClueField field : kClueFields) {
        const auto& aggregate = batch.aggregates[fieldIndex(field)];
        if (!aggregate) {
            throw ProtocolError(ProtocolErrorCode::InvalidBatch,
                                std::string(toString(field)) + " aggregate of batch " +
                                    std::to_string(batchId) + " is uninitialized");
        }
        out[fieldIndex(field)] = *aggregate;
    }
    return out;
}

OpaqueValue AggregationEngine::combined(const Batch& batch,
                                        ClueField field,
                                        const OpaqueValue& contribution) const {
    const auto& aggregate = batch.aggregates[fieldIndex(field)];
    OpaqueValue base = aggregate ? *aggregate : backend_->additiveIdentity();
    return backend_->combine(base, contribution);
}

} // namespace bc
