#include "batch_store.hpp"

#include "protocol_error.hpp"

#include <stdexcept>
#include <string>

namespace bc {

namespace {

std::string batchLabel(BatchId id) {
    return "batch " + std::to_string(id);
}

} // namespace

BatchStore::BatchStore(AccessGuard& access, std::uint32_t maxBatchSize)
    : access_(access), maxBatchSize_(maxBatchSize), nextBatchId_(1) {
    if (maxBatchSize_ == 0) {
        throw std::invalid_argument("maxBatchSize must be positive");
    }
}

BatchId BatchStore::openBatch(const Identity& caller) {
    access_.authorize(caller, Role::Owner);
    Batch batch;
    batch.id = nextBatchId_++;
    batch.isOpen = true;
    BatchId id = batch.id;
    batches_.emplace(id, std::move(batch));
    return id;
}

void BatchStore::closeBatch(const Identity& caller, BatchId id) {
    access_.authorize(caller, Role::Owner);
    Batch& batch = find(id);
    if (!batch.isOpen) {
        throw ProtocolError(ProtocolErrorCode::BatchClosed, batchLabel(id) + " is already closed");
    }
    batch.isOpen = false;
}

void BatchStore::checkSubmission(BatchId id, const Identity& identity) const {
    const Batch& batch = find(id);
    if (!batch.isOpen) {
        throw ProtocolError(ProtocolErrorCode::BatchClosed, batchLabel(id) + " is closed");
    }
    if (batch.submissionCount >= maxBatchSize_) {
        throw ProtocolError(ProtocolErrorCode::BatchFull, batchLabel(id) + " is full");
    }
    if (batch.hasSubmitted(identity)) {
        throw ProtocolError(ProtocolErrorCode::InvalidState,
                            identity + " already contributed to " + batchLabel(id));
    }
    if (batch.hasAccused(identity)) {
        throw ProtocolError(ProtocolErrorCode::InvalidState,
                            identity + " already accused " + batchLabel(id));
    }
}

void BatchStore::recordSubmission(BatchId id, const Identity& identity) {
    checkSubmission(id, identity);
    Batch& batch = find(id);
    ++batch.submissionCount;
    batch.submittedAddresses.insert(identity);
}

void BatchStore::checkDisclosureRequest(BatchId id, const Identity& identity) const {
    const Batch& batch = find(id);
    if (batch.submissionCount == 0) {
        throw ProtocolError(ProtocolErrorCode::InvalidBatch, batchLabel(id) + " has no submissions");
    }
    if (batch.hasRequested(identity)) {
        throw ProtocolError(ProtocolErrorCode::InvalidState,
                            identity + " already requested disclosure of " + batchLabel(id));
    }
}

void BatchStore::recordDisclosureRequest(BatchId id, const Identity& identity) {
    checkDisclosureRequest(id, identity);
    find(id).requestedAddresses.insert(identity);
}

void BatchStore::checkAccusation(BatchId id, const Identity& identity) const {
    const Batch& batch = find(id);
    if (!batch.isOpen) {
        throw ProtocolError(ProtocolErrorCode::BatchClosed, batchLabel(id) + " is closed");
    }
    if (batch.submissionCount == 0) {
        throw ProtocolError(ProtocolErrorCode::InvalidBatch, batchLabel(id) + " has no submissions");
    }
    if (batch.hasAccused(identity)) {
        throw ProtocolError(ProtocolErrorCode::InvalidState,
                            identity + " already accused " + batchLabel(id));
    }
}

void BatchStore::recordAccusation(BatchId id, const Identity& identity) {
    checkAccusation(id, identity);
    find(id).accusers.insert(identity);
}

void BatchStore::setAggregate(BatchId id, ClueField field, OpaqueValue value) {
    Batch& batch = find(id);
    if (!batch.isOpen) {
        throw ProtocolError(ProtocolErrorCode::BatchClosed,
                            batchLabel(id) + " is closed; aggregates are read-only");
    }
    batch.aggregates[fieldIndex(field)] = std::move(value);
}

const Batch& BatchStore::batch(BatchId id) const {
    return find(id);
}

Batch& BatchStore::find(BatchId id) {
    auto it = batches_.find(id);
    if (it == batches_.end()) {
        throw ProtocolError(ProtocolErrorCode::InvalidBatch, "unknown " + batchLabel(id));
    }
    return it->second;
}

const Batch& BatchStore::find(BatchId id) const {
    auto it = batches_.find(id);
    if (it == batches_.end()) {
        throw ProtocolError(ProtocolErrorCode::InvalidBatch, "unknown " + batchLabel(id));
    }
    return it->second;
}

} // namespace bc
