#include "aggregation_engine.hpp"
#include "batch_store.hpp"
#include "plaintext_backend.hpp"
#include "protocol_error.hpp"
#include "test_support.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

void batchLifecycle() {
    using namespace bc;
    using namespace bc::test;

    AccessGuard guard("owner", 0);
    BatchStore store(guard, 2);

    expectError(ProtocolErrorCode::NotOwner, [&] { store.openBatch("alice"); },
                "non-owner opened a batch");
    BatchId first = store.openBatch("owner");
    BatchId second = store.openBatch("owner");
    check(first == 1 && second == 2, "batch ids must start at 1 and increase");
    check(store.batch(first).isOpen, "new batch should be open");

    store.recordSubmission(first, "alice");
    expectError(ProtocolErrorCode::InvalidState, [&] { store.recordSubmission(first, "alice"); },
                "duplicate submission accepted");
    store.recordSubmission(first, "bob");
    expectError(ProtocolErrorCode::BatchFull, [&] { store.recordSubmission(first, "carol"); },
                "submission past maxBatchSize accepted");
    check(store.batch(first).submissionCount == 2, "submissionCount exceeded maxBatchSize");
    check(store.batch(first).submittedAddresses.size() == 2, "rejected submitter was recorded");

    expectError(ProtocolErrorCode::NotOwner, [&] { store.closeBatch("alice", first); },
                "non-owner closed a batch");
    store.closeBatch("owner", first);
    expectError(ProtocolErrorCode::BatchClosed, [&] { store.closeBatch("owner", first); },
                "batch closed twice");
    expectError(ProtocolErrorCode::BatchClosed, [&] { store.recordSubmission(first, "dave"); },
                "submission to closed batch accepted");
    expectError(ProtocolErrorCode::InvalidBatch, [&] { store.closeBatch("owner", 42); },
                "unknown batch closed");
    expectError(ProtocolErrorCode::InvalidBatch, [&] { store.batch(42); }, "unknown batch read");

    // Disclosure requests survive close and dedup independently of submissions.
    store.recordDisclosureRequest(first, "alice");
    expectError(ProtocolErrorCode::InvalidState,
                [&] { store.recordDisclosureRequest(first, "alice"); },
                "duplicate disclosure request accepted");
    store.recordDisclosureRequest(first, "zoe");
    expectError(ProtocolErrorCode::InvalidBatch,
                [&] { store.recordDisclosureRequest(second, "alice"); },
                "disclosure of an empty batch accepted");

    // An accuser may not contribute afterwards.
    store.recordSubmission(second, "alice");
    store.recordAccusation(second, "bob");
    expectError(ProtocolErrorCode::InvalidState, [&] { store.recordAccusation(second, "bob"); },
                "duplicate accusation accepted");
    expectError(ProtocolErrorCode::InvalidState, [&] { store.recordSubmission(second, "bob"); },
                "accuser contributed to the same batch");
    store.recordAccusation(second, "alice");

    expectError(ProtocolErrorCode::BatchClosed,
                [&] { store.setAggregate(first, ClueField::Room, OpaqueValue{ "00", OpaqueKind::Uint }); },
                "aggregate of a closed batch changed");
}

void aggregation() {
    using namespace bc;
    using namespace bc::test;

    AccessGuard guard("owner", 0);
    BatchStore store(guard, 8);
    auto backend = std::make_shared<PlaintextBackend>();
    AggregationEngine engine(store, backend);

    BatchId id = store.openBatch("owner");
    expectError(ProtocolErrorCode::InvalidBatch, [&] { engine.currentAggregates(id); },
                "uninitialized aggregates were readable");

    engine.combineIfNeeded(id, ClueField::Weapon, backend->encrypt(3));
    auto weapon = store.batch(id).aggregates[fieldIndex(ClueField::Weapon)];
    check(weapon.has_value(), "first contribution did not seed the aggregate");
    check(backend->reveal(*weapon) == 3, "seeded aggregate should equal the first contribution");
    check(!store.batch(id).aggregates[fieldIndex(ClueField::Room)].has_value(),
          "untouched field was initialized");

    engine.combineIfNeeded(id, ClueField::Weapon, backend->encrypt(4));
    check(backend->reveal(*store.batch(id).aggregates[fieldIndex(ClueField::Weapon)]) == 7,
          "weapon aggregate should be 3 + 4");

    engine.accumulate(id, ClueTriple{ backend->encrypt(1), backend->encrypt(2), backend->encrypt(5) });
    ClueTriple sums = engine.currentAggregates(id);
    check(backend->reveal(sums[0]) == 8 && backend->reveal(sums[1]) == 2 && backend->reveal(sums[2]) == 5,
          "accumulate produced the wrong sums");

    // A bad operand aborts the whole fold before anything is stored.
    ClueTriple before = engine.currentAggregates(id);
    bool threw = false;
    try {
        engine.accumulate(id, ClueTriple{ backend->encrypt(1), backend->encrypt(1),
                                          OpaqueValue{ "feedface", OpaqueKind::Uint } });
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "unknown handle was accepted");
    ClueTriple after = engine.currentAggregates(id);
    check(before == after, "failed accumulate left a partial update");

    store.closeBatch("owner", id);
    expectError(ProtocolErrorCode::BatchClosed,
                [&] { engine.combineIfNeeded(id, ClueField::Room, backend->encrypt(1)); },
                "combined into a closed batch");
    check(engine.currentAggregates(id) == after, "closed batch aggregates changed");
}

} // namespace

int main() {
    bc::test::suiteName() = "batch_store_test";
    batchLifecycle();
    aggregation();
    std::cout << "batch_store_test passed" << std::endl;
    return 0;
}
