#include "card_catalog.hpp"
#include "plaintext_backend.hpp"
#include "sealed_backend.hpp"
#include "test_support.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace bc;
using namespace bc::test;

void threeProvidersThenSolution(ComputeBackendPtr backend) {
    Harness h(testConfig(), backend);
    const std::string label = backend->label();

    std::vector<ProtocolEvent> events;
    h.protocol->subscribe([&](const ProtocolEvent& event) { events.push_back(event); });

    for (const char* provider : { "alice", "bob", "carol" }) {
        h.protocol->addProvider("owner", provider);
    }
    BatchId id = h.protocol->openBatch("owner");

    h.protocol->submitContribution("alice", id, h.triple(1, 2, 3), 100);
    h.protocol->submitContribution("bob", id, h.triple(0, 4, 1), 101);
    h.protocol->submitContribution("carol", id, h.triple(2, 1, 0), 102);
    Batch batch = h.protocol->batch(id);
    check(batch.submissionCount == 3, label + ": three contributions expected");
    check(batch.hasSubmitted("alice") && batch.hasSubmitted("carol"), label + ": submitters not tracked");

    h.protocol->closeBatch("owner", id);
    expectError(ProtocolErrorCode::BatchClosed,
                [&] { h.protocol->submitContribution("alice", id, h.triple(0, 0, 0), 500); },
                label + ": contribution after close");

    RequestId request = h.protocol->requestSolution("dave", id, 200);
    check(events.size() == 1 && events[0].kind == ProtocolEventKind::DisclosureRequested,
          label + ": request event missing");
    check(h.protocol->context(request).kind == DisclosureKind::Solution, label + ": wrong context kind");

    DisclosureResult result = h.protocol->settle(h.replyFor(request));
    check(result.solution[fieldIndex(ClueField::Weapon)] == 3, label + ": weapon sum");
    check(result.solution[fieldIndex(ClueField::Room)] == 7, label + ": room sum");
    check(result.solution[fieldIndex(ClueField::Suspect)] == 4, label + ": suspect sum");
    check(events.size() == 2 && events[1].result.has_value() &&
              events[1].result->solution == result.solution,
          label + ": settled event should carry the case file");
    check(describeCard(ClueField::Room, result.solution[1]) == "Hall", label + ": room 7 is the Hall");
    check(h.protocol->stats().total == 0, label + ": solution should not touch the casebook");
}

void contributorAccuses(ComputeBackendPtr backend) {
    Harness h(testConfig(), backend);
    const std::string label = backend->label();

    h.protocol->addProvider("owner", "alice");
    BatchId id = h.protocol->openBatch("owner");
    h.protocol->submitContribution("alice", id, h.triple(4, 8, 5), 100);

    // alice knows the only contribution, so her guess is right.
    RequestId right = h.protocol->submitAccusation("alice", id, h.triple(4, 8, 5), 100);
    // bob is not a provider; anyone may accuse.
    RequestId wrong = h.protocol->submitAccusation("bob", id, h.triple(4, 8, 4), 100);

    expectError(ProtocolErrorCode::InvalidState,
                [&] { h.protocol->submitAccusation("alice", id, h.triple(4, 8, 5), 500); },
                label + ": second accusation from the same player");

    CasebookStats before = h.protocol->stats();
    check(before.total == 2 && before.pending == 2, label + ": accusations should start pending");

    // Settle out of order.
    DisclosureResult second = h.protocol->settle(h.replyFor(wrong));
    DisclosureResult first = h.protocol->settle(h.replyFor(right));
    check(first.kind == DisclosureKind::Accusation && first.accusationCorrect,
          label + ": matching guess should be correct");
    check(!second.accusationCorrect, label + ": off-by-one suspect should be incorrect");

    std::vector<AccusationRecord> records = h.protocol->accusations();
    check(records.size() == 2, label + ": casebook size");
    check(records[0].player == "alice" && records[0].status == AccusationStatus::Correct,
          label + ": alice's record");
    check(records[1].player == "bob" && records[1].status == AccusationStatus::Incorrect,
          label + ": bob's record");
    CasebookStats after = h.protocol->stats();
    check(after.correct == 1 && after.incorrect == 1 && after.pending == 0 && after.voided == 0,
          label + ": final stats");

    // The batch stays accusable until closed, but accusers are frozen out of it.
    h.protocol->addProvider("owner", "bob");
    expectError(ProtocolErrorCode::InvalidState,
                [&] { h.protocol->submitContribution("bob", id, h.triple(0, 0, 0), 500); },
                label + ": accuser contributed afterwards");
}

void providerCooldownAcrossBatches() {
    Harness h;
    h.protocol->addProvider("owner", "alice");
    BatchId first = h.protocol->openBatch("owner");
    BatchId second = h.protocol->openBatch("owner");

    h.protocol->submitContribution("alice", first, h.triple(0, 0, 0), 1000);
    expectError(ProtocolErrorCode::RateLimited,
                [&] { h.protocol->submitContribution("alice", second, h.triple(1, 1, 1), 1005); },
                "contribution inside the cooldown");
    check(h.protocol->batch(second).submissionCount == 0, "rate-limited contribution counted");
    h.protocol->submitContribution("alice", second, h.triple(1, 1, 1), 1010);

    // Non-providers cannot contribute, and removal takes effect immediately.
    expectError(ProtocolErrorCode::NotProvider,
                [&] { h.protocol->submitContribution("mallory", first, h.triple(0, 0, 0), 2000); },
                "contribution from a non-provider");
    h.protocol->removeProvider("owner", "alice");
    check(!h.protocol->isProvider("alice"), "removed provider still listed");
}

// Providers contribute on one thread while players build guesses, accuse and pump the oracle on
// another. Everything touches the shared backend and channel.
void concurrentCallers(ComputeBackendPtr backend) {
    constexpr std::size_t kProviders = 24;
    constexpr std::size_t kPlayers = 24;
    Harness h(testConfig(static_cast<std::uint32_t>(kProviders + 1), 0), backend);
    const std::string label = backend->label();

    h.protocol->addProvider("owner", "seed");
    for (std::size_t i = 0; i < kProviders; ++i) {
        h.protocol->addProvider("owner", "provider-" + std::to_string(i));
    }
    BatchId id = h.protocol->openBatch("owner");
    h.protocol->submitContribution("seed", id, h.triple(1, 1, 1), 1);

    std::thread providers([&] {
        for (std::size_t i = 0; i < kProviders; ++i) {
            ClueTriple contribution{ backend->encrypt(1), backend->encrypt(2), backend->encrypt(3) };
            h.protocol->submitContribution("provider-" + std::to_string(i), id, contribution, 2);
        }
    });
    std::thread players([&] {
        for (std::size_t i = 0; i < kPlayers; ++i) {
            ClueTriple guess{ backend->encrypt(7), backend->encrypt(7), backend->encrypt(7) };
            h.protocol->submitAccusation("player-" + std::to_string(i), id, guess, 2);
            h.oracle->processPending();
        }
    });
    providers.join();
    players.join();

    Batch batch = h.protocol->batch(id);
    check(batch.submissionCount == kProviders + 1, label + ": lost a concurrent contribution");
    check(batch.accusers.size() == kPlayers, label + ": lost a concurrent accusation");
    check(h.protocol->accusations().size() == kPlayers, label + ": casebook size");

    RequestId request = h.protocol->requestSolution("auditor", id, 3);
    DisclosureResult result = h.protocol->settle(h.replyFor(request));
    check(result.solution[0] == 1 + kProviders, label + ": weapon sum under contention");
    check(result.solution[1] == 1 + 2 * kProviders, label + ": room sum under contention");
    check(result.solution[2] == 1 + 3 * kProviders, label + ": suspect sum under contention");
    check(h.channel->pendingRequests() == 0, label + ": oracle left requests behind");
}

void auditTrail() {
    Harness h;
    h.protocol->addProvider("owner", "alice");
    BatchId id = h.protocol->openBatch("owner");
    h.protocol->submitContribution("alice", id, h.triple(2, 2, 2), 10);
    h.protocol->closeBatch("owner", id);
    RequestId request = h.protocol->requestSolution("zoe", id, 10);
    h.protocol->settle(h.replyFor(request));

    std::vector<std::string> records = h.protocol->auditRecords();
    const std::vector<std::string> prefixes{ "provider-added:", "batch-opened:", "contribution:",
                                             "batch-closed:", "disclosure-requested:",
                                             "disclosure-settled:" };
    check(records.size() == prefixes.size(), "unexpected audit record count");
    for (std::size_t i = 0; i < prefixes.size(); ++i) {
        check(records[i].rfind(prefixes[i], 0) == 0, "audit record " + std::to_string(i) + ": " + records[i]);
        check(AuditLog::verifyInclusion(AuditLog::hashRecord(records[i]), i, h.protocol->auditProof(i),
                                        h.protocol->auditRoot()),
              "audit record " + std::to_string(i) + " not provable");
    }
}

} // namespace

int main() {
    suiteName() = "workflow_scenarios";
    threeProvidersThenSolution(std::make_shared<PlaintextBackend>());
    threeProvidersThenSolution(std::make_shared<SealedBackend>());
    contributorAccuses(std::make_shared<PlaintextBackend>());
    contributorAccuses(std::make_shared<SealedBackend>());
    providerCooldownAcrossBatches();
    concurrentCallers(std::make_shared<PlaintextBackend>());
    concurrentCallers(std::make_shared<SealedBackend>());
    auditTrail();
    std::cout << "workflow_scenarios passed" << std::endl;
    return 0;
}
