#include "disclosure_coordinator.hpp"

#include "picosha2.h"
#include "protocol_error.hpp"

#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace bc {

namespace {

void appendLengthPrefixed(std::ostringstream& oss, const std::string& value) {
    oss << value.size() << ':';
    oss.write(value.data(), static_cast<std::streamsize>(value.size()));
    oss << ';';
}

std::string requestLabel(RequestId id) {
    return "request " + std::to_string(id);
}

} // namespace

const char* toString(DisclosureKind kind) {
    switch (kind) {
    case DisclosureKind::Accusation:
        return "accusation";
    case DisclosureKind::Solution:
        return "solution";
    }
    return "unknown";
}

DisclosureCoordinator::DisclosureCoordinator(DisclosureOraclePtr oracle,
                                             std::string identityTag,
                                             AuditLog& auditLog)
    : oracle_(std::move(oracle)), identityTag_(std::move(identityTag)), auditLog_(auditLog) {
    if (!oracle_) {
        throw std::invalid_argument("DisclosureCoordinator requires an oracle");
    }
    if (identityTag_.empty()) {
        throw std::invalid_argument("DisclosureCoordinator identity tag must not be empty");
    }
}

std::string DisclosureCoordinator::commitmentHash(const std::vector<OpaqueValue>& values) const {
    std::ostringstream oss;
    oss << "commit:v1:";
    appendLengthPrefixed(oss, identityTag_);
    oss << values.size() << ';';
    for (const auto& value : values) {
        oss << (value.kind == OpaqueKind::Bool ? 'b' : 'u');
        appendLengthPrefixed(oss, value.handle);
    }
    std::string preimage = oss.str();
    return picosha2::hash256_hex_string(preimage);
}

RequestId DisclosureCoordinator::requestDisclosure(BatchId batchId,
                                                   const std::vector<OpaqueValue>& values,
                                                   DisclosureKind kind,
                                                   const Identity& requester,
                                                   std::uint64_t currentVersion) {
    if (values.empty()) {
        throw std::invalid_argument("Disclosure request must name at least one value");
    }
    std::string commitment = commitmentHash(values);
    RequestId requestId = oracle_->requestDisclosure(values);
    if (contexts_.count(requestId) != 0) {
        throw std::runtime_error("Oracle reused " + requestLabel(requestId));
    }

    DecryptionContext ctx;
    ctx.requestId = requestId;
    ctx.batchId = batchId;
    ctx.kind = kind;
    ctx.requester = requester;
    ctx.bindingVersion = currentVersion;
    ctx.commitmentHash = commitment;
    contexts_.emplace(requestId, ctx);

    std::ostringstream record;
    record << "disclosure-requested:request=" << requestId << ";batch=" << batchId
           << ";kind=" << toString(kind) << ";version=" << currentVersion
           << ";commitment=" << commitment;
    auditLog_.append(record.str());

    ProtocolEvent event;
    event.kind = ProtocolEventKind::DisclosureRequested;
    event.requestId = requestId;
    event.batchId = batchId;
    event.commitmentHash = commitment;
    outbox_.push_back(std::move(event));
    return requestId;
}

DisclosureResult DisclosureCoordinator::settle(RequestId requestId,
                                               const std::string& cleartextHex,
                                               const std::string& proofHex,
                                               std::uint64_t currentVersion,
                                               const RebuildFn& rebuild) {
    auto it = contexts_.find(requestId);
    if (it == contexts_.end()) {
        throw ProtocolError(ProtocolErrorCode::UnknownRequest, requestLabel(requestId));
    }
    DecryptionContext& ctx = it->second;
    if (ctx.processed) {
        throw ProtocolError(ProtocolErrorCode::AlreadyProcessed,
                            requestLabel(requestId) + " was already settled");
    }
    if (ctx.bindingVersion != currentVersion) {
        std::ostringstream oss;
        oss << requestLabel(requestId) << " bound to version " << ctx.bindingVersion
            << ", current version is " << currentVersion;
        throw ProtocolError(ProtocolErrorCode::StaleVersion, oss.str());
    }
    if (!rebuild) {
        throw std::invalid_argument("settle requires a rebuild function");
    }

    std::string currentHash = commitmentHash(rebuild());
    if (currentHash != ctx.commitmentHash) {
        throw ProtocolError(ProtocolErrorCode::InvalidState,
                            "batch " + std::to_string(ctx.batchId) + " changed after " +
                                requestLabel(requestId) + " was issued");
    }

    std::vector<std::uint64_t> words = oracle_->verifyAndDecode(requestId, cleartextHex, proofHex);
    DisclosureResult result = decode(ctx, words);

    ctx.processed = true;

    std::ostringstream record;
    record << "disclosure-settled:request=" << requestId << ";batch=" << ctx.batchId
           << ";kind=" << toString(ctx.kind) << ";result=";
    if (ctx.kind == DisclosureKind::Accusation) {
        record << (result.accusationCorrect ? "correct" : "incorrect");
    } else {
        record << result.solution[0] << "," << result.solution[1] << "," << result.solution[2];
    }
    auditLog_.append(record.str());

    ProtocolEvent event;
    event.kind = ProtocolEventKind::DisclosureSettled;
    event.requestId = requestId;
    event.batchId = ctx.batchId;
    event.commitmentHash = ctx.commitmentHash;
    event.result = result;
    outbox_.push_back(std::move(event));
    return result;
}

DisclosureResult DisclosureCoordinator::decode(const DecryptionContext& ctx,
                                               const std::vector<std::uint64_t>& words) const {
    DisclosureResult result;
    result.requestId = ctx.requestId;
    result.batchId = ctx.batchId;
    result.kind = ctx.kind;

    if (ctx.kind == DisclosureKind::Accusation) {
        if (words.size() != 1 || words[0] > 1) {
            throw ProtocolError(ProtocolErrorCode::InvalidProof,
                                "accusation cleartext must be a single boolean word");
        }
        result.accusationCorrect = words[0] == 1;
        return result;
    }

    if (words.size() != kClueFieldCount) {
        throw ProtocolError(ProtocolErrorCode::InvalidProof,
                            "solution cleartext must carry exactly three words");
    }
    for (std::size_t i = 0; i < kClueFieldCount; ++i) {
        result.solution[i] = words[i];
    }
    return result;
}

const DecryptionContext& DisclosureCoordinator::context(RequestId requestId) const {
    auto it = contexts_.find(requestId);
    if (it == contexts_.end()) {
        throw ProtocolError(ProtocolErrorCode::UnknownRequest, requestLabel(requestId));
    }
    return it->second;
}

bool DisclosureCoordinator::isStale(RequestId requestId, std::uint64_t currentVersion) const {
    const DecryptionContext& ctx = context(requestId);
    return !ctx.processed && ctx.bindingVersion != currentVersion;
}

std::size_t DisclosureCoordinator::pendingCount(std::uint64_t currentVersion) const {
    std::size_t pending = 0;
    for (const auto& [id, ctx] : contexts_) {
        (void)id;
        if (!ctx.processed && ctx.bindingVersion == currentVersion) {
            ++pending;
        }
    }
    return pending;
}

void DisclosureCoordinator::subscribe(EventSubscriber subscriber) {
    if (subscriber) {
        subscribers_.push_back(std::move(subscriber));
    }
}

std::size_t DisclosureCoordinator::publishPending() {
    std::vector<ProtocolEvent> events;
    events.swap(outbox_);
    for (const auto& event : events) {
        for (const auto& subscriber : subscribers_) {
            try {
                subscriber(event);
            } catch (const std::exception& ex) {
                std::ostringstream record;
                record << "subscriber-failed:request=" << event.requestId << ";event="
                       << (event.kind == ProtocolEventKind::DisclosureRequested ? "requested" : "settled")
                       << ";error=" << ex.what();
                auditLog_.append(record.str());
            }
        }
    }
    return events.size();
}

} // namespace bc
