#pragma once

#include "audit_log.hpp"
#include "disclosure_oracle.hpp"
#include "opaque_value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bc {

enum class DisclosureKind { Accusation, Solution };

const char* toString(DisclosureKind kind);

struct DecryptionContext {
    RequestId requestId = 0;
    BatchId batchId = 0;
    DisclosureKind kind = DisclosureKind::Solution;
    Identity requester;
    std::uint64_t bindingVersion = 0;
    std::string commitmentHash;
    bool processed = false;
};

struct DisclosureResult {
    RequestId requestId = 0;
    BatchId batchId = 0;
    DisclosureKind kind = DisclosureKind::Solution;
    bool accusationCorrect = false;                        // Accusation
    std::array<std::uint64_t, kClueFieldCount> solution{}; // Solution, indexed by ClueField
};

enum class ProtocolEventKind { DisclosureRequested, DisclosureSettled };

struct ProtocolEvent {
    ProtocolEventKind kind = ProtocolEventKind::DisclosureRequested;
    RequestId requestId = 0;
    BatchId batchId = 0;
    std::string commitmentHash;
    std::optional<DisclosureResult> result; // set for DisclosureSettled
};

using EventSubscriber = std::function<void(const ProtocolEvent&)>;
using RebuildFn = std::function<std::vector<OpaqueValue>()>;

// Issues hash-bound disclosure requests and settles each reply at most once. The protocol version
// is owned by the caller and passed in on every call.
class DisclosureCoordinator {
public:
    DisclosureCoordinator(DisclosureOraclePtr oracle, std::string identityTag, AuditLog& auditLog);

    RequestId requestDisclosure(BatchId batchId,
                                const std::vector<OpaqueValue>& values,
                                DisclosureKind kind,
                                const Identity& requester,
                                std::uint64_t currentVersion);

    // rebuild() must recompute the value set from live state, not replay the requested one.
    DisclosureResult settle(RequestId requestId,
                            const std::string& cleartextHex,
                            const std::string& proofHex,
                            std::uint64_t currentVersion,
                            const RebuildFn& rebuild);

    const DecryptionContext& context(RequestId requestId) const;
    bool contains(RequestId requestId) const { return contexts_.count(requestId) != 0; }
    bool isStale(RequestId requestId, std::uint64_t currentVersion) const;
    std::size_t contextCount() const { return contexts_.size(); }
    std::size_t pendingCount(std::uint64_t currentVersion) const;

    std::string commitmentHash(const std::vector<OpaqueValue>& values) const;

    void subscribe(EventSubscriber subscriber);

    // Events are queued by requestDisclosure/settle and only reach subscribers here, so callers can
    // finish their own bookkeeping first. A subscriber that throws is recorded in the audit log and
    // the remaining deliveries still run. Returns the number of events delivered.
    std::size_t publishPending();
    std::size_t queuedEventCount() const { return outbox_.size(); }

private:
    DisclosureResult decode(const DecryptionContext& ctx, const std::vector<std::uint64_t>& words) const;

    DisclosureOraclePtr oracle_;
    std::string identityTag_;
    AuditLog& auditLog_;
    std::map<RequestId, DecryptionContext> contexts_;
    std::vector<EventSubscriber> subscribers_;
    std::vector<ProtocolEvent> outbox_;
};

} // namespace bc
