#pragma once

#include "opaque_value.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bc {

struct DisclosureRequestMessage {
    RequestId requestId = 0;
    std::vector<OpaqueValue> values;
};

struct DisclosureReplyMessage {
    RequestId requestId = 0;
    std::string cleartextHex; // 32-byte big-endian words, one per disclosed value
    std::string proofHex;
};

// Two-way mailbox between the protocol and the oracle. Requests go out when issued; replies come
// back whenever the oracle gets to them. Both queues may be used from any thread.
class DisclosureChannel {
public:
    void postRequest(DisclosureRequestMessage message);
    // Front request without removing it; popRequest() drops it once it has been answered.
    std::optional<DisclosureRequestMessage> peekRequest() const;
    void popRequest();

    void postReply(DisclosureReplyMessage message);
    std::optional<DisclosureReplyMessage> takeReply();

    std::size_t pendingRequests() const;
    std::size_t pendingReplies() const;

private:
    mutable std::mutex mutex_;
    std::deque<DisclosureRequestMessage> requests_;
    std::deque<DisclosureReplyMessage> replies_;
};

using DisclosureChannelPtr = std::shared_ptr<DisclosureChannel>;

class DisclosureOracle {
public:
    virtual ~DisclosureOracle() = default;

    // Queues the request and returns its id immediately; the reply arrives out of band.
    virtual RequestId requestDisclosure(const std::vector<OpaqueValue>& values) = 0;

    // Throws ProtocolError(InvalidProof) when the proof does not cover (requestId, cleartext).
    virtual std::vector<std::uint64_t> verifyAndDecode(RequestId requestId,
                                                       const std::string& cleartextHex,
                                                       const std::string& proofHex) const = 0;
};

using DisclosureOraclePtr = std::shared_ptr<DisclosureOracle>;

std::string encodeCleartextWords(const std::vector<std::uint64_t>& words);

} // namespace bc
