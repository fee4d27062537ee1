#pragma once

#include "compute_backend.hpp"
#include "disclosure_oracle.hpp"
#include "key_material.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace bc {

// In-process key holder. Requests are queued on the channel; processPending() answers them with
// the revealed words and an ed25519 signature over (identity tag, request id, cleartext).
class LocalDisclosureOracle : public DisclosureOracle {
public:
    LocalDisclosureOracle(ComputeBackendPtr keyHolder,
                          DisclosureChannelPtr channel,
                          std::string identityTag);

    RequestId requestDisclosure(const std::vector<OpaqueValue>& values) override;
    std::vector<std::uint64_t> verifyAndDecode(RequestId requestId,
                                               const std::string& cleartextHex,
                                               const std::string& proofHex) const override;

    // Answers every queued request, in order. Returns the number of replies posted. A request is
    // only removed from the channel once its reply is posted; if revealing or signing throws, it
    // stays at the front of the queue.
    std::size_t processPending();

    std::string publicKeyHex() const;
    const DisclosureChannelPtr& channel() const { return channel_; }

private:
    std::string signingMessage(RequestId requestId, const std::string& cleartextHex) const;

    std::mutex mutex_;
    ComputeBackendPtr keyHolder_;
    DisclosureChannelPtr channel_;
    std::string identityTag_;
    std::vector<unsigned char> publicKey_;
    KeyMaterial secretKey_;
    RequestId nextRequestId_;
};

} // namespace bc
