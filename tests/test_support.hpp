#pragma once

#include "clue_protocol.hpp"
#include "local_disclosure_oracle.hpp"
#include "plaintext_backend.hpp"
#include "protocol_error.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace bc::test {

inline std::string& suiteName() {
    static std::string name = "test";
    return name;
}

[[noreturn]] inline void fail(const std::string& msg) {
    std::cerr << suiteName() << " failure: " << msg << std::endl;
    std::exit(1);
}

inline void check(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

template <typename Fn>
void expectError(ProtocolErrorCode expected, Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const ProtocolError& ex) {
        if (ex.code() != expected) {
            fail(what + ": expected " + toString(expected) + ", got " + toString(ex.code()));
        }
        return;
    }
    fail(what + ": expected " + std::string(toString(expected)) + " but nothing was thrown");
}

inline ProtocolConfig testConfig(std::uint32_t maxBatchSize = 4, std::uint64_t cooldown = 10) {
    ProtocolConfig cfg;
    cfg.deploymentId = "unit-test";
    cfg.chainId = "local";
    cfg.maxBatchSize = maxBatchSize;
    cfg.cooldownSeconds = cooldown;
    return cfg;
}

// Protocol wired to an in-process oracle over an explicit channel.
struct Harness {
    ComputeBackendPtr backend;
    DisclosureChannelPtr channel;
    std::shared_ptr<LocalDisclosureOracle> oracle;
    std::unique_ptr<ClueProtocol> protocol;
    std::map<RequestId, DisclosureReplyMessage> inbox;

    explicit Harness(const ProtocolConfig& cfg = testConfig(),
                     ComputeBackendPtr backendIn = std::make_shared<PlaintextBackend>())
        : backend(std::move(backendIn))
        , channel(std::make_shared<DisclosureChannel>())
        , oracle(std::make_shared<LocalDisclosureOracle>(backend, channel, buildIdentityTag(cfg)))
        , protocol(std::make_unique<ClueProtocol>(cfg, "owner", backend, oracle)) {}

    ClueTriple triple(std::uint64_t weapon, std::uint64_t room, std::uint64_t suspect) {
        return ClueTriple{ backend->encrypt(weapon), backend->encrypt(room), backend->encrypt(suspect) };
    }

    // Lets the oracle answer everything queued and returns the reply for one request.
    DisclosureReplyMessage replyFor(RequestId requestId) {
        oracle->processPending();
        while (auto reply = channel->takeReply()) {
            inbox[reply->requestId] = *reply;
        }
        auto it = inbox.find(requestId);
        if (it == inbox.end()) {
            fail("no oracle reply for request " + std::to_string(requestId));
        }
        return it->second;
    }
};

} // namespace bc::test
