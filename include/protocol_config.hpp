#pragma once

#include <cstdint>
#include <string>

namespace bc {

struct ProtocolConfig {
    std::string protocolId = "blindclue";
    std::string deploymentId = "default"; // falls back to BC_DEPLOYMENT_ID
    std::string chainId;                  // falls back to BC_CHAIN_ID
    std::uint32_t maxBatchSize = 16;
    std::uint64_t cooldownSeconds = 30;
};

std::string resolveDeploymentId(const ProtocolConfig& cfg);
std::string resolveChainId(const ProtocolConfig& cfg);

// Domain tag mixed into commitment hashes and oracle proofs: protocolId:deployment[|chain].
std::string buildIdentityTag(const ProtocolConfig& cfg);

// Reads BC_MAX_BATCH_SIZE and BC_COOLDOWN_SECONDS when set. Throws std::invalid_argument for a
// non-numeric value or one that does not fit the field.
void applyEnvironmentOverrides(ProtocolConfig& cfg);

void validateConfig(const ProtocolConfig& cfg);

} // namespace bc
