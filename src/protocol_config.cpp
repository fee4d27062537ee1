#include "protocol_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace bc {

namespace {

constexpr const char* kWhitespace = " \t\n\r\f\v";

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(kWhitespace);
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(kWhitespace);
    return value.substr(start, end - start + 1);
}

// Trimmed value of an environment variable; nullopt when unset or blank.
std::optional<std::string> envSetting(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool containsSeparator(const std::string& value) {
    return value.find_first_of(":|") != std::string::npos;
}

std::uint64_t parseSetting(const char* name, const std::string& text, std::uint64_t maxValue) {
    bool digits = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return ch >= '0' && ch <= '9';
    });
    if (!digits) {
        throw std::invalid_argument(std::string(name) + " must be an unsigned integer, got \"" + text + "\"");
    }
    std::uint64_t value = 0;
    for (char ch : text) {
        std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (maxValue - digit) / 10) {
            std::ostringstream oss;
            oss << name << " must be at most " << maxValue << ", got " << text;
            throw std::invalid_argument(oss.str());
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace

std::string resolveDeploymentId(const ProtocolConfig& cfg) {
    std::string configured = trim(cfg.deploymentId);
    std::string deployment = configured;
    if (configured.empty() || configured == "default") {
        deployment = envSetting("BC_DEPLOYMENT_ID").value_or(configured);
    }
    if (deployment.empty()) {
        throw std::runtime_error(
            "Identity tag has no deployment component; set ProtocolConfig::deploymentId or BC_DEPLOYMENT_ID");
    }
    if (deployment == "default") {
        throw std::runtime_error(
            "Identity tag deployment is still the \"default\" placeholder; commitments and oracle proofs "
            "would be replayable across deployments");
    }
    return deployment;
}

std::string resolveChainId(const ProtocolConfig& cfg) {
    std::string configured = trim(cfg.chainId);
    if (!configured.empty()) {
        return configured;
    }
    return envSetting("BC_CHAIN_ID").value_or(std::string());
}

std::string buildIdentityTag(const ProtocolConfig& cfg) {
    std::ostringstream oss;
    oss << cfg.protocolId << ":" << resolveDeploymentId(cfg);
    std::string chainId = resolveChainId(cfg);
    if (!chainId.empty()) {
        oss << "|" << chainId;
    }
    return oss.str();
}

void applyEnvironmentOverrides(ProtocolConfig& cfg) {
    if (auto size = envSetting("BC_MAX_BATCH_SIZE")) {
        cfg.maxBatchSize = static_cast<std::uint32_t>(
            parseSetting("BC_MAX_BATCH_SIZE", *size, std::numeric_limits<std::uint32_t>::max()));
    }
    if (auto cooldown = envSetting("BC_COOLDOWN_SECONDS")) {
        cfg.cooldownSeconds =
            parseSetting("BC_COOLDOWN_SECONDS", *cooldown, std::numeric_limits<std::uint64_t>::max());
    }
}

void validateConfig(const ProtocolConfig& cfg) {
    if (cfg.protocolId.empty()) {
        throw std::invalid_argument("protocolId must not be empty");
    }
    if (containsSeparator(cfg.protocolId)) {
        throw std::invalid_argument("protocolId must not contain ':' or '|'");
    }
    if (cfg.maxBatchSize == 0) {
        throw std::invalid_argument("maxBatchSize must be positive");
    }
    std::string deployment = resolveDeploymentId(cfg);
    if (containsSeparator(deployment)) {
        throw std::invalid_argument("deploymentId must not contain ':' or '|'");
    }
}

} // namespace bc
