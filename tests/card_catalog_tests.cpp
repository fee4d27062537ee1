#include "card_catalog.hpp"
#include "opaque_value.hpp"
#include "protocol_config.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace bc;
using namespace bc::test;

void catalog() {
    check(cardCount(ClueField::Weapon) == 6, "six weapons");
    check(cardCount(ClueField::Room) == 9, "nine rooms");
    check(cardCount(ClueField::Suspect) == 6, "six suspects");

    check(cardName(ClueField::Weapon, 2) == "Lead Pipe", "weapon 2");
    check(cardName(ClueField::Suspect, 0) == "Miss Scarlet", "suspect 0");

    auto pipe = findCard(ClueField::Weapon, "lead pipe");
    check(pipe.has_value() && *pipe == 2, "lookup should ignore case");
    check(!findCard(ClueField::Room, "Dungeon").has_value(), "unknown room found");
    check(!findCard(ClueField::Room, "Lead Pipe").has_value(), "weapon found in the room deck");

    check(describeCard(ClueField::Room, 8) == "Study", "room 8");
    check(describeCard(ClueField::Room, 12) == "12", "sums past the deck print as numbers");

    bool threw = false;
    try {
        cardName(ClueField::Suspect, 6);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    check(threw, "index past the deck should throw");

    check(fieldIndex(ClueField::Suspect) == 2, "suspect is the third field");
    check(std::string(toString(ClueField::Room)) == "room", "field name");
}

void handles() {
    std::string a = deriveHandle("plaintext", "add", { "x", "y" });
    check(a.size() == 64, "handles are 32-byte hex");
    check(a == deriveHandle("plaintext", "add", { "x", "y" }), "derivation must be deterministic");
    check(a != deriveHandle("plaintext", "add", { "y", "x" }), "operand order must matter");
    check(a != deriveHandle("plaintext", "eq", { "x", "y" }), "operation must matter");
    check(a != deriveHandle("sealed:1", "add", { "x", "y" }), "domain must matter");
    check(deriveHandle("d", "op", { "ab", "c" }) != deriveHandle("d", "op", { "a", "bc" }),
          "operands must be length-delimited");
}

void configuration() {
    ::unsetenv("BC_DEPLOYMENT_ID");
    ::unsetenv("BC_CHAIN_ID");

    ProtocolConfig cfg;
    bool threw = false;
    try {
        buildIdentityTag(cfg);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "missing deployment id should be rejected");

    ::setenv("BC_DEPLOYMENT_ID", "default", 1);
    threw = false;
    try {
        resolveDeploymentId(cfg);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "\"default\" deployment id should be rejected");

    ::setenv("BC_DEPLOYMENT_ID", " testnet ", 1);
    check(buildIdentityTag(cfg) == "blindclue:testnet", "env deployment id should be trimmed");
    ::setenv("BC_CHAIN_ID", "31337", 1);
    check(buildIdentityTag(cfg) == "blindclue:testnet|31337", "env chain id");

    cfg.deploymentId = "mainnet";
    cfg.chainId = "1";
    check(buildIdentityTag(cfg) == "blindclue:mainnet|1", "explicit values win over env");
    validateConfig(cfg);

    ProtocolConfig bad = cfg;
    bad.maxBatchSize = 0;
    threw = false;
    try {
        validateConfig(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "zero maxBatchSize accepted");

    bad = cfg;
    bad.deploymentId = "main|net";
    threw = false;
    try {
        validateConfig(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "separator in deployment id accepted");

    bad = cfg;
    bad.protocolId = "";
    threw = false;
    try {
        validateConfig(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "empty protocol id accepted");

    ::unsetenv("BC_DEPLOYMENT_ID");
    ::unsetenv("BC_CHAIN_ID");
}

bool overrideRejected(const char* name, const char* value) {
    ::setenv(name, value, 1);
    ProtocolConfig cfg;
    bool threw = false;
    try {
        applyEnvironmentOverrides(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ::unsetenv(name);
    return threw && cfg.maxBatchSize == 16 && cfg.cooldownSeconds == 30;
}

void environmentOverrides() {
    ::unsetenv("BC_MAX_BATCH_SIZE");
    ::unsetenv("BC_COOLDOWN_SECONDS");

    ProtocolConfig cfg;
    applyEnvironmentOverrides(cfg);
    check(cfg.maxBatchSize == 16 && cfg.cooldownSeconds == 30, "unset variables changed defaults");

    ::setenv("BC_MAX_BATCH_SIZE", " 4294967295 ", 1);
    ::setenv("BC_COOLDOWN_SECONDS", "18446744073709551615", 1);
    applyEnvironmentOverrides(cfg);
    check(cfg.maxBatchSize == 4294967295u, "largest batch size should be accepted");
    check(cfg.cooldownSeconds == 18446744073709551615ull, "largest cooldown should be accepted");
    ::unsetenv("BC_MAX_BATCH_SIZE");
    ::unsetenv("BC_COOLDOWN_SECONDS");

    // 2^32 + 1 must not wrap to 1.
    check(overrideRejected("BC_MAX_BATCH_SIZE", "4294967297"), "oversized batch size wrapped");
    check(overrideRejected("BC_COOLDOWN_SECONDS", "18446744073709551616"), "oversized cooldown wrapped");
    check(overrideRejected("BC_MAX_BATCH_SIZE", "-1"), "negative batch size accepted");
    check(overrideRejected("BC_COOLDOWN_SECONDS", "30s"), "non-numeric cooldown accepted");
}

} // namespace

int main() {
    suiteName() = "card_catalog_test";
    catalog();
    handles();
    configuration();
    environmentOverrides();
    std::cout << "card_catalog_test passed" << std::endl;
    return 0;
}
