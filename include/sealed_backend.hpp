#pragma once

#include "compute_backend.hpp"
#include "key_material.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bc {

// Coprocessor-style backend. Every value is stored sealed with crypto_secretbox under a key that
// never leaves this object; operations open their operands, compute, and seal the result again.
// All access to the sealed store is serialized on one mutex.
class SealedBackend : public ComputeBackend {
public:
    SealedBackend();

    OpaqueValue encrypt(std::uint64_t value) override;
    OpaqueValue additiveIdentity() override;
    OpaqueValue combine(const OpaqueValue& a, const OpaqueValue& b) override;
    OpaqueValue compareEqual(const OpaqueValue& a, const OpaqueValue& b) override;
    OpaqueValue logicalAnd(const OpaqueValue& x, const OpaqueValue& y) override;
    OpaqueValue constantBool(bool value) override;
    std::uint64_t reveal(const OpaqueValue& value) const override;
    std::string label() const override { return "sealed:" + instanceId_; }

    // Sealed bytes behind a handle (nonce || ciphertext), exposed for audit dumps.
    std::vector<unsigned char> sealedBytes(const OpaqueValue& value) const;

private:
    struct SealedEntry {
        OpaqueKind kind;
        std::vector<unsigned char> box;
    };

    // Callers hold mutex_.
    OpaqueValue seal(OpaqueKind kind, std::string handle, std::uint64_t value);
    std::uint64_t open(const OpaqueValue& value, OpaqueKind expected) const;

    mutable std::mutex mutex_;
    KeyMaterial key_;
    std::string instanceId_;
    std::string domain_;
    std::unordered_map<std::string, SealedEntry> store_;
};

} // namespace bc
