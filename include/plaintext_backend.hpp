#pragma once

#include "compute_backend.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bc {

// Test double: values are kept in the clear behind their handles. Never use outside tests and
// local demos. Safe to share between threads.
class PlaintextBackend : public ComputeBackend {
public:
    PlaintextBackend();

    OpaqueValue encrypt(std::uint64_t value) override;
    OpaqueValue additiveIdentity() override;
    OpaqueValue combine(const OpaqueValue& a, const OpaqueValue& b) override;
    OpaqueValue compareEqual(const OpaqueValue& a, const OpaqueValue& b) override;
    OpaqueValue logicalAnd(const OpaqueValue& x, const OpaqueValue& y) override;
    OpaqueValue constantBool(bool value) override;
    std::uint64_t reveal(const OpaqueValue& value) const override;
    std::string label() const override { return "plaintext"; }

    std::size_t size() const;

private:
    struct Entry {
        OpaqueKind kind;
        std::uint64_t value;
    };

    // Callers hold mutex_.
    OpaqueValue store(OpaqueKind kind, std::string handle, std::uint64_t value);
    std::uint64_t load(const OpaqueValue& value, OpaqueKind expected) const;

    mutable std::mutex mutex_;
    std::string domain_;
    std::uint64_t nextNonce_;
    std::unordered_map<std::string, Entry> values_;
};

} // namespace bc
