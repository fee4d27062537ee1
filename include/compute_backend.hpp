#pragma once

#include "opaque_value.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace bc {

// Opaque arithmetic capability. Uint values combine under wrapping 64-bit addition, which is an
// abelian group, so aggregation order never matters.
class ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    // Fresh input; two encryptions of the same value yield different handles.
    virtual OpaqueValue encrypt(std::uint64_t value) = 0;

    virtual OpaqueValue additiveIdentity() = 0;
    virtual OpaqueValue combine(const OpaqueValue& a, const OpaqueValue& b) = 0;
    virtual OpaqueValue compareEqual(const OpaqueValue& a, const OpaqueValue& b) = 0;
    virtual OpaqueValue logicalAnd(const OpaqueValue& x, const OpaqueValue& y) = 0;
    virtual OpaqueValue constantBool(bool value) = 0;

    // Key-holder path. Only the disclosure oracle may call this; protocol code never does.
    virtual std::uint64_t reveal(const OpaqueValue& value) const = 0;

    virtual std::string label() const = 0;
};

using ComputeBackendPtr = std::shared_ptr<ComputeBackend>;

} // namespace bc
