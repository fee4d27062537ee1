#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bc {

using Identity = std::string;
using BatchId = std::uint64_t;
using RequestId = std::uint64_t;

enum class OpaqueKind { Uint, Bool };

// Handle to a value held by a ComputeBackend. The handle is 32 bytes of hex and says nothing about
// the plaintext behind it.
struct OpaqueValue {
    std::string handle;
    OpaqueKind kind = OpaqueKind::Uint;

    bool empty() const { return handle.empty(); }
};

inline bool operator==(const OpaqueValue& a, const OpaqueValue& b) {
    return a.kind == b.kind && a.handle == b.handle;
}

inline bool operator!=(const OpaqueValue& a, const OpaqueValue& b) {
    return !(a == b);
}

enum class ClueField : std::size_t { Weapon = 0, Room = 1, Suspect = 2 };

constexpr std::size_t kClueFieldCount = 3;
constexpr std::array<ClueField, kClueFieldCount> kClueFields = {
    ClueField::Weapon, ClueField::Room, ClueField::Suspect
};

// One opaque value per tracked field, indexed by ClueField.
using ClueTriple = std::array<OpaqueValue, kClueFieldCount>;

inline std::size_t fieldIndex(ClueField field) {
    return static_cast<std::size_t>(field);
}

const char* toString(ClueField field);

// Handles are SHA-256 over the backend domain, the operation name and the length-prefixed operand
// handles. The same operation over the same operands always yields the same handle.
std::string deriveHandle(const std::string& domain,
                         const std::string& operation,
                         const std::vector<std::string>& operands);

} // namespace bc
