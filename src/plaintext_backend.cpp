#include "plaintext_backend.hpp"

#include <stdexcept>
#include <string>

namespace bc {

PlaintextBackend::PlaintextBackend()
    : domain_("plaintext"), nextNonce_(0) {}

OpaqueValue PlaintextBackend::encrypt(std::uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string nonce = std::to_string(nextNonce_++);
    return store(OpaqueKind::Uint, deriveHandle(domain_, "input", { nonce }), value);
}

OpaqueValue PlaintextBackend::additiveIdentity() {
    std::lock_guard<std::mutex> lock(mutex_);
    return store(OpaqueKind::Uint, deriveHandle(domain_, "identity", {}), 0);
}

OpaqueValue PlaintextBackend::combine(const OpaqueValue& a, const OpaqueValue& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t sum = load(a, OpaqueKind::Uint) + load(b, OpaqueKind::Uint);
    return store(OpaqueKind::Uint, deriveHandle(domain_, "add", { a.handle, b.handle }), sum);
}

OpaqueValue PlaintextBackend::compareEqual(const OpaqueValue& a, const OpaqueValue& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool equal = load(a, OpaqueKind::Uint) == load(b, OpaqueKind::Uint);
    return store(OpaqueKind::Bool, deriveHandle(domain_, "eq", { a.handle, b.handle }), equal ? 1 : 0);
}

OpaqueValue PlaintextBackend::logicalAnd(const OpaqueValue& x, const OpaqueValue& y) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool both = load(x, OpaqueKind::Bool) != 0 && load(y, OpaqueKind::Bool) != 0;
    return store(OpaqueKind::Bool, deriveHandle(domain_, "and", { x.handle, y.handle }), both ? 1 : 0);
}

OpaqueValue PlaintextBackend::constantBool(bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return store(OpaqueKind::Bool,
                 deriveHandle(domain_, "const-bool", { value ? "1" : "0" }),
                 value ? 1 : 0);
}

std::uint64_t PlaintextBackend::reveal(const OpaqueValue& value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load(value, value.kind);
}

std::size_t PlaintextBackend::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

OpaqueValue PlaintextBackend::store(OpaqueKind kind, std::string handle, std::uint64_t value) {
    values_[handle] = Entry{ kind, value };
    return OpaqueValue{ std::move(handle), kind };
}

std::uint64_t PlaintextBackend::load(const OpaqueValue& value, OpaqueKind expected) const {
    auto it = values_.find(value.handle);
    if (it == values_.end()) {
        throw std::invalid_argument("Unknown opaque handle: " + value.handle);
    }
    if (it->second.kind != expected || value.kind != expected) {
        throw std::invalid_argument("Opaque value kind mismatch for handle " + value.handle);
    }
    return it->second.value;
}

} // namespace bc
