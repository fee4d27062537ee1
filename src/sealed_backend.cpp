#include "sealed_backend.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace bc {

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::array<unsigned char, 8> encodeWord(std::uint64_t value) {
    std::array<unsigned char, 8> out{};
    for (int i = 7; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = static_cast<unsigned char>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

std::uint64_t decodeWord(const unsigned char* data) {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

} // namespace

SealedBackend::SealedBackend()
    : key_(crypto_secretbox_KEYBYTES) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium for sealed backend");
    }
    crypto_secretbox_keygen(key_.data());

    std::array<unsigned char, 16> instance{};
    randombytes_buf(instance.data(), instance.size());
    instanceId_ = bytesToHex(instance.data(), instance.size());
    domain_ = "sealed:" + instanceId_;
}

OpaqueValue SealedBackend::encrypt(std::uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::array<unsigned char, 32> nonce{};
    randombytes_buf(nonce.data(), nonce.size());
    std::string handle = deriveHandle(domain_, "input", { bytesToHex(nonce.data(), nonce.size()) });
    return seal(OpaqueKind::Uint, std::move(handle), value);
}

OpaqueValue SealedBackend::additiveIdentity() {
    std::lock_guard<std::mutex> lock(mutex_);
    return seal(OpaqueKind::Uint, deriveHandle(domain_, "identity", {}), 0);
}

OpaqueValue SealedBackend::combine(const OpaqueValue& a, const OpaqueValue& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t sum = open(a, OpaqueKind::Uint) + open(b, OpaqueKind::Uint);
    return seal(OpaqueKind::Uint, deriveHandle(domain_, "add", { a.handle, b.handle }), sum);
}

OpaqueValue SealedBackend::compareEqual(const OpaqueValue& a, const OpaqueValue& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool equal = open(a, OpaqueKind::Uint) == open(b, OpaqueKind::Uint);
    return seal(OpaqueKind::Bool, deriveHandle(domain_, "eq", { a.handle, b.handle }), equal ? 1 : 0);
}

OpaqueValue SealedBackend::logicalAnd(const OpaqueValue& x, const OpaqueValue& y) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool both = open(x, OpaqueKind::Bool) != 0 && open(y, OpaqueKind::Bool) != 0;
    return seal(OpaqueKind::Bool, deriveHandle(domain_, "and", { x.handle, y.handle }), both ? 1 : 0);
}

OpaqueValue SealedBackend::constantBool(bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return seal(OpaqueKind::Bool,
                deriveHandle(domain_, "const-bool", { value ? "1" : "0" }),
                value ? 1 : 0);
}

std::uint64_t SealedBackend::reveal(const OpaqueValue& value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open(value, value.kind);
}

std::vector<unsigned char> SealedBackend::sealedBytes(const OpaqueValue& value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = store_.find(value.handle);
    if (it == store_.end()) {
        throw std::invalid_argument("Unknown opaque handle: " + value.handle);
    }
    return it->second.box;
}

OpaqueValue SealedBackend::seal(OpaqueKind kind, std::string handle, std::uint64_t value) {
    auto plain = encodeWord(value);
    SealedEntry entry;
    entry.kind = kind;
    entry.box.resize(crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES + plain.size());
    unsigned char* nonce = entry.box.data();
    randombytes_buf(nonce, crypto_secretbox_NONCEBYTES);
    if (crypto_secretbox_easy(entry.box.data() + crypto_secretbox_NONCEBYTES,
                              plain.data(),
                              plain.size(),
                              nonce,
                              key_.data()) != 0) {
        sodium_memzero(plain.data(), plain.size());
        throw std::runtime_error("Failed to seal opaque value");
    }
    sodium_memzero(plain.data(), plain.size());
    store_[handle] = std::move(entry);
    return OpaqueValue{ std::move(handle), kind };
}

std::uint64_t SealedBackend::open(const OpaqueValue& value, OpaqueKind expected) const {
    auto it = store_.find(value.handle);
    if (it == store_.end()) {
        throw std::invalid_argument("Unknown opaque handle: " + value.handle);
    }
    if (it->second.kind != expected || value.kind != expected) {
        throw std::invalid_argument("Opaque value kind mismatch for handle " + value.handle);
    }
    const auto& box = it->second.box;
    if (box.size() != crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES + 8) {
        throw std::runtime_error("Sealed value has unexpected length");
    }
    std::array<unsigned char, 8> plain{};
    if (crypto_secretbox_open_easy(plain.data(),
                                   box.data() + crypto_secretbox_NONCEBYTES,
                                   box.size() - crypto_secretbox_NONCEBYTES,
                                   box.data(),
                                   key_.data()) != 0) {
        throw std::runtime_error("Sealed value failed authentication");
    }
    std::uint64_t decoded = decodeWord(plain.data());
    sodium_memzero(plain.data(), plain.size());
    return decoded;
}

} // namespace bc
