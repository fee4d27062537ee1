#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include <sodium.h>

namespace bc {

// Fixed-size secret bytes wiped with sodium_memzero on destruction and on move-out.
class KeyMaterial {
public:
    KeyMaterial() = default;
    explicit KeyMaterial(std::size_t size) : bytes_(size) {}

    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;

    KeyMaterial(KeyMaterial&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    KeyMaterial& operator=(KeyMaterial&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    ~KeyMaterial() { wipe(); }

    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }
    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

private:
    void wipe() {
        if (!bytes_.empty()) {
            sodium_memzero(bytes_.data(), bytes_.size());
        }
    }

    std::vector<unsigned char> bytes_;
};

} // namespace bc
