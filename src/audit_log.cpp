#include "audit_log.hpp"

#include "picosha2.h"

#include <stdexcept>

namespace bc {

std::size_t AuditLog::append(const std::string& record) {
    records_.push_back(record);
    leaves_.push_back(hashRecord(record));
    return leaves_.size() - 1;
}

const std::string& AuditLog::record(std::size_t index) const {
    if (index >= records_.size()) {
        throw std::out_of_range("audit record index out of range");
    }
    return records_[index];
}

std::string AuditLog::leaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string AuditLog::hashRecord(const std::string& record) {
    return picosha2::hash256_hex_string(record);
}

std::string AuditLog::hashPair(const std::string& left, const std::string& right) {
    return picosha2::hash256_hex_string(left + right);
}

std::string AuditLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<std::string> AuditLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t siblingIndex = (index % 2 == 0) ? index + 1 : index - 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index;
        }
        proof.push_back(layer[siblingIndex]);

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }
    return proof;
}

bool AuditLog::verifyInclusion(const std::string& leafHash,
                               std::size_t leafIndex,
                               const std::vector<std::string>& proof,
                               const std::string& root) {
    if (leafHash.empty() || root.empty()) {
        return false;
    }
    std::string current = leafHash;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
    }
    return index == 0 && current == root;
}

} // namespace bc
