#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace bc {

// Append-only transcript of protocol events. Leaves are SHA-256 of the raw record; the Merkle
// tree duplicates the last node of odd layers.
class AuditLog {
public:
    std::size_t append(const std::string& record);

    const std::string& record(std::size_t index) const;
    std::string leaf(std::size_t index) const;
    const std::vector<std::string>& records() const { return records_; }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static bool verifyInclusion(const std::string& leafHash,
                                std::size_t leafIndex,
                                const std::vector<std::string>& proof,
                                const std::string& root);
    static std::string hashRecord(const std::string& record);

    std::size_t size() const { return leaves_.size(); }

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> records_;
    std::vector<std::string> leaves_;
};

} // namespace bc
