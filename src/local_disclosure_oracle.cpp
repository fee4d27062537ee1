#include "local_disclosure_oracle.hpp"

#include "protocol_error.hpp"

#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace bc {

namespace {

constexpr std::size_t kWordHexChars = 64;

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

int hexNibble(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

std::optional<std::vector<unsigned char>> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexNibble(hex[i]);
        int lo = hexNibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

std::vector<std::uint64_t> decodeWords(const std::vector<unsigned char>& bytes) {
    std::vector<std::uint64_t> words;
    words.reserve(bytes.size() / 32);
    for (std::size_t offset = 0; offset < bytes.size(); offset += 32) {
        for (std::size_t i = 0; i < 24; ++i) {
            if (bytes[offset + i] != 0) {
                throw ProtocolError(ProtocolErrorCode::InvalidProof,
                                    "cleartext word exceeds 64 bits");
            }
        }
        std::uint64_t word = 0;
        for (std::size_t i = 24; i < 32; ++i) {
            word = (word << 8) | bytes[offset + i];
        }
        words.push_back(word);
    }
    return words;
}

} // namespace

LocalDisclosureOracle::LocalDisclosureOracle(ComputeBackendPtr keyHolder,
                                             DisclosureChannelPtr channel,
                                             std::string identityTag)
    : keyHolder_(std::move(keyHolder))
    , channel_(std::move(channel))
    , identityTag_(std::move(identityTag))
    , publicKey_(crypto_sign_PUBLICKEYBYTES)
    , secretKey_(crypto_sign_SECRETKEYBYTES)
    , nextRequestId_(1) {
    if (!keyHolder_) {
        throw std::invalid_argument("Disclosure oracle requires a compute backend");
    }
    if (!channel_) {
        throw std::invalid_argument("Disclosure oracle requires a channel");
    }
    if (identityTag_.empty()) {
        throw std::invalid_argument("Disclosure oracle identity tag must not be empty");
    }
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium for disclosure oracle");
    }
    if (crypto_sign_keypair(publicKey_.data(), secretKey_.data()) != 0) {
        throw std::runtime_error("Failed to generate oracle signing keypair");
    }
}

RequestId LocalDisclosureOracle::requestDisclosure(const std::vector<OpaqueValue>& values) {
    if (values.empty()) {
        throw std::invalid_argument("Disclosure request must name at least one value");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    RequestId id = nextRequestId_++;
    channel_->postRequest(DisclosureRequestMessage{ id, values });
    return id;
}

std::size_t LocalDisclosureOracle::processPending() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t answered = 0;
    while (auto request = channel_->peekRequest()) {
        std::vector<std::uint64_t> words;
        words.reserve(request->values.size());
        for (const auto& value : request->values) {
            words.push_back(keyHolder_->reveal(value));
        }
        std::string cleartext = encodeCleartextWords(words);
        std::string message = signingMessage(request->requestId, cleartext);

        std::vector<unsigned char> signature(crypto_sign_BYTES);
        unsigned long long sigLen = 0;
        if (crypto_sign_detached(signature.data(),
                                 &sigLen,
                                 reinterpret_cast<const unsigned char*>(message.data()),
                                 message.size(),
                                 secretKey_.data()) != 0) {
            throw std::runtime_error("Oracle signing failed");
        }
        channel_->postReply(DisclosureReplyMessage{
            request->requestId, std::move(cleartext), bytesToHex(signature.data(), sigLen) });
        channel_->popRequest();
        ++answered;
    }
    return answered;
}

std::vector<std::uint64_t> LocalDisclosureOracle::verifyAndDecode(RequestId requestId,
                                                                  const std::string& cleartextHex,
                                                                  const std::string& proofHex) const {
    auto signature = hexToBytes(proofHex);
    if (!signature || signature->size() != crypto_sign_BYTES) {
        throw ProtocolError(ProtocolErrorCode::InvalidProof, "malformed proof");
    }
    if (cleartextHex.empty() || cleartextHex.size() % kWordHexChars != 0) {
        throw ProtocolError(ProtocolErrorCode::InvalidProof, "malformed cleartext");
    }
    auto cleartext = hexToBytes(cleartextHex);
    if (!cleartext) {
        throw ProtocolError(ProtocolErrorCode::InvalidProof, "cleartext is not hex");
    }

    std::string message = signingMessage(requestId, cleartextHex);
    if (crypto_sign_verify_detached(signature->data(),
                                    reinterpret_cast<const unsigned char*>(message.data()),
                                    message.size(),
                                    publicKey_.data()) != 0) {
        throw ProtocolError(ProtocolErrorCode::InvalidProof,
                            "signature does not cover request " + std::to_string(requestId));
    }
    return decodeWords(*cleartext);
}

std::string LocalDisclosureOracle::publicKeyHex() const {
    return bytesToHex(publicKey_.data(), publicKey_.size());
}

std::string LocalDisclosureOracle::signingMessage(RequestId requestId,
                                                  const std::string& cleartextHex) const {
    std::ostringstream oss;
    oss << "disclosure:v1|" << identityTag_ << "|" << requestId << "|";
    for (char ch : cleartextHex) {
        oss << static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return oss.str();
}

} // namespace bc
