#include "disclosure_oracle.hpp"

#include <iomanip>
#include <sstream>

namespace bc {

void DisclosureChannel::postRequest(DisclosureRequestMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(std::move(message));
}

std::optional<DisclosureRequestMessage> DisclosureChannel::peekRequest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.empty()) {
        return std::nullopt;
    }
    return requests_.front();
}

void DisclosureChannel::popRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!requests_.empty()) {
        requests_.pop_front();
    }
}

void DisclosureChannel::postReply(DisclosureReplyMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    replies_.push_back(std::move(message));
}

std::optional<DisclosureReplyMessage> DisclosureChannel::takeReply() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (replies_.empty()) {
        return std::nullopt;
    }
    DisclosureReplyMessage front = std::move(replies_.front());
    replies_.pop_front();
    return front;
}

std::size_t DisclosureChannel::pendingRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::size_t DisclosureChannel::pendingReplies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return replies_.size();
}

std::string encodeCleartextWords(const std::vector<std::uint64_t>& words) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto word : words) {
        // 24 zero bytes of padding, then the value big-endian.
        oss << std::string(48, '0') << std::setw(16) << word;
    }
    return oss.str();
}

} // namespace bc
