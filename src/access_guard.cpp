#include "access_guard.hpp"

#include "protocol_error.hpp"

#include <stdexcept>

namespace bc {

const char* toString(ActionCategory category) {
    switch (category) {
    case ActionCategory::Submission:
        return "submission";
    case ActionCategory::Request:
        return "request";
    }
    return "unknown";
}

AccessGuard::AccessGuard(Identity owner, std::uint64_t cooldownSeconds)
    : owner_(std::move(owner)), paused_(false), cooldownSeconds_(cooldownSeconds) {
    if (owner_.empty()) {
        throw std::invalid_argument("AccessGuard requires a non-empty owner identity");
    }
}

void AccessGuard::authorize(const Identity& caller, Role requiredRole) const {
    if (requiredRole == Role::Owner) {
        if (caller != owner_) {
            throw ProtocolError(ProtocolErrorCode::NotOwner, caller + " is not the owner");
        }
        return;
    }
    if (providers_.count(caller) == 0) {
        throw ProtocolError(ProtocolErrorCode::NotProvider, caller + " is not a provider");
    }
}

void AccessGuard::requireUnpaused() const {
    if (paused_) {
        throw ProtocolError(ProtocolErrorCode::Paused, "protocol is paused");
    }
}

void AccessGuard::checkCooldown(const Identity& identity,
                                ActionCategory category,
                                std::uint64_t now) const {
    auto it = lastAction_.find({ identity, category });
    if (it == lastAction_.end()) {
        return;
    }
    std::uint64_t last = it->second;
    // now < last + cooldown, written so a huge cooldown cannot overflow.
    if (now < last || now - last < cooldownSeconds_) {
        throw ProtocolError(ProtocolErrorCode::RateLimited,
                            identity + " must wait before the next " + toString(category));
    }
}

void AccessGuard::checkAndUpdateCooldown(const Identity& identity,
                                         ActionCategory category,
                                         std::uint64_t now) {
    checkCooldown(identity, category, now);
    lastAction_[{ identity, category }] = now;
}

bool AccessGuard::addProvider(const Identity& caller, const Identity& provider) {
    authorize(caller, Role::Owner);
    if (provider.empty()) {
        throw std::invalid_argument("Provider identity must not be empty");
    }
    return providers_.insert(provider).second;
}

bool AccessGuard::removeProvider(const Identity& caller, const Identity& provider) {
    authorize(caller, Role::Owner);
    return providers_.erase(provider) != 0;
}

void AccessGuard::setPaused(const Identity& caller, bool paused) {
    authorize(caller, Role::Owner);
    paused_ = paused;
}

void AccessGuard::setCooldownSeconds(const Identity& caller, std::uint64_t seconds) {
    authorize(caller, Role::Owner);
    cooldownSeconds_ = seconds;
}

std::optional<std::uint64_t> AccessGuard::lastAction(const Identity& identity,
                                                     ActionCategory category) const {
    auto it = lastAction_.find({ identity, category });
    if (it == lastAction_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace bc
