#pragma once

#include "opaque_value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace bc {

enum class Role { Owner, Provider };

enum class ActionCategory { Submission, Request };

const char* toString(ActionCategory category);

class AccessGuard {
public:
    AccessGuard(Identity owner, std::uint64_t cooldownSeconds);

    void authorize(const Identity& caller, Role requiredRole) const;
    void requireUnpaused() const;

    // Throws RateLimited when now < lastAction + cooldown. Never touches the ledger.
    void checkCooldown(const Identity& identity, ActionCategory category, std::uint64_t now) const;
    // Same test; records now as the last action only when it passes.
    void checkAndUpdateCooldown(const Identity& identity, ActionCategory category, std::uint64_t now);

    bool addProvider(const Identity& caller, const Identity& provider);
    bool removeProvider(const Identity& caller, const Identity& provider);
    void setPaused(const Identity& caller, bool paused);
    void setCooldownSeconds(const Identity& caller, std::uint64_t seconds);

    const Identity& owner() const { return owner_; }
    bool isProvider(const Identity& identity) const { return providers_.count(identity) != 0; }
    bool isPaused() const { return paused_; }
    std::uint64_t cooldownSeconds() const { return cooldownSeconds_; }
    std::optional<std::uint64_t> lastAction(const Identity& identity, ActionCategory category) const;

private:
    Identity owner_;
    std::set<Identity> providers_;
    bool paused_;
    std::uint64_t cooldownSeconds_;
    std::map<std::pair<Identity, ActionCategory>, std::uint64_t> lastAction_;
};

} // namespace bc
