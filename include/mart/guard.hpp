#ifndef MART_GUARD_HPP
#define MART_GUARD_HPP

#include <mutex>
#include <unordered_set>

#include "types.hpp"

namespace mart {

// =============================================================================
// ReentrancyGuard
// =============================================================================

enum class GuardScope : uint8_t {
    GLOBAL = 0,     // One operation at a time across all assets
    PER_ASSET = 1   // Nested entry rejected only for the same asset
};

class ReentrancyGuard {
public:
    explicit ReentrancyGuard(GuardScope scope = GuardScope::GLOBAL) : scope_(scope) {}

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    // Held for the lifetime of the object; released on every exit path
    class Scope {
    public:
        Scope(Scope&& other) noexcept
            : guard_(other.guard_), asset_id_(other.asset_id_), acquired_(other.acquired_) {
            other.acquired_ = false;
        }
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Scope& operator=(Scope&&) = delete;

        ~Scope() {
            if (acquired_) guard_.release(asset_id_);
        }

        bool acquired() const { return acquired_; }
        explicit operator bool() const { return acquired_; }

    private:
        friend class ReentrancyGuard;
        Scope(ReentrancyGuard& guard, AssetId asset_id, bool acquired)
            : guard_(guard), asset_id_(asset_id), acquired_(acquired) {}

        ReentrancyGuard& guard_;
        AssetId asset_id_;
        bool acquired_;
    };

    // Check acquired() before proceeding
    Scope enter(AssetId asset_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool acquired = false;
        if (scope_ == GuardScope::GLOBAL) {
            acquired = !entered_;
            if (acquired) entered_ = true;
        } else {
            acquired = assets_.insert(asset_id).second;
        }
        return Scope(*this, asset_id, acquired);
    }

    bool entered(AssetId asset_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return scope_ == GuardScope::GLOBAL ? entered_ : assets_.count(asset_id) > 0;
    }

    GuardScope scope() const { return scope_; }

private:
    GuardScope scope_;
    bool entered_{false};
    std::unordered_set<AssetId> assets_;
    mutable std::mutex mutex_;

    void release(AssetId asset_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (scope_ == GuardScope::GLOBAL) {
            entered_ = false;
        } else {
            assets_.erase(asset_id);
        }
    }
};

} // namespace mart

#endif // MART_GUARD_HPP
