// =============================================================================
// ledger.cpp - AssetLedger Implementation
// =============================================================================

#include "mart/ledger.hpp"
#include "mart/log.hpp"

namespace mart {

// =============================================================================
// Supply
// =============================================================================

int32_t AssetLedger::mint(const Address& to, AssetId asset_id) {
    if (addresses::is_zero(to)) {
        return errors::INVALID_RECEIVER;
    }

    std::unique_lock lock(mutex_);
    if (tokens_.find(asset_id) != tokens_.end()) {
        return errors::ASSET_ALREADY_EXISTS;
    }
    tokens_[asset_id] = Token{to, std::nullopt};
    return errors::OK;
}

int32_t AssetLedger::burn(const Address& caller, AssetId asset_id) {
    Address owner;
    ITransferHook* hook = nullptr;
    {
        std::shared_lock lock(mutex_);
        auto it = tokens_.find(asset_id);
        if (it == tokens_.end()) return errors::ASSET_NOT_FOUND;
        if (!authorized(it->second, caller)) return errors::CALLER_NOT_OWNER_NOR_APPROVED;
        owner = it->second.owner;
        hook = hook_;
    }

    if (hook) {
        hook->before_transfer(owner, addresses::ZERO, asset_id);
    }

    std::unique_lock lock(mutex_);
    auto it = tokens_.find(asset_id);
    if (it == tokens_.end() || it->second.owner != owner) {
        return errors::OWNERSHIP_TRANSFER_FAILED;
    }
    tokens_.erase(it);
    return errors::OK;
}

bool AssetLedger::exists(AssetId asset_id) const {
    std::shared_lock lock(mutex_);
    return tokens_.find(asset_id) != tokens_.end();
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Address> AssetLedger::owner_of(AssetId asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(asset_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second.owner;
}

uint64_t AssetLedger::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    uint64_t count = 0;
    for (const auto& [id, token] : tokens_) {
        if (token.owner == owner) ++count;
    }
    return count;
}

bool AssetLedger::is_approved_or_owner(const Address& spender, AssetId asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(asset_id);
    if (it == tokens_.end()) return false;
    return authorized(it->second, spender);
}

bool AssetLedger::authorized(const Token& token, const Address& spender) const {
    if (token.owner == spender) return true;
    if (token.approved && *token.approved == spender) return true;
    return operators_.count({token.owner, spender}) > 0;
}

// =============================================================================
// Approvals
// =============================================================================

int32_t AssetLedger::approve(const Address& caller, const Address& to, AssetId asset_id) {
    std::unique_lock lock(mutex_);
    auto it = tokens_.find(asset_id);
    if (it == tokens_.end()) return errors::ASSET_NOT_FOUND;

    Token& token = it->second;
    bool is_operator = operators_.count({token.owner, caller}) > 0;
    if (token.owner != caller && !is_operator) {
        return errors::CALLER_NOT_OWNER_NOR_APPROVED;
    }
    if (to == token.owner) {
        return errors::INVALID_RECEIVER;
    }

    if (addresses::is_zero(to)) {
        token.approved.reset();
    } else {
        token.approved = to;
    }
    return errors::OK;
}

std::optional<Address> AssetLedger::get_approved(AssetId asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(asset_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second.approved;
}

int32_t AssetLedger::set_approval_for_all(const Address& owner, const Address& operator_addr,
                                          bool approved) {
    if (owner == operator_addr) {
        return errors::INVALID_RECEIVER;
    }

    std::unique_lock lock(mutex_);
    if (approved) {
        operators_.insert({owner, operator_addr});
    } else {
        operators_.erase({owner, operator_addr});
    }
    return errors::OK;
}

bool AssetLedger::is_approved_for_all(const Address& owner, const Address& operator_addr) const {
    std::shared_lock lock(mutex_);
    return operators_.count({owner, operator_addr}) > 0;
}

// =============================================================================
// Transfers
// =============================================================================

int32_t AssetLedger::transfer_from(const Address& caller, const Address& from,
                                   const Address& to, AssetId asset_id) {
    {
        std::shared_lock lock(mutex_);
        auto it = tokens_.find(asset_id);
        if (it == tokens_.end()) return errors::ASSET_NOT_FOUND;
        if (!authorized(it->second, caller)) return errors::CALLER_NOT_OWNER_NOR_APPROVED;
    }
    return move(from, to, asset_id);
}

int32_t AssetLedger::transfer(const Address& from, const Address& to, AssetId asset_id) {
    return move(from, to, asset_id);
}

bool AssetLedger::set_transfer_hook(ITransferHook* hook) {
    std::unique_lock lock(mutex_);
    hook_ = hook;
    return true;
}

int32_t AssetLedger::move(const Address& from, const Address& to, AssetId asset_id) {
    if (addresses::is_zero(to)) {
        return errors::INVALID_RECEIVER;
    }

    ITransferHook* hook = nullptr;
    {
        std::shared_lock lock(mutex_);
        auto it = tokens_.find(asset_id);
        if (it == tokens_.end()) return errors::ASSET_NOT_FOUND;
        if (it->second.owner != from) return errors::OWNERSHIP_TRANSFER_FAILED;
        hook = hook_;
    }

    if (hook) {
        hook->before_transfer(from, to, asset_id);
    }

    std::unique_lock lock(mutex_);
    auto it = tokens_.find(asset_id);
    // The hook may not move the asset; re-check after it returns
    if (it == tokens_.end() || it->second.owner != from) {
        MART_LOG(warning) << "asset " << asset_id << " changed owner during transfer hook";
        return errors::OWNERSHIP_TRANSFER_FAILED;
    }
    it->second.owner = to;
    it->second.approved.reset();
    return errors::OK;
}

} // namespace mart
