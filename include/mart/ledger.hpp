#ifndef MART_LEDGER_HPP
#define MART_LEDGER_HPP

#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <set>

#include "types.hpp"

namespace mart {

// =============================================================================
// Transfer Hook Interface
// =============================================================================

// Called by the ledger immediately before it changes the recorded owner of an
// asset. `to` is the zero address for burns.
class ITransferHook {
public:
    virtual ~ITransferHook() = default;

    virtual void before_transfer(const Address& from, const Address& to, AssetId asset_id) = 0;
};

// =============================================================================
// Ownership Ledger Interface
// =============================================================================

class IOwnershipLedger {
public:
    virtual ~IOwnershipLedger() = default;

    virtual std::optional<Address> owner_of(AssetId asset_id) const = 0;

    // Owner, approved address for the asset, or operator for the owner
    virtual bool is_approved_or_owner(const Address& spender, AssetId asset_id) const = 0;

    // Privileged transfer used by the marketplace after payment.
    // Must run the registered hook before the owner changes.
    virtual int32_t transfer(const Address& from, const Address& to, AssetId asset_id) = 0;

    // Registers the pre-transfer hook (nullptr to clear). Returns false when
    // the ledger cannot call hooks, in which case the marketplace invalidates
    // listings itself after its own transfers.
    virtual bool set_transfer_hook(ITransferHook* hook) = 0;
};

// =============================================================================
// AssetLedger - In-memory Non-fungible Ownership Ledger
// =============================================================================

class AssetLedger : public IOwnershipLedger {
public:
    AssetLedger() = default;
    ~AssetLedger() override = default;

    // Non-copyable
    AssetLedger(const AssetLedger&) = delete;
    AssetLedger& operator=(const AssetLedger&) = delete;

    // =========================================================================
    // Supply
    // =========================================================================

    int32_t mint(const Address& to, AssetId asset_id);
    int32_t burn(const Address& caller, AssetId asset_id);
    bool exists(AssetId asset_id) const;

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Address> owner_of(AssetId asset_id) const override;
    uint64_t balance_of(const Address& owner) const;
    bool is_approved_or_owner(const Address& spender, AssetId asset_id) const override;

    // =========================================================================
    // Approvals
    // =========================================================================

    // Caller must be the owner or an operator of the owner
    int32_t approve(const Address& caller, const Address& to, AssetId asset_id);
    std::optional<Address> get_approved(AssetId asset_id) const;

    int32_t set_approval_for_all(const Address& owner, const Address& operator_addr, bool approved);
    bool is_approved_for_all(const Address& owner, const Address& operator_addr) const;

    // =========================================================================
    // Transfers
    // =========================================================================

    // User path: caller must be owner, approved, or operator
    int32_t transfer_from(const Address& caller, const Address& from,
                          const Address& to, AssetId asset_id);

    // Privileged path
    int32_t transfer(const Address& from, const Address& to, AssetId asset_id) override;

    bool set_transfer_hook(ITransferHook* hook) override;

private:
    struct Token {
        Address owner;
        std::optional<Address> approved;
    };

    std::unordered_map<AssetId, Token> tokens_;
    std::set<std::pair<Address, Address>> operators_;  // (owner, operator)
    mutable std::shared_mutex mutex_;

    ITransferHook* hook_{nullptr};

    bool authorized(const Token& token, const Address& spender) const;

    // Every owner change goes through here (hook runs without the lock held)
    int32_t move(const Address& from, const Address& to, AssetId asset_id);
};

} // namespace mart

#endif // MART_LEDGER_HPP
