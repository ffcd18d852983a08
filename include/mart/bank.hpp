#ifndef MART_BANK_HPP
#define MART_BANK_HPP

#include <map>
#include <mutex>
#include <unordered_map>

#include "payment.hpp"

namespace mart {

// =============================================================================
// Payment Receiver Interface
// =============================================================================

// Code attached to an address. Runs before the address is credited; returning
// false refuses the payment. May call back into the marketplace.
class IPaymentReceiver {
public:
    virtual ~IPaymentReceiver() = default;

    virtual bool on_receive(const Currency& currency, const Address& from, Amount amount) = 0;
};

// =============================================================================
// NativeBank - In-memory Native Currency Rail
// =============================================================================

class NativeBank : public ICurrencyRail {
public:
    NativeBank() = default;
    ~NativeBank() override = default;

    // Non-copyable
    NativeBank(const NativeBank&) = delete;
    NativeBank& operator=(const NativeBank&) = delete;

    void credit(const Address& account, Amount amount);
    Amount balance_of(const Address& account) const;
    Amount total_supply() const;

    void set_receiver(const Address& account, IPaymentReceiver* receiver);

    // =========================================================================
    // ICurrencyRail
    // =========================================================================

    // Spendable balance; the native currency has no allowances
    Amount allowance(const Address& owner, const Address& spender) const override;

    bool transfer(const Address& spender, const Address& from,
                  const Address& to, Amount amount) override;

    // Throws std::runtime_error when the recipient no longer holds the amount
    void revert_transfer(const Address& spender, const Address& from,
                         const Address& to, Amount amount) override;

private:
    std::map<Address, Amount> balances_;
    std::unordered_map<Address, IPaymentReceiver*> receivers_;
    mutable std::mutex mutex_;

    IPaymentReceiver* receiver_for(const Address& account) const;
};

// =============================================================================
// TokenLedger - In-memory Fungible Token Rail
// =============================================================================

class TokenLedger : public ICurrencyRail {
public:
    explicit TokenLedger(const Address& token_address);
    ~TokenLedger() override = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    Currency currency() const { return Currency{address_}; }
    const Address& address() const { return address_; }

    void mint(const Address& to, Amount amount);
    Amount balance_of(const Address& account) const;
    Amount total_supply() const;

    void approve(const Address& owner, const Address& spender, Amount amount);
    void set_receiver(const Address& account, IPaymentReceiver* receiver);

    // Returns false on insufficient balance/allowance or a refused receiver
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, Amount amount);

    // =========================================================================
    // ICurrencyRail
    // =========================================================================

    Amount allowance(const Address& owner, const Address& spender) const override;

    bool transfer(const Address& spender, const Address& from,
                  const Address& to, Amount amount) override;

    // Restores balances and the consumed allowance.
    // Throws std::runtime_error when the recipient no longer holds the amount.
    void revert_transfer(const Address& spender, const Address& from,
                         const Address& to, Amount amount) override;

private:
    Address address_;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;  // (owner, spender)
    std::unordered_map<Address, IPaymentReceiver*> receivers_;
    mutable std::mutex mutex_;

    IPaymentReceiver* receiver_for(const Address& account) const;
};

} // namespace mart

#endif // MART_BANK_HPP
