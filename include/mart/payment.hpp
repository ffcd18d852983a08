#ifndef MART_PAYMENT_HPP
#define MART_PAYMENT_HPP

#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "types.hpp"

namespace mart {

// =============================================================================
// Currency Rail Interface
// =============================================================================

// One value-transfer mechanism (the native currency, or one fungible token).
class ICurrencyRail {
public:
    virtual ~ICurrencyRail() = default;

    // Amount `spender` may move out of `owner`
    virtual Amount allowance(const Address& owner, const Address& spender) const = 0;

    // Move `amount` from `from` to `to` on behalf of `spender`.
    // Returns false when the transfer is refused; nothing moves in that case.
    virtual bool transfer(const Address& spender, const Address& from,
                          const Address& to, Amount amount) = 0;

    // Undo a transfer that previously returned true
    virtual void revert_transfer(const Address& spender, const Address& from,
                                 const Address& to, Amount amount) = 0;
};

// =============================================================================
// Payment Receipt
// =============================================================================

struct PaymentReceipt {
    int32_t status;
    Currency currency;
    Address payer;
    Address recipient;
    Amount amount;
    ICurrencyRail* rail;  // nullptr for zero-amount legs

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// PaymentProcessor
// =============================================================================

class PaymentProcessor {
public:
    // `spender` is the address rails see as the mover of funds
    // (the marketplace, for token allowances)
    PaymentProcessor(ICurrencyRail& native, const Address& spender);
    ~PaymentProcessor() = default;

    // Non-copyable
    PaymentProcessor(const PaymentProcessor&) = delete;
    PaymentProcessor& operator=(const PaymentProcessor&) = delete;

    // =========================================================================
    // Rail Registration
    // =========================================================================

    void register_token(const Currency& token, ICurrencyRail* rail);
    void unregister_token(const Currency& token);
    bool supports(const Currency& currency) const;

    // =========================================================================
    // Payments
    // =========================================================================

    // Amount the payer has authorized this processor's spender to move
    Amount allowance(const Currency& currency, const Address& payer) const;

    // amount == 0 succeeds without touching any rail
    PaymentReceipt pay(Amount amount, const Address& payer, const Address& recipient,
                       const Currency& currency);

    // Undo a successful leg
    void revert(const PaymentReceipt& receipt);

    const Address& spender() const { return spender_; }

private:
    ICurrencyRail& native_;
    Address spender_;

    std::unordered_map<Address, ICurrencyRail*> tokens_;  // token address -> rail
    mutable std::shared_mutex tokens_mutex_;

    ICurrencyRail* resolve(const Currency& currency) const;
};

// =============================================================================
// PaymentBatch - Scoped All-or-nothing Payment Legs
// =============================================================================

// Legs paid through a batch are reverted (newest first) when the batch goes
// out of scope without commit(). A revert that throws is logged and the
// remaining legs are still reverted.
class PaymentBatch {
public:
    explicit PaymentBatch(PaymentProcessor& processor);
    ~PaymentBatch() noexcept;

    PaymentBatch(const PaymentBatch&) = delete;
    PaymentBatch& operator=(const PaymentBatch&) = delete;

    int32_t pay(Amount amount, const Address& payer, const Address& recipient,
                const Currency& currency);

    void commit() { committed_ = true; }
    void rollback();

    const std::vector<PaymentReceipt>& receipts() const { return receipts_; }

private:
    PaymentProcessor& processor_;
    std::vector<PaymentReceipt> receipts_;
    bool committed_{false};
};

} // namespace mart

#endif // MART_PAYMENT_HPP
