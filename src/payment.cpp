// =============================================================================
// payment.cpp - PaymentProcessor & PaymentBatch Implementation
// =============================================================================

#include "mart/payment.hpp"
#include "mart/log.hpp"

#include <exception>

namespace mart {

// =============================================================================
// PaymentProcessor
// =============================================================================

PaymentProcessor::PaymentProcessor(ICurrencyRail& native, const Address& spender)
    : native_(native)
    , spender_(spender) {}

void PaymentProcessor::register_token(const Currency& token, ICurrencyRail* rail) {
    if (token.is_native() || rail == nullptr) return;
    std::unique_lock lock(tokens_mutex_);
    tokens_[token.addr] = rail;
}

void PaymentProcessor::unregister_token(const Currency& token) {
    std::unique_lock lock(tokens_mutex_);
    tokens_.erase(token.addr);
}

bool PaymentProcessor::supports(const Currency& currency) const {
    return resolve(currency) != nullptr;
}

ICurrencyRail* PaymentProcessor::resolve(const Currency& currency) const {
    if (currency.is_native()) return &native_;

    std::shared_lock lock(tokens_mutex_);
    auto it = tokens_.find(currency.addr);
    return it != tokens_.end() ? it->second : nullptr;
}

Amount PaymentProcessor::allowance(const Currency& currency, const Address& payer) const {
    ICurrencyRail* rail = resolve(currency);
    if (!rail) return 0;
    return rail->allowance(payer, spender_);
}

PaymentReceipt PaymentProcessor::pay(Amount amount, const Address& payer,
                                     const Address& recipient, const Currency& currency) {
    PaymentReceipt receipt{errors::OK, currency, payer, recipient, amount, nullptr};
    if (amount == 0) return receipt;

    ICurrencyRail* rail = resolve(currency);
    if (!rail) {
        receipt.status = errors::UNSUPPORTED_CURRENCY;
        return receipt;
    }

    bool delivered = false;
    try {
        delivered = rail->transfer(spender_, payer, recipient, amount);
    } catch (const std::exception& e) {
        MART_LOG(warning) << "payment to " << addresses::to_hex(recipient)
                          << " raised: " << e.what();
        delivered = false;
    }

    if (!delivered) {
        MART_LOG(debug) << "payment of " << amounts::to_string(amount)
                        << " to " << addresses::to_hex(recipient) << " refused";
        receipt.status = errors::PAYMENT_TRANSFER_FAILED;
        return receipt;
    }

    receipt.rail = rail;
    return receipt;
}

void PaymentProcessor::revert(const PaymentReceipt& receipt) {
    if (!receipt.ok() || receipt.rail == nullptr || receipt.amount == 0) return;
    receipt.rail->revert_transfer(spender_, receipt.payer, receipt.recipient, receipt.amount);
}

// =============================================================================
// PaymentBatch
// =============================================================================

PaymentBatch::PaymentBatch(PaymentProcessor& processor) : processor_(processor) {}

PaymentBatch::~PaymentBatch() noexcept {
    if (!committed_) {
        rollback();
    }
}

int32_t PaymentBatch::pay(Amount amount, const Address& payer, const Address& recipient,
                          const Currency& currency) {
    PaymentReceipt receipt = processor_.pay(amount, payer, recipient, currency);
    if (receipt.ok()) {
        receipts_.push_back(receipt);
    }
    return receipt.status;
}

void PaymentBatch::rollback() {
    for (auto it = receipts_.rbegin(); it != receipts_.rend(); ++it) {
        try {
            processor_.revert(*it);
        } catch (const std::exception& e) {
            MART_LOG(error) << "failed to revert payment of " << amounts::to_string(it->amount)
                            << " to " << addresses::to_hex(it->recipient) << ": " << e.what();
        } catch (...) {
            MART_LOG(error) << "failed to revert payment of " << amounts::to_string(it->amount)
                            << " to " << addresses::to_hex(it->recipient) << ": unknown exception";
        }
    }
    if (!receipts_.empty()) {
        MART_LOG(warning) << "reverted " << receipts_.size() << " payment leg(s)";
    }
    receipts_.clear();
}

} // namespace mart
