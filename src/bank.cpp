// =============================================================================
// bank.cpp - NativeBank & TokenLedger Implementation
// =============================================================================

#include "mart/bank.hpp"

#include <stdexcept>

namespace mart {

namespace {

inline Amount lookup(const std::map<Address, Amount>& balances, const Address& account) {
    auto it = balances.find(account);
    return it != balances.end() ? it->second : 0;
}

} // namespace

// =============================================================================
// NativeBank
// =============================================================================

void NativeBank::credit(const Address& account, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[account] += amount;
}

Amount NativeBank::balance_of(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(balances_, account);
}

Amount NativeBank::total_supply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [account, balance] : balances_) total += balance;
    return total;
}

void NativeBank::set_receiver(const Address& account, IPaymentReceiver* receiver) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (receiver) {
        receivers_[account] = receiver;
    } else {
        receivers_.erase(account);
    }
}

IPaymentReceiver* NativeBank::receiver_for(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = receivers_.find(account);
    return it != receivers_.end() ? it->second : nullptr;
}

Amount NativeBank::allowance(const Address& owner, const Address& /*spender*/) const {
    return balance_of(owner);
}

bool NativeBank::transfer(const Address& /*spender*/, const Address& from,
                          const Address& to, Amount amount) {
    if (balance_of(from) < amount) return false;

    // Receiver code runs before the credit, without the lock held
    if (IPaymentReceiver* receiver = receiver_for(to)) {
        if (!receiver->on_receive(NATIVE, from, amount)) return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& from_balance = balances_[from];
    if (from_balance < amount) return false;
    from_balance -= amount;
    balances_[to] += amount;
    return true;
}

void NativeBank::revert_transfer(const Address& /*spender*/, const Address& from,
                                 const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& to_balance = balances_[to];
    if (to_balance < amount) {
        throw std::runtime_error("NativeBank: recipient " + addresses::to_hex(to) +
                                 " cannot return " + amounts::to_string(amount));
    }
    to_balance -= amount;
    balances_[from] += amount;
}

// =============================================================================
// TokenLedger
// =============================================================================

TokenLedger::TokenLedger(const Address& token_address) : address_(token_address) {}

void TokenLedger::mint(const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[to] += amount;
}

Amount TokenLedger::balance_of(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(balances_, account);
}

Amount TokenLedger::total_supply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [account, balance] : balances_) total += balance;
    return total;
}

void TokenLedger::approve(const Address& owner, const Address& spender, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    allowances_[{owner, spender}] = amount;
}

Amount TokenLedger::allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it != allowances_.end() ? it->second : 0;
}

void TokenLedger::set_receiver(const Address& account, IPaymentReceiver* receiver) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (receiver) {
        receivers_[account] = receiver;
    } else {
        receivers_.erase(account);
    }
}

IPaymentReceiver* TokenLedger::receiver_for(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = receivers_.find(account);
    return it != receivers_.end() ? it->second : nullptr;
}

bool TokenLedger::transfer_from(const Address& spender, const Address& from,
                                const Address& to, Amount amount) {
    if (addresses::is_zero(to)) return false;

    auto can_move = [&]() {
        if (lookup(balances_, from) < amount) return false;
        if (spender == from) return true;
        auto it = allowances_.find({from, spender});
        return it != allowances_.end() && it->second >= amount;
    };

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!can_move()) return false;
    }

    if (IPaymentReceiver* receiver = receiver_for(to)) {
        if (!receiver->on_receive(currency(), from, amount)) return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Receiver code may have moved funds; check again
    if (!can_move()) return false;
    if (spender != from) {
        allowances_[{from, spender}] -= amount;
    }
    balances_[from] -= amount;
    balances_[to] += amount;
    return true;
}

bool TokenLedger::transfer(const Address& spender, const Address& from,
                           const Address& to, Amount amount) {
    return transfer_from(spender, from, to, amount);
}

void TokenLedger::revert_transfer(const Address& spender, const Address& from,
                                  const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& to_balance = balances_[to];
    if (to_balance < amount) {
        throw std::runtime_error("TokenLedger: recipient " + addresses::to_hex(to) +
                                 " cannot return " + amounts::to_string(amount));
    }
    to_balance -= amount;
    balances_[from] += amount;
    if (spender != from) {
        allowances_[{from, spender}] += amount;
    }
}

} // namespace mart
