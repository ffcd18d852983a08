#ifndef MART_TYPES_HPP
#define MART_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <optional>
#include <functional>

// Hash specialization for Address (must be before mart namespace)
namespace std {
template<>
struct hash<std::array<uint8_t, 20>> {
    size_t operator()(const std::array<uint8_t, 20>& arr) const noexcept {
        size_t h = 0;
        for (auto b : arr) {
            h = h * 31 + b;
        }
        return h;
    }
};
} // namespace std

namespace mart {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Default marketplace address (spender of token allowances)
constexpr Address MARKETPLACE = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x61,0x05};

// Helper to create a short address from a number (tests, scenarios)
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without 0x prefix; shorter inputs are left-padded
std::optional<Address> from_hex(const std::string& hex);

} // namespace addresses

// =============================================================================
// Amounts & Identifiers
// =============================================================================

using U128 = unsigned __int128;
using Amount = U128;        // Smallest denomination of the currency
using AssetId = uint64_t;
using Timestamp = uint64_t; // Seconds since epoch

namespace amounts {

std::string to_string(Amount value);

// Decimal digits only; nullopt on empty, garbage or overflow
std::optional<Amount> from_string(const std::string& str);

} // namespace amounts

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const { return addresses::is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// Native chain currency (address(0))
inline const Currency NATIVE{};

// =============================================================================
// Clock
// =============================================================================

using Clock = std::function<Timestamp()>;

// Wall clock in seconds
Timestamp system_now();

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Listing
constexpr int32_t SALE_PRICE_CANNOT_BE_ZERO = -1;
constexpr int32_t INVALID_EXPIRES_TIMESTAMP = -2;
constexpr int32_t CALLER_NOT_OWNER_NOR_APPROVED = -3;
constexpr int32_t INVALID_LISTING = -4;

// Purchase
constexpr int32_t INCONSISTENT_SALE_PRICE = -10;
constexpr int32_t INCONSISTENT_TOKENS = -11;
constexpr int32_t INCORRECT_VALUE_SENT = -12;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -13;
constexpr int32_t PAYMENT_TRANSFER_FAILED = -14;
constexpr int32_t OWNERSHIP_TRANSFER_FAILED = -15;
constexpr int32_t UNSUPPORTED_CURRENCY = -16;

// Guard
constexpr int32_t REENTRANCY = -30;

// Collaborators
constexpr int32_t ASSET_NOT_FOUND = -40;
constexpr int32_t ASSET_ALREADY_EXISTS = -41;
constexpr int32_t INVALID_RECEIVER = -42;
constexpr int32_t INVALID_ROYALTY = -43;

// Stable name for a status code ("OK", "INVALID_LISTING", ...)
const char* name(int32_t code);

} // namespace errors

} // namespace mart

#endif // MART_TYPES_HPP
