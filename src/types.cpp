// =============================================================================
// types.cpp - Address, Amount and Error Code Helpers
// =============================================================================

#include "mart/types.hpp"
#include <chrono>
#include <algorithm>

namespace mart {

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (auto b : addr) {
        out.push_back(digits[(b >> 4) & 0x0F]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<Address> from_hex(const std::string& hex) {
    std::string body = hex;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        body = body.substr(2);
    }
    if (body.empty() || body.size() > 40) return std::nullopt;

    // Left-pad to 40 digits
    body.insert(body.begin(), 40 - body.size(), '0');

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(body[2 * i]);
        int lo = hex_value(body[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Amounts
// =============================================================================

namespace amounts {

std::string to_string(Amount value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<Amount> from_string(const std::string& str) {
    if (str.empty()) return std::nullopt;

    constexpr Amount max_value = ~static_cast<Amount>(0);
    Amount value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') return std::nullopt;
        Amount digit = static_cast<Amount>(c - '0');
        if (value > (max_value - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

} // namespace amounts

// =============================================================================
// Clock
// =============================================================================

Timestamp system_now() {
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK:                            return "OK";
        case SALE_PRICE_CANNOT_BE_ZERO:     return "SALE_PRICE_CANNOT_BE_ZERO";
        case INVALID_EXPIRES_TIMESTAMP:     return "INVALID_EXPIRES_TIMESTAMP";
        case CALLER_NOT_OWNER_NOR_APPROVED: return "CALLER_NOT_OWNER_NOR_APPROVED";
        case INVALID_LISTING:               return "INVALID_LISTING";
        case INCONSISTENT_SALE_PRICE:       return "INCONSISTENT_SALE_PRICE";
        case INCONSISTENT_TOKENS:           return "INCONSISTENT_TOKENS";
        case INCORRECT_VALUE_SENT:          return "INCORRECT_VALUE_SENT";
        case INSUFFICIENT_ALLOWANCE:        return "INSUFFICIENT_ALLOWANCE";
        case PAYMENT_TRANSFER_FAILED:       return "PAYMENT_TRANSFER_FAILED";
        case OWNERSHIP_TRANSFER_FAILED:     return "OWNERSHIP_TRANSFER_FAILED";
        case UNSUPPORTED_CURRENCY:          return "UNSUPPORTED_CURRENCY";
        case REENTRANCY:                    return "REENTRANCY";
        case ASSET_NOT_FOUND:               return "ASSET_NOT_FOUND";
        case ASSET_ALREADY_EXISTS:          return "ASSET_ALREADY_EXISTS";
        case INVALID_RECEIVER:              return "INVALID_RECEIVER";
        case INVALID_ROYALTY:               return "INVALID_ROYALTY";
        default:                            return "UNKNOWN";
    }
}

} // namespace errors

} // namespace mart
