#ifndef CLUM_TYPES_HPP
#define CLUM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <stdexcept>

namespace clum {

// =============================================================================
// Fixed-Point Types (WAD = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;   // 1e18
constexpr I128 X18_HALF = 500000000000000000LL;   // 0.5e18
constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

// USDC convention: 6 decimal places
constexpr I128 USDC_ONE = 1000000;
constexpr I128 X18_PER_USDC = 1000000000000LL;    // 1e12

// Largest price the grid may represent (1e12 units)
constexpr I128 MAX_PRICE_X18 = X18_ONE * 1000000000000LL;

// =============================================================================
// Caller Identity
// =============================================================================

using Address = std::array<uint8_t, 20>;

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Address with the low 8 bytes set from an integer (tests, CLI)
inline Address address_from_id(uint64_t id) {
    Address addr{};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

// =============================================================================
// Option Types
// =============================================================================

enum class OptionType : uint8_t {
    CALL = 0,
    PUT = 1
};

enum class TradeSide : uint8_t {
    BUY = 0,
    SELL = 1
};

inline bool is_valid_option_type(OptionType type) {
    return type == OptionType::CALL || type == OptionType::PUT;
}

// Payoff of one unit at settlement price `price`
inline I128 option_payoff(OptionType type, I128 price_x18, I128 strike_x18) {
    if (type == OptionType::CALL) {
        return price_x18 > strike_x18 ? price_x18 - strike_x18 : 0;
    }
    return strike_x18 > price_x18 ? strike_x18 - price_x18 : 0;
}

// =============================================================================
// Numeric Errors
// =============================================================================

// Raised by fixed-point routines when a value leaves the I128 range.
// Engine entry points convert it to errors::NUMERIC_OVERFLOW.
class NumericOverflow : public std::overflow_error {
public:
    explicit NumericOverflow(const std::string& what) : std::overflow_error(what) {}
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_GEOMETRY = -1;
constexpr int32_t INVALID_PRICE = -2;
constexpr int32_t INVALID_OPTION_TYPE = -3;
constexpr int32_t INVALID_SIZE = -4;
constexpr int32_t ZERO_PAYOFF = -5;
constexpr int32_t UNAUTHORIZED = -10;
constexpr int32_t NOT_INITIALIZED = -11;
constexpr int32_t ALREADY_INITIALIZED = -12;
constexpr int32_t GRID_OUT_OF_SYNC = -13;
constexpr int32_t NO_REBALANCE_NEEDED = -14;
constexpr int32_t VERIFY_DELTA = -20;
constexpr int32_t VERIFY_MONOTONICITY = -21;
constexpr int32_t VERIFY_BOUND = -22;
constexpr int32_t VERIFY_SIMPLEX = -23;
constexpr int32_t NUMERIC_OVERFLOW = -30;
constexpr int32_t SOLVENCY_VIOLATION = -31;
constexpr int32_t PRICE_UNAVAILABLE = -40;
constexpr int32_t INVALID_CONFIG = -50;
}

inline const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::INVALID_GEOMETRY: return "INVALID_GEOMETRY";
        case errors::INVALID_PRICE: return "INVALID_PRICE";
        case errors::INVALID_OPTION_TYPE: return "INVALID_OPTION_TYPE";
        case errors::INVALID_SIZE: return "INVALID_SIZE";
        case errors::ZERO_PAYOFF: return "ZERO_PAYOFF";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        case errors::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case errors::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
        case errors::GRID_OUT_OF_SYNC: return "GRID_OUT_OF_SYNC";
        case errors::NO_REBALANCE_NEEDED: return "NO_REBALANCE_NEEDED";
        case errors::VERIFY_DELTA: return "VERIFY_DELTA";
        case errors::VERIFY_MONOTONICITY: return "VERIFY_MONOTONICITY";
        case errors::VERIFY_BOUND: return "VERIFY_BOUND";
        case errors::VERIFY_SIMPLEX: return "VERIFY_SIMPLEX";
        case errors::NUMERIC_OVERFLOW: return "NUMERIC_OVERFLOW";
        case errors::SOLVENCY_VIOLATION: return "SOLVENCY_VIOLATION";
        case errors::PRICE_UNAVAILABLE: return "PRICE_UNAVAILABLE";
        case errors::INVALID_CONFIG: return "INVALID_CONFIG";
        default: return "UNKNOWN";
    }
}

} // namespace clum

#endif // CLUM_TYPES_HPP
