#ifndef CLUM_ARBITRAGE_HPP
#define CLUM_ARBITRAGE_HPP

#include <vector>

#include "types.hpp"
#include "engine.hpp"

namespace clum {

// Adjusted quotes per strike
struct ArbitrageBounds {
    std::vector<I128> call_ask_x18;
    std::vector<I128> put_bid_x18;
};

// =============================================================================
// ArbitrageGuard - static no-arbitrage checks on option prices
// =============================================================================

class ArbitrageGuard {
public:
    explicit ArbitrageGuard(const ClumEngine& engine,
                            I128 tolerance_x18 = X18_ONE / 1000000);

    // Butterfly: for k1 < k2 < k3, c2 <= lambda*c1 + (1-lambda)*c3 + tol
    // with lambda = (k3 - k2) / (k3 - k1). False for unordered strikes.
    bool check_convexity(I128 k1, I128 c1, I128 k2, I128 c2, I128 k3, I128 c3) const;

    // For k1 < k2: calls non-increasing, puts non-decreasing (within tol)
    bool check_monotonic(OptionType type, I128 k1, I128 p1, I128 k2, I128 p2) const;

    // Marks at strike - w, strike, strike + w after the trade stay
    // convex and monotonic
    bool validate_trade(OptionType type, I128 strike_x18, I128 size_x18, bool is_buy) const;

    // Caps call asks at the convex interpolation of their neighbours and
    // raises put bids to the parity value C - S + K. Inputs must have equal
    // length with strikes ascending.
    ArbitrageBounds compute_arbitrage_bounds(const std::vector<I128>& strikes,
                                             const std::vector<I128>& call_prices,
                                             const std::vector<I128>& put_prices,
                                             I128 spot_x18) const;

    I128 tolerance() const { return tolerance_x18_; }

private:
    const ClumEngine& engine_;
    I128 tolerance_x18_;
};

} // namespace clum

#endif // CLUM_ARBITRAGE_HPP
