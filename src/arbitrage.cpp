// =============================================================================
// arbitrage.cpp - Convexity, monotonicity and parity bounds
// =============================================================================

#include "clum/arbitrage.hpp"
#include "clum/fixed_point.hpp"
#include <algorithm>
#include <stdexcept>

namespace clum {

namespace {

I128 mark_of(const ImpliedDistribution& dist, OptionType type, I128 strike_x18) {
    I128 mark = 0;
    for (size_t i = 0; i < dist.midpoints.size(); ++i) {
        I128 payoff = option_payoff(type, dist.midpoints[i], strike_x18);
        if (payoff == 0) continue;
        mark = x18::add(mark, x18::mul(dist.probabilities[i], payoff));
    }
    return mark;
}

// lambda*c1 + (1-lambda)*c3, lambda = (k3-k2)/(k3-k1)
I128 interpolate(I128 k1, I128 c1, I128 k2, I128 k3, I128 c3) {
    I128 lambda = x18::div(k3 - k2, k3 - k1);
    return x18::add(x18::mul(lambda, c1), x18::mul(X18_ONE - lambda, c3));
}

} // namespace

ArbitrageGuard::ArbitrageGuard(const ClumEngine& engine, I128 tolerance_x18)
    : engine_(engine), tolerance_x18_(tolerance_x18) {
    if (tolerance_x18 < 0) {
        throw std::invalid_argument("ArbitrageGuard: negative tolerance");
    }
}

bool ArbitrageGuard::check_convexity(I128 k1, I128 c1, I128 k2, I128 c2, I128 k3, I128 c3) const {
    if (!(k1 < k2 && k2 < k3)) return false;
    try {
        return c2 <= x18::add(interpolate(k1, c1, k2, k3, c3), tolerance_x18_);
    } catch (const NumericOverflow&) {
        return false;
    }
}

bool ArbitrageGuard::check_monotonic(OptionType type, I128 k1, I128 p1, I128 k2, I128 p2) const {
    if (k1 >= k2) return false;
    if (type == OptionType::CALL) {
        return p2 <= p1 + tolerance_x18_;
    }
    return p2 + tolerance_x18_ >= p1;
}

bool ArbitrageGuard::validate_trade(OptionType type, I128 strike_x18, I128 size_x18,
                                    bool is_buy) const {
    TradeIntent trade{type, is_buy ? TradeSide::BUY : TradeSide::SELL, strike_x18, size_x18};
    auto dist = engine_.preview_distribution(trade);
    if (!dist || dist->midpoints.size() < 3) return false;

    // Step size: the regular bucket width
    I128 width = dist->midpoints[2] - dist->midpoints[1];
    I128 k1 = strike_x18 - width;
    I128 k3 = strike_x18 + width;
    if (k1 <= 0) return true;

    try {
        I128 m1 = mark_of(*dist, type, k1);
        I128 m2 = mark_of(*dist, type, strike_x18);
        I128 m3 = mark_of(*dist, type, k3);
        return check_convexity(k1, m1, strike_x18, m2, k3, m3) &&
               check_monotonic(type, k1, m1, strike_x18, m2) &&
               check_monotonic(type, strike_x18, m2, k3, m3);
    } catch (const NumericOverflow&) {
        return false;
    }
}

ArbitrageBounds ArbitrageGuard::compute_arbitrage_bounds(const std::vector<I128>& strikes,
                                                         const std::vector<I128>& call_prices,
                                                         const std::vector<I128>& put_prices,
                                                         I128 spot_x18) const {
    if (strikes.size() != call_prices.size() || strikes.size() != put_prices.size()) {
        throw std::invalid_argument("compute_arbitrage_bounds: length mismatch");
    }
    for (size_t i = 1; i < strikes.size(); ++i) {
        if (strikes[i] <= strikes[i - 1]) {
            throw std::invalid_argument("compute_arbitrage_bounds: strikes not ascending");
        }
    }

    ArbitrageBounds bounds;
    bounds.call_ask_x18 = call_prices;
    bounds.put_bid_x18 = put_prices;

    for (size_t i = 1; i + 1 < strikes.size(); ++i) {
        I128 cap = interpolate(strikes[i - 1], call_prices[i - 1], strikes[i],
                               strikes[i + 1], call_prices[i + 1]);
        bounds.call_ask_x18[i] = std::min(bounds.call_ask_x18[i], cap);
    }

    for (size_t i = 0; i < strikes.size(); ++i) {
        I128 parity = call_prices[i] - spot_x18 + strikes[i];
        if (parity > bounds.put_bid_x18[i]) {
            bounds.put_bid_x18[i] = parity;
        }
    }
    return bounds;
}

} // namespace clum
