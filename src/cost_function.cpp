// =============================================================================
// cost_function.cpp - Cost evaluation, bounds, prices and priors
// =============================================================================

#include "clum/cost_function.hpp"
#include "clum/fixed_point.hpp"
#include <algorithm>
#include <stdexcept>

namespace clum {

namespace {

// (q_i - q_max) / b for every bucket, plus q_max. The shift is taken in
// quantity units so that only the non-positive exponent arguments are
// truncated; q_max enters the cost exactly.
struct ScaledQuantities {
    std::vector<I128> args;
    I128 max_quantity;
};

void check_model(const CostModel& model, const std::vector<I128>& quantities) {
    if (model.liquidity_x18 <= 0) {
        throw std::invalid_argument("CostModel: liquidity must be positive");
    }
    if (model.priors_x18.size() != quantities.size() || quantities.empty()) {
        throw std::invalid_argument("CostModel: prior/quantity size mismatch");
    }
}

ScaledQuantities scale(const CostModel& model, const std::vector<I128>& quantities) {
    ScaledQuantities out;
    out.max_quantity = *std::max_element(quantities.begin(), quantities.end());
    out.args.resize(quantities.size());
    for (size_t i = 0; i < quantities.size(); ++i) {
        out.args[i] = x18::div(x18::sub(quantities[i], out.max_quantity), model.liquidity_x18);
    }
    return out;
}

// exp(arg_i); arguments are never positive
std::vector<I128> shifted_exponentials(const ScaledQuantities& scaled) {
    std::vector<I128> e(scaled.args.size());
    for (size_t i = 0; i < e.size(); ++i) {
        I128 arg = scaled.args[i];
        e[i] = arg < x18::EXP_MIN_ARG ? 0 : x18::exp(arg);
    }
    return e;
}

} // namespace

int32_t validate_trade_input(OptionType type, I128 strike_x18, I128 size_x18) {
    if (!is_valid_option_type(type)) return errors::INVALID_OPTION_TYPE;
    if (strike_x18 <= 0 || strike_x18 > MAX_PRICE_X18) return errors::INVALID_PRICE;
    if (size_x18 <= 0) return errors::INVALID_SIZE;
    return errors::OK;
}

// =============================================================================
// Cost
// =============================================================================

I128 evaluate_cost(const CostModel& model, const std::vector<I128>& quantities) {
    check_model(model, quantities);
    ScaledQuantities scaled = scale(model, quantities);
    std::vector<I128> e = shifted_exponentials(scaled);

    I128 sum = 0;
    for (size_t i = 0; i < e.size(); ++i) {
        sum = x18::add(sum, x18::mul(model.priors_x18[i], e[i]));
    }
    if (sum <= 0) {
        throw NumericOverflow("evaluate_cost: partition sum underflow");
    }
    return x18::add(scaled.max_quantity, x18::mul(model.liquidity_x18, x18::ln(sum)));
}

CostBounds cost_bounds(const CostModel& model, const std::vector<I128>& quantities) {
    check_model(model, quantities);
    ScaledQuantities scaled = scale(model, quantities);
    std::vector<I128> e = shifted_exponentials(scaled);

    // One extra wei covers truncation of (q_i - q_max) / b
    const I128 slack = x18::EXP_MAX_ERROR + 1;

    I128 sum_lo = 0;
    I128 sum_hi = 0;
    for (size_t i = 0; i < e.size(); ++i) {
        I128 lo = e[i] > slack ? e[i] - slack : 0;
        sum_lo = x18::add(sum_lo, x18::mul(model.priors_x18[i], lo));
        sum_hi = x18::add(sum_hi, x18::mul_up(model.priors_x18[i], e[i] + slack));
    }
    // Flooring each term can only lose one wei per bucket
    sum_lo = sum_lo > static_cast<I128>(e.size()) ? sum_lo - static_cast<I128>(e.size()) : 1;

    I128 ln_lo = x18::sub(x18::ln(sum_lo), x18::LN_MAX_ERROR + 1);
    I128 ln_hi = x18::add(x18::ln(sum_hi), x18::LN_MAX_ERROR + 1);

    CostBounds bounds;
    bounds.lower_x18 = x18::add(scaled.max_quantity, x18::mul_floor(model.liquidity_x18, ln_lo)) - 1;
    bounds.upper_x18 = x18::add(scaled.max_quantity, x18::mul_ceil(model.liquidity_x18, ln_hi)) + 1;
    return bounds;
}

std::vector<I128> risk_neutral_prices(const CostModel& model,
                                      const std::vector<I128>& quantities) {
    check_model(model, quantities);
    ScaledQuantities scaled = scale(model, quantities);
    std::vector<I128> e = shifted_exponentials(scaled);

    std::vector<I128> weights(e.size());
    I128 sum = 0;
    for (size_t i = 0; i < e.size(); ++i) {
        weights[i] = x18::mul(model.priors_x18[i], e[i]);
        sum = x18::add(sum, weights[i]);
    }
    if (sum <= 0) {
        throw NumericOverflow("risk_neutral_prices: partition sum underflow");
    }

    std::vector<I128> prices(e.size());
    for (size_t i = 0; i < e.size(); ++i) {
        prices[i] = x18::div(weights[i], sum);
    }
    return prices;
}

// =============================================================================
// Trade Pricing
// =============================================================================

I128 trade_cost(const CostModel& model, const std::vector<I128>& quantities,
                const std::vector<I128>& next_quantities, TradeSide side) {
    CostBounds current = cost_bounds(model, quantities);
    CostBounds next = cost_bounds(model, next_quantities);
    if (side == TradeSide::BUY) {
        return std::max<I128>(x18::sub(next.upper_x18, current.lower_x18), 1);
    }
    return std::max<I128>(x18::sub(current.lower_x18, next.upper_x18), 0);
}

// =============================================================================
// Trade Deltas
// =============================================================================

std::vector<I128> trade_delta(const std::vector<I128>& midpoints,
                              OptionType type, I128 strike_x18, I128 size_x18) {
    std::vector<I128> delta(midpoints.size());
    for (size_t i = 0; i < midpoints.size(); ++i) {
        delta[i] = x18::mul(option_payoff(type, midpoints[i], strike_x18), size_x18);
    }
    return delta;
}

bool is_zero_delta(const std::vector<I128>& delta) {
    return std::all_of(delta.begin(), delta.end(), [](I128 d) { return d == 0; });
}

std::vector<I128> apply_delta(const std::vector<I128>& quantities,
                              const std::vector<I128>& delta, TradeSide side) {
    if (quantities.size() != delta.size()) {
        throw std::invalid_argument("apply_delta: size mismatch");
    }
    std::vector<I128> out(quantities.size());
    for (size_t i = 0; i < quantities.size(); ++i) {
        out[i] = side == TradeSide::BUY ? x18::add(quantities[i], delta[i])
                                        : x18::sub(quantities[i], delta[i]);
    }
    return out;
}

I128 worst_case_loss(const std::vector<I128>& quantities, I128 cost_x18,
                     I128 initial_cost_x18) {
    if (quantities.empty()) return 0;
    I128 max_q = *std::max_element(quantities.begin(), quantities.end());
    return x18::sub(max_q, x18::sub(cost_x18, initial_cost_x18));
}

// =============================================================================
// Priors
// =============================================================================

std::vector<I128> make_priors(size_t num_buckets, PriorShape shape,
                              I128 sigma_buckets_x18, I128 floor_x18) {
    if (num_buckets == 0) {
        throw std::invalid_argument("make_priors: no buckets");
    }
    if (floor_x18 < 0 || floor_x18 > X18_ONE) {
        throw std::invalid_argument("make_priors: floor out of range");
    }

    std::vector<I128> weights(num_buckets, X18_ONE);
    if (shape == PriorShape::GAUSSIAN) {
        if (sigma_buckets_x18 <= 0) {
            throw std::invalid_argument("make_priors: sigma must be positive");
        }
        // Center of bucket i is at i; grid center sits at (n-1)/2
        I128 center = static_cast<I128>(num_buckets - 1) * X18_ONE / 2;
        for (size_t i = 0; i < num_buckets; ++i) {
            I128 z = x18::div(x18::from_int(static_cast<int64_t>(i)) - center, sigma_buckets_x18);
            I128 arg = -x18::mul(z, z) / 2;
            weights[i] = arg < x18::EXP_MIN_ARG ? 0 : x18::exp(arg);
        }
    }

    I128 total = 0;
    for (I128& w : weights) {
        w = std::max(w, floor_x18);
        if (w == 0) w = 1;
        total += w;
    }

    std::vector<I128> priors(num_buckets);
    I128 assigned = 0;
    for (size_t i = 0; i < num_buckets; ++i) {
        priors[i] = x18::mul_div(weights[i], X18_ONE, total);
        assigned += priors[i];
    }
    // Truncation remainder goes to the middle bucket
    priors[num_buckets / 2] += X18_ONE - assigned;
    return priors;
}

} // namespace clum
