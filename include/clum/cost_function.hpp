#ifndef CLUM_COST_FUNCTION_HPP
#define CLUM_COST_FUNCTION_HPP

#include <vector>

#include "types.hpp"

namespace clum {

// =============================================================================
// Cost Model
// =============================================================================
//
// C(q) = b * ln( sum_i pi_i * exp(q_i / b) )
//
// Evaluated as q_max + b * ln( sum_i pi_i * exp((q_i - q_max) / b) ), so
// every exponential has a non-positive argument. All functions are pure and deterministic;
// they throw NumericOverflow when an intermediate leaves the I128 range.
//

struct CostModel {
    I128 liquidity_x18;              // b
    std::vector<I128> priors_x18;    // pi, sums to exactly 1e18
};

// Deterministic interval guaranteed to contain the exact C(q)
struct CostBounds {
    I128 lower_x18;
    I128 upper_x18;
};

// One declared option trade
struct TradeIntent {
    OptionType option_type;
    TradeSide side;
    I128 strike_x18;
    I128 size_x18;
};

// Validates option type, strike and size of a trade
int32_t validate_trade_input(OptionType type, I128 strike_x18, I128 size_x18);

// Point estimate of C(q)
I128 evaluate_cost(const CostModel& model, const std::vector<I128>& quantities);

// Interval from the exp/ln error bounds; evaluate_cost() always lies inside
CostBounds cost_bounds(const CostModel& model, const std::vector<I128>& quantities);

// Amount a trade moving quantities to next_quantities settles at, rounded
// in the pool's favour through cost_bounds(): a buy pays at least the exact
// C(next) - C(q) and never less than 1 wei, a sell receives at most the
// exact C(q) - C(next) and never less than 0.
I128 trade_cost(const CostModel& model, const std::vector<I128>& quantities,
                const std::vector<I128>& next_quantities, TradeSide side);

// p_i = pi_i exp(q_i/b) / sum_j pi_j exp(q_j/b); each truncated, so the sum
// is within num_buckets wei below 1e18
std::vector<I128> risk_neutral_prices(const CostModel& model,
                                      const std::vector<I128>& quantities);

// Per-bucket quantity change for one unit side: payoff(midpoint_i) * size
std::vector<I128> trade_delta(const std::vector<I128>& midpoints,
                              OptionType type, I128 strike_x18, I128 size_x18);

bool is_zero_delta(const std::vector<I128>& delta);

// q +/- delta, checked
std::vector<I128> apply_delta(const std::vector<I128>& quantities,
                              const std::vector<I128>& delta, TradeSide side);

// max_i q_i - (C(q) - C(0)): the pool's loss if the worst bucket settles
I128 worst_case_loss(const std::vector<I128>& quantities, I128 cost_x18,
                     I128 initial_cost_x18);

// =============================================================================
// Priors
// =============================================================================

enum class PriorShape : uint8_t {
    UNIFORM = 0,
    GAUSSIAN = 1     // Discretized normal centered on the middle bucket
};

// Weights over num_buckets (tails included), each at least floor_x18 before
// normalization, summing to exactly 1e18. sigma_buckets_x18 is the standard
// deviation in bucket widths.
std::vector<I128> make_priors(size_t num_buckets, PriorShape shape,
                              I128 sigma_buckets_x18, I128 floor_x18);

} // namespace clum

#endif // CLUM_COST_FUNCTION_HPP
