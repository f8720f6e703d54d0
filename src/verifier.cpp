// =============================================================================
// verifier.cpp - Acceptance checks for off-path cost proposals
// =============================================================================

#include "clum/verifier.hpp"
#include "clum/fixed_point.hpp"

namespace clum {

namespace {

VerifyResult reject(int32_t status, CostBounds bounds = CostBounds{0, 0}) {
    return VerifyResult{status, std::nullopt, bounds};
}

} // namespace

VerifyResult verify_cost_update(const VerificationContext& ctx,
                                const EngineState& old_state,
                                const CostProposal& proposal) {
    const size_t n = old_state.quantities.size();
    if (proposal.new_quantities.size() != n || ctx.midpoints.size() != n ||
        ctx.model.priors_x18.size() != n) {
        return reject(errors::VERIFY_DELTA);
    }
    if (proposal.trades.size() > ctx.max_batch_trades) {
        return reject(errors::VERIFY_DELTA);
    }

    try {
        // 1. Delta validity
        bool any_buy = false;
        bool any_sell = false;
        std::vector<I128> expected = old_state.quantities;
        for (const TradeIntent& trade : proposal.trades) {
            if (validate_trade_input(trade.option_type, trade.strike_x18, trade.size_x18) != errors::OK) {
                return reject(errors::VERIFY_DELTA);
            }
            std::vector<I128> delta = trade_delta(ctx.midpoints, trade.option_type,
                                                  trade.strike_x18, trade.size_x18);
            if (is_zero_delta(delta)) {
                return reject(errors::VERIFY_DELTA);
            }
            expected = apply_delta(expected, delta, trade.side);
            (trade.side == TradeSide::BUY ? any_buy : any_sell) = true;
        }
        if (expected != proposal.new_quantities) {
            return reject(errors::VERIFY_DELTA);
        }

        // 2. Monotonicity
        if (any_buy && !any_sell && proposal.proposed_cost_x18 <= old_state.cached_cost_x18) {
            return reject(errors::VERIFY_MONOTONICITY);
        }
        if (any_sell && !any_buy && proposal.proposed_cost_x18 >= old_state.cached_cost_x18) {
            return reject(errors::VERIFY_MONOTONICITY);
        }

        // 3. Deterministic bound
        CostBounds bounds = cost_bounds(ctx.model, proposal.new_quantities);
        bounds.lower_x18 = x18::sub(bounds.lower_x18, ctx.cost_tolerance_x18);
        bounds.upper_x18 = x18::add(bounds.upper_x18, ctx.cost_tolerance_x18);
        if (proposal.proposed_cost_x18 < bounds.lower_x18 ||
            proposal.proposed_cost_x18 > bounds.upper_x18) {
            return reject(errors::VERIFY_BOUND, bounds);
        }

        // 4. Probability simplex
        std::vector<I128> prices = risk_neutral_prices(ctx.model, proposal.new_quantities);
        I128 total = 0;
        for (I128 p : prices) {
            if (p < 0) return reject(errors::VERIFY_SIMPLEX, bounds);
            total = x18::add(total, p);
        }
        if (x18::abs(total - X18_ONE) > ctx.simplex_tolerance_x18) {
            return reject(errors::VERIFY_SIMPLEX, bounds);
        }

        EngineState next{proposal.new_quantities, proposal.proposed_cost_x18,
                         old_state.grid_epoch};
        return VerifyResult{errors::OK, std::move(next), bounds};
    } catch (const NumericOverflow&) {
        return reject(errors::NUMERIC_OVERFLOW);
    }
}

} // namespace clum
