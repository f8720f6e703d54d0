// =============================================================================
// solver.cpp - Extended-precision cost evaluation for proposals
// =============================================================================

#include "clum/solver.hpp"
#include "clum/cost_function.hpp"
#include "clum/fixed_point.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace clum {

namespace {

constexpr long double WAD = 1e18L;

long double to_ld(I128 v) {
    return static_cast<long double>(v) / WAD;
}

I128 from_ld(long double v) {
    if (!std::isfinite(v) || std::fabs(v) > 1e20L) {
        throw NumericOverflow("CostSolver: value out of range");
    }
    long double whole = std::trunc(v);
    long double frac = v - whole;
    return static_cast<I128>(whole) * X18_ONE + static_cast<I128>(std::llround(frac * WAD));
}

} // namespace

CostSolver::CostSolver(VerificationContext context)
    : context_(std::move(context)) {}

I128 CostSolver::evaluate(const std::vector<I128>& quantities) const {
    const auto& priors = context_.model.priors_x18;
    if (quantities.size() != priors.size() || quantities.empty()) {
        throw std::invalid_argument("CostSolver: quantity size mismatch");
    }
    long double b = to_ld(context_.model.liquidity_x18);

    // Shift by q_max in quantity units; q_max is added back exactly
    I128 q_max = *std::max_element(quantities.begin(), quantities.end());
    long double sum = 0.0L;
    for (size_t i = 0; i < quantities.size(); ++i) {
        sum += to_ld(priors[i]) * std::exp(to_ld(x18::sub(quantities[i], q_max)) / b);
    }
    return x18::add(q_max, from_ld(b * std::log(sum)));
}

CostProposal CostSolver::propose(const EngineState& state,
                                 const std::vector<TradeIntent>& trades) const {
    CostProposal proposal;
    proposal.trades = trades;
    proposal.new_quantities = state.quantities;
    for (const TradeIntent& trade : trades) {
        std::vector<I128> delta = trade_delta(context_.midpoints, trade.option_type,
                                              trade.strike_x18, trade.size_x18);
        proposal.new_quantities = apply_delta(proposal.new_quantities, delta, trade.side);
    }
    proposal.proposed_cost_x18 = evaluate(proposal.new_quantities);
    return proposal;
}

CostProposal CostSolver::refresh(const EngineState& state) const {
    return propose(state, {});
}

I128 CostSolver::solve_log_utility_cost(const std::vector<I128>& priors_x18,
                                        const std::vector<I128>& quantities,
                                        I128 utility_level_x18) {
    if (priors_x18.size() != quantities.size() || quantities.empty()) {
        throw std::invalid_argument("solve_log_utility_cost: size mismatch");
    }
    const long double target = to_ld(utility_level_x18);

    long double max_q = to_ld(*std::max_element(quantities.begin(), quantities.end()));
    auto utility = [&](long double c) {
        long double u = 0.0L;
        for (size_t i = 0; i < quantities.size(); ++i) {
            u += to_ld(priors_x18[i]) * std::log(c - to_ld(quantities[i]));
        }
        return u;
    };

    // Utility is increasing in C; bracket the root above max_q
    long double lo = max_q + 1e-12L;
    long double hi = max_q + std::max(1.0L, std::exp(target));
    while (utility(hi) < target) {
        hi = max_q + (hi - max_q) * 2.0L;
        if (!std::isfinite(hi) || hi > 1e20L) {
            throw NumericOverflow("solve_log_utility_cost: no bracket");
        }
    }

    for (int iter = 0; iter < 200; ++iter) {
        long double mid = lo + (hi - lo) / 2.0L;
        if (utility(mid) < target) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return from_ld(lo + (hi - lo) / 2.0L);
}

} // namespace clum
