#ifndef CLUM_SOLVER_HPP
#define CLUM_SOLVER_HPP

#include <vector>

#include "types.hpp"
#include "verifier.hpp"

namespace clum {

// =============================================================================
// CostSolver - untrusted off-path proposer
// =============================================================================
//
// Evaluates the cost function in extended precision and packages the
// result as a CostProposal. Nothing it returns is trusted: proposals are
// accepted only through verify_cost_update().
//

class CostSolver {
public:
    explicit CostSolver(VerificationContext context);

    // Applies trades to state.quantities and proposes C of the result
    CostProposal propose(const EngineState& state, const std::vector<TradeIntent>& trades) const;

    // Proposal that re-prices the current quantities
    CostProposal refresh(const EngineState& state) const;

    // b * ln(sum pi_i exp(q_i / b)) in long double, converted to x18
    I128 evaluate(const std::vector<I128>& quantities) const;

    // Solves sum_i pi_i ln(C - q_i) = U for C by bisection (log-utility form)
    static I128 solve_log_utility_cost(const std::vector<I128>& priors_x18,
                                       const std::vector<I128>& quantities,
                                       I128 utility_level_x18);

    const VerificationContext& context() const { return context_; }

private:
    VerificationContext context_;
};

} // namespace clum

#endif // CLUM_SOLVER_HPP
