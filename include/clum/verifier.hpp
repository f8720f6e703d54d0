#ifndef CLUM_VERIFIER_HPP
#define CLUM_VERIFIER_HPP

#include <optional>
#include <vector>

#include "types.hpp"
#include "cost_function.hpp"

namespace clum {

// Authoritative per-grid engine state
struct EngineState {
    std::vector<I128> quantities;     // q_i, net pool liability per bucket
    I128 cached_cost_x18;             // Last committed C(q)
    uint64_t grid_epoch;              // Registry epoch the quantities belong to
};

// Off-path proposal: claimed cost for quantities after a batch of trades.
// An empty trade list with unchanged quantities is a cost refresh.
struct CostProposal {
    std::vector<TradeIntent> trades;
    std::vector<I128> new_quantities;
    I128 proposed_cost_x18;
};

// Everything the verifier needs besides the state itself
struct VerificationContext {
    CostModel model;
    std::vector<I128> midpoints;
    I128 cost_tolerance_x18;
    I128 simplex_tolerance_x18;
    uint32_t max_batch_trades;
};

struct VerifyResult {
    int32_t status;
    std::optional<EngineState> next_state;   // Set only when status == OK
    CostBounds bounds;                       // Acceptance interval, if computed

    bool ok() const { return status == errors::OK; }
};

// Checks, in order: declared deltas reproduce new_quantities exactly,
// the cost moves in the direction the trades require, the proposed cost
// lies within the deterministic bound widened by cost_tolerance, and the
// implied prices sum to 1 within simplex_tolerance.
//
// Pure: old_state is never modified, and a rejection carries no state.
VerifyResult verify_cost_update(const VerificationContext& ctx,
                                const EngineState& old_state,
                                const CostProposal& proposal);

} // namespace clum

#endif // CLUM_VERIFIER_HPP
