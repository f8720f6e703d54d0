// CLUM - Verifier and Solver Tests

#include "test_helpers.hpp"
#include <clum/solver.hpp>
#include <clum/verifier.hpp>

using namespace clum;
using namespace clum::test;

namespace {

const TradeIntent BUY_CALL{OptionType::CALL, TradeSide::BUY, wad(2000), wad(1)};
const TradeIntent SELL_CALL{OptionType::CALL, TradeSide::SELL, wad(2000), wad(1)};
const TradeIntent BUY_PUT{OptionType::PUT, TradeSide::BUY, wad(1900), wad(1)};

CostSolver solver_for(const Market& m) {
    auto ctx = m.engine.verification_context();
    REQUIRE(ctx.has_value());
    return CostSolver(*ctx);
}

} // namespace

TEST_CASE("Honest proposals are accepted", "[verifier]") {
    Market m;
    m.open();
    RecordingListener listener;
    m.engine.set_listener(&listener);
    CostSolver solver = solver_for(m);

    SECTION("Single buy") {
        CostProposal proposal = solver.propose(m.engine.state(), {BUY_CALL});
        VerifyResult result = m.engine.verify_and_set_cost(MANAGER, proposal);

        REQUIRE(result.ok());
        REQUIRE(result.bounds.lower_x18 <= proposal.proposed_cost_x18);
        REQUIRE(proposal.proposed_cost_x18 <= result.bounds.upper_x18);
        REQUIRE(m.engine.get_quantities() == proposal.new_quantities);
        REQUIRE(m.engine.get_cached_cost() == proposal.proposed_cost_x18);

        REQUIRE(listener.cost_updates.size() == 1);
        REQUIRE(listener.cost_updates[0].new_cost == proposal.proposed_cost_x18);
        REQUIRE(m.engine.get_stats().total_cost_updates == 1);
    }

    SECTION("Solver agrees with the on-path evaluation") {
        CostProposal proposal = solver.propose(m.engine.state(), {BUY_CALL});
        I128 on_path = evaluate_cost(solver.context().model, proposal.new_quantities);
        REQUIRE(approx_equal(proposal.proposed_cost_x18, on_path, 1000000));
    }

    SECTION("Mixed batch") {
        CostProposal proposal = solver.propose(m.engine.state(), {BUY_CALL, BUY_PUT});
        REQUIRE(m.engine.verify_and_set_cost(MANAGER, proposal).ok());

        proposal = solver.propose(m.engine.state(), {SELL_CALL, BUY_PUT});
        REQUIRE(m.engine.verify_and_set_cost(MANAGER, proposal).ok());
    }

    SECTION("Refresh with no trades") {
        REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1)).ok());
        CostProposal proposal = solver.refresh(m.engine.state());
        REQUIRE(proposal.trades.empty());
        REQUIRE(m.engine.verify_and_set_cost(MANAGER, proposal).ok());
        REQUIRE(m.engine.get_quantities() == proposal.new_quantities);
    }
}

TEST_CASE("Adversarial proposals leave state unchanged", "[verifier]") {
    Market m;
    m.open();
    REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1)).ok());
    CostSolver solver = solver_for(m);
    EngineState before = m.engine.state();

    auto expect_rejected = [&](const CostProposal& proposal, int32_t status,
                               const Address& caller = MANAGER) {
        VerifyResult result = m.engine.verify_and_set_cost(caller, proposal);
        REQUIRE(result.status == status);
        REQUIRE_FALSE(result.next_state.has_value());
        EngineState after = m.engine.state();
        REQUIRE(after.quantities == before.quantities);
        REQUIRE(after.cached_cost_x18 == before.cached_cost_x18);
    };

    SECTION("Quantities that do not match the declared trades") {
        CostProposal proposal = solver.propose(before, {BUY_CALL});
        proposal.new_quantities[3] += 1;
        expect_rejected(proposal, errors::VERIFY_DELTA);
    }

    SECTION("Undeclared trade") {
        CostProposal proposal = solver.propose(before, {BUY_CALL});
        proposal.trades.clear();
        expect_rejected(proposal, errors::VERIFY_DELTA);
    }

    SECTION("Wrong bucket count") {
        CostProposal proposal = solver.propose(before, {BUY_CALL});
        proposal.new_quantities.push_back(0);
        expect_rejected(proposal, errors::VERIFY_DELTA);
    }

    SECTION("Zero-payoff trade in the batch") {
        TradeIntent worthless{OptionType::CALL, TradeSide::BUY, wad(10000), wad(1)};
        CostProposal proposal = solver.propose(before, {BUY_CALL, worthless});
        expect_rejected(proposal, errors::VERIFY_DELTA);
    }

    SECTION("Batch larger than the limit") {
        std::vector<TradeIntent> trades(m.engine.config().max_batch_trades + 1, BUY_PUT);
        CostProposal proposal = solver.propose(before, trades);
        expect_rejected(proposal, errors::VERIFY_DELTA);
    }

    SECTION("Buy that does not raise the cost") {
        CostProposal proposal = solver.propose(before, {BUY_CALL});
        proposal.proposed_cost_x18 = before.cached_cost_x18;
        expect_rejected(proposal, errors::VERIFY_MONOTONICITY);
    }

    SECTION("Sell that does not lower the cost") {
        CostProposal proposal = solver.propose(before, {SELL_CALL});
        proposal.proposed_cost_x18 = before.cached_cost_x18 + 1;
        expect_rejected(proposal, errors::VERIFY_MONOTONICITY);
    }

    SECTION("Cost outside the bound") {
        CostProposal proposal = solver.propose(before, {BUY_CALL});
        proposal.proposed_cost_x18 += m.engine.config().cost_tolerance_x18 * 2;
        expect_rejected(proposal, errors::VERIFY_BOUND);

        proposal.proposed_cost_x18 -= m.engine.config().cost_tolerance_x18 * 4;
        expect_rejected(proposal, errors::VERIFY_BOUND);
    }

    SECTION("Refresh that claims a different cost") {
        CostProposal proposal = solver.refresh(before);
        proposal.proposed_cost_x18 += wad(1);
        expect_rejected(proposal, errors::VERIFY_BOUND);
    }

    SECTION("Unauthorized caller") {
        CostProposal proposal = solver.propose(before, {BUY_CALL});
        expect_rejected(proposal, errors::UNAUTHORIZED, STRANGER);
        expect_rejected(proposal, errors::UNAUTHORIZED, OWNER);
    }
}

TEST_CASE("Small deviations within the tolerance are accepted", "[verifier]") {
    Market m;
    m.open();
    CostSolver solver = solver_for(m);

    CostProposal proposal = solver.propose(m.engine.state(), {BUY_CALL});
    proposal.proposed_cost_x18 += m.engine.config().cost_tolerance_x18 / 2;
    REQUIRE(m.engine.verify_and_set_cost(MANAGER, proposal).ok());
}

TEST_CASE("Simplex check", "[verifier]") {
    EngineConfig config = Market::default_engine_config();
    config.simplex_tolerance_x18 = 0;
    Market m(config);
    m.open();
    CostSolver solver = solver_for(m);

    // Initial prices sum to exactly 1e18; after a call the truncation deficit is nonzero
    REQUIRE(m.engine.verify_and_set_cost(MANAGER, solver.refresh(m.engine.state())).ok());
    VerifyResult result = m.engine.verify_and_set_cost(MANAGER, solver.propose(m.engine.state(), {BUY_CALL}));
    REQUIRE(result.status == errors::VERIFY_SIMPLEX);
    REQUIRE(m.engine.get_quantities() == std::vector<I128>(7, 0));
}

TEST_CASE("Solvency is enforced after verification", "[verifier]") {
    Market m;
    m.open(wad(100));
    CostSolver solver = solver_for(m);

    VerifyResult result = m.engine.verify_and_set_cost(MANAGER, solver.propose(m.engine.state(), {BUY_CALL}));
    REQUIRE(result.status == errors::SOLVENCY_VIOLATION);
    REQUIRE_FALSE(result.next_state.has_value());
    REQUIRE(m.engine.get_cached_cost() == 0);
}

TEST_CASE("Pure verification", "[verifier]") {
    Market m;
    m.open();
    auto ctx = *m.engine.verification_context();
    EngineState state = m.engine.state();
    CostSolver solver(ctx);

    CostProposal proposal = solver.propose(state, {BUY_CALL});
    VerifyResult first = verify_cost_update(ctx, state, proposal);
    VerifyResult second = verify_cost_update(ctx, state, proposal);

    REQUIRE(first.ok());
    REQUIRE(second.ok());
    REQUIRE(first.next_state->quantities == second.next_state->quantities);
    REQUIRE(first.next_state->cached_cost_x18 == proposal.proposed_cost_x18);
    REQUIRE(first.next_state->grid_epoch == state.grid_epoch);

    // Nothing was committed
    REQUIRE(m.engine.get_cached_cost() == 0);
}

TEST_CASE("Deterministic cost bounds", "[verifier]") {
    CostModel model{wad(1000), make_priors(7, PriorShape::GAUSSIAN, dec("1.25"), dec("0.001"))};
    std::vector<I128> q = {0, 0, 0, 0, wad(100), wad(200), wad(1125)};

    CostBounds bounds = cost_bounds(model, q);
    I128 point = evaluate_cost(model, q);
    REQUIRE(bounds.lower_x18 <= point);
    REQUIRE(point <= bounds.upper_x18);
    REQUIRE(bounds.upper_x18 - bounds.lower_x18 < wad(1) / 100000000);
}

TEST_CASE("Log-utility cost", "[solver]") {
    std::vector<I128> priors = make_priors(7, PriorShape::UNIFORM, 0, dec("0.001"));
    I128 utility = x18::ln(wad(10000));

    SECTION("Flat book costs the subsidy") {
        I128 c = CostSolver::solve_log_utility_cost(priors, std::vector<I128>(7, 0), utility);
        REQUIRE(approx_equal(c, wad(10000), wad(1) / 1000000));
    }

    SECTION("Exposure raises the cost above the largest liability") {
        std::vector<I128> q = {0, 0, 0, 0, wad(100), wad(200), wad(1125)};
        I128 flat = CostSolver::solve_log_utility_cost(priors, std::vector<I128>(7, 0), utility);
        I128 c = CostSolver::solve_log_utility_cost(priors, q, utility);
        REQUIRE(c > flat);
        REQUIRE(c > wad(1125));
    }
}
