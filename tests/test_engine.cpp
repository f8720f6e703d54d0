// CLUM - Cost-Function Engine Tests

#include "test_helpers.hpp"
#include <clum/cost_function.hpp>

#include <random>

using namespace clum;
using namespace clum::test;

TEST_CASE("Initialization", "[engine]") {
    Market m;

    SECTION("Owner only, once") {
        REQUIRE(m.engine.initialize(STRANGER, wad(10000)) == errors::UNAUTHORIZED);
        REQUIRE_FALSE(m.engine.is_initialized());
        REQUIRE(m.engine.initialize(OWNER, 0) == errors::INVALID_SIZE);
        REQUIRE(m.engine.initialize(OWNER, wad(10000)) == errors::OK);
        REQUIRE(m.engine.is_initialized());
        REQUIRE(m.engine.initialize(OWNER, wad(10000)) == errors::ALREADY_INITIALIZED);
    }

    SECTION("Operations before initialization") {
        REQUIRE(m.engine.quote_buy(OptionType::CALL, wad(2000), wad(1)).status == errors::NOT_INITIALIZED);
        REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1)).status
                == errors::NOT_INITIALIZED);
        REQUIRE(m.engine.get_risk_neutral_prices().empty());
        REQUIRE_FALSE(m.engine.verification_context().has_value());
    }

    SECTION("Initial state") {
        m.open();
        REQUIRE(m.engine.get_num_buckets() == 7);
        REQUIRE(m.engine.get_quantities() == std::vector<I128>(7, 0));
        REQUIRE(m.engine.get_cached_cost() == 0);
        REQUIRE(m.engine.get_initial_cost() == 0);
        REQUIRE(m.engine.get_liquidity() == wad(1000));
        REQUIRE(m.engine.get_subsidy() == wad(10000));
        REQUIRE(approx_equal(m.engine.get_utility_level(), 9210340371976182736LL, x18::LN_MAX_ERROR));
        REQUIRE(m.engine.worst_case_loss() == 0);
        REQUIRE(m.engine.get_option_manager() == MANAGER);
    }

    SECTION("Derived liquidity is subsidy / ln(N)") {
        EngineConfig config;
        Market derived(config);
        derived.open(wad(10000));
        I128 expected = x18::div(wad(10000), x18::ln(wad(7)));
        REQUIRE(derived.engine.get_liquidity() == expected);
    }

    SECTION("Only the owner installs the option manager") {
        REQUIRE(m.engine.set_option_manager(STRANGER, STRANGER) == errors::UNAUTHORIZED);
        REQUIRE(is_zero_address(m.engine.get_option_manager()));
    }
}

TEST_CASE("Initial distribution is peaked at the center", "[engine]") {
    Market m;
    m.open();
    auto prices = m.engine.get_risk_neutral_prices();

    REQUIRE(prices.size() == 7);
    REQUIRE(sum_of(prices) == X18_ONE);
    REQUIRE(prices == m.engine.get_priors());
    for (size_t i = 0; i < 3; ++i) {
        REQUIRE(prices[i] < prices[i + 1]);
        REQUIRE(prices[i] == prices[6 - i]);
    }
}

TEST_CASE("Uniform priors give equal initial prices", "[engine]") {
    EngineConfig config = Market::default_engine_config();
    config.prior_shape = PriorShape::UNIFORM;
    Market m(config);
    m.open();

    auto prices = m.engine.get_risk_neutral_prices();
    REQUIRE(sum_of(prices) == X18_ONE);
    for (size_t i = 0; i < prices.size(); ++i) {
        REQUIRE(x18::abs(prices[i] - X18_ONE / 7) <= 7);
    }
}

TEST_CASE("Buying a call", "[engine]") {
    Market m;
    m.open();
    auto before = m.engine.get_risk_neutral_prices();

    QuoteResult quote = m.engine.quote_buy(OptionType::CALL, wad(2000), wad(1));
    REQUIRE(quote.ok());
    REQUIRE(quote.amount_x18 > 0);
    REQUIRE(quote.fee_x18 == 0);

    TradeResult result = m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1));
    REQUIRE(result.ok());
    REQUIRE(result.trade.cost_x18 == quote.amount_x18);
    REQUIRE(result.trade.id == 1);

    SECTION("Quantities follow the call payoff at each midpoint") {
        std::vector<I128> expected = {0, 0, 0, 0, wad(100), wad(200), wad(1125)};
        REQUIRE(m.engine.get_quantities() == expected);
        REQUIRE(m.engine.get_quantity(6) == wad(1125));
        REQUIRE_THROWS_AS(m.engine.get_quantity(7), std::out_of_range);
    }

    SECTION("Cost rises by no more than the quoted amount") {
        REQUIRE(m.engine.get_cached_cost() <= quote.amount_x18);
        REQUIRE(approx_equal(m.engine.get_cached_cost(), quote.amount_x18, wad(1) / 100000000));
        REQUIRE(m.engine.get_cached_cost() == result.trade.cached_cost_after_x18);
        // b * ln(sum pi_i exp(q_i / b)) for these quantities is ~78.458
        REQUIRE(approx_equal(m.engine.get_cached_cost(), dec("78.458035709020126"), wad(1) / 1000000));
    }

    SECTION("Probability moves to the buckets that pay") {
        auto after = m.engine.get_risk_neutral_prices();
        for (size_t i = 0; i < 4; ++i) {
            REQUIRE(after[i] < before[i]);
        }
        for (size_t i = 4; i < 7; ++i) {
            REQUIRE(after[i] > before[i]);
        }
        REQUIRE(X18_ONE - sum_of(after) >= 0);
        REQUIRE(X18_ONE - sum_of(after) <= 7);
    }

    SECTION("Worst-case loss is the best-paying bucket net of premium") {
        REQUIRE(m.engine.worst_case_loss() == wad(1125) - m.engine.get_cached_cost());
    }
}

TEST_CASE("Buying a put", "[engine]") {
    Market m;
    m.open();
    REQUIRE(m.engine.execute_buy(MANAGER, OptionType::PUT, wad(2000), wad(1)).ok());

    std::vector<I128> expected = {wad(1125), wad(200), wad(100), 0, 0, 0, 0};
    REQUIRE(m.engine.get_quantities() == expected);
}

TEST_CASE("Round trip", "[engine]") {
    SECTION("Without a fee the sell still returns strictly less than the buy cost") {
        Market m;
        m.open();
        auto buy = m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1));
        REQUIRE(buy.ok());

        auto quote = m.engine.quote_sell(OptionType::CALL, wad(2000), wad(1));
        REQUIRE(quote.ok());
        REQUIRE(quote.amount_x18 < buy.trade.cost_x18);
        REQUIRE(approx_equal(quote.amount_x18, buy.trade.cost_x18, wad(1) / 100000000));

        auto sell = m.engine.execute_sell(MANAGER, OptionType::CALL, wad(2000), wad(1));
        REQUIRE(sell.ok());
        REQUIRE(sell.trade.cost_x18 == quote.amount_x18);
        REQUIRE(sell.trade.cost_x18 < buy.trade.cost_x18);
        REQUIRE(m.engine.get_quantities() == std::vector<I128>(7, 0));
        REQUIRE(m.engine.get_cached_cost() == m.engine.get_initial_cost());
    }

    SECTION("With a fee the trader loses the spread") {
        EngineConfig config = Market::default_engine_config();
        config.fee_x18 = dec("0.01");
        Market m(config);
        m.open();

        auto buy = m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1));
        REQUIRE(buy.ok());
        REQUIRE(buy.trade.fee_x18 > 0);

        auto sell = m.engine.execute_sell(MANAGER, OptionType::CALL, wad(2000), wad(1));
        REQUIRE(sell.ok());
        REQUIRE(sell.trade.cost_x18 < buy.trade.cost_x18);
        REQUIRE(buy.trade.cost_x18 - sell.trade.cost_x18 > buy.trade.fee_x18 + sell.trade.fee_x18);
    }
}

TEST_CASE("Quotes do not change state", "[engine]") {
    Market m;
    m.open();
    auto q1 = m.engine.quote_buy(OptionType::CALL, wad(2000), wad(1));
    auto q2 = m.engine.quote_buy(OptionType::CALL, wad(2000), wad(1));
    REQUIRE(q1.amount_x18 == q2.amount_x18);
    REQUIRE(m.engine.get_cached_cost() == 0);

    auto q_double = m.engine.quote_buy(OptionType::CALL, wad(2000), wad(2));
    REQUIRE(q_double.amount_x18 > q1.amount_x18);
}

TEST_CASE("Malformed trades", "[engine]") {
    Market m;
    m.open();

    REQUIRE(m.engine.quote_buy(OptionType::CALL, wad(2000), 0).status == errors::INVALID_SIZE);
    REQUIRE(m.engine.quote_buy(OptionType::CALL, wad(2000), wad(-1)).status == errors::INVALID_SIZE);
    REQUIRE(m.engine.quote_buy(OptionType::CALL, 0, wad(1)).status == errors::INVALID_PRICE);
    REQUIRE(m.engine.quote_sell(static_cast<OptionType>(7), wad(2000), wad(1)).status
            == errors::INVALID_OPTION_TYPE);
    REQUIRE(m.engine.execute_buy(MANAGER, OptionType::PUT, wad(-5), wad(1)).status
            == errors::INVALID_PRICE);
    REQUIRE(m.engine.get_stats().total_trades == 0);
}

TEST_CASE("Zero payoff trades", "[engine]") {
    Market m;
    m.open();

    // Every midpoint, upper tail included, is below the strike
    auto quote = m.engine.quote_buy(OptionType::CALL, wad(10000), wad(1));
    REQUIRE(quote.ok());
    REQUIRE(quote.amount_x18 == 0);

    auto result = m.engine.execute_buy(MANAGER, OptionType::CALL, wad(10000), wad(1));
    REQUIRE(result.status == errors::ZERO_PAYOFF);
    REQUIRE(m.engine.get_quantities() == std::vector<I128>(7, 0));
}

TEST_CASE("Execution authorization", "[engine]") {
    Market m;
    REQUIRE(m.engine.initialize(OWNER, wad(10000)) == errors::OK);

    SECTION("No option manager installed") {
        REQUIRE(m.engine.execute_buy(OWNER, OptionType::CALL, wad(2000), wad(1)).status
                == errors::UNAUTHORIZED);
    }

    SECTION("Wrong caller") {
        REQUIRE(m.engine.set_option_manager(OWNER, MANAGER) == errors::OK);
        REQUIRE(m.engine.execute_buy(STRANGER, OptionType::CALL, wad(2000), wad(1)).status
                == errors::UNAUTHORIZED);
        REQUIRE(m.engine.execute_sell(OWNER, OptionType::CALL, wad(2000), wad(1)).status
                == errors::UNAUTHORIZED);
        REQUIRE(m.engine.get_stats().total_rejections == 2);
    }
}

TEST_CASE("Solvency limits", "[engine]") {
    SECTION("Per-bucket quantity bound") {
        EngineConfig config = Market::default_engine_config();
        config.max_quantity_x18 = wad(500);
        Market m(config);
        m.open();

        // Upper tail would reach 1125
        auto result = m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1));
        REQUIRE(result.status == errors::SOLVENCY_VIOLATION);
        REQUIRE(m.engine.get_quantities() == std::vector<I128>(7, 0));
        REQUIRE(m.engine.get_cached_cost() == 0);

        // Smaller size stays inside
        REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), dec("0.4")).ok());
    }

    SECTION("Worst-case loss bounded by the subsidy") {
        Market m;
        m.open(wad(100));

        // Loss would be ~1125 - 78 > 100
        auto result = m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1));
        REQUIRE(result.status == errors::SOLVENCY_VIOLATION);
        REQUIRE(m.engine.worst_case_loss() == 0);
    }
}

TEST_CASE("Trade events", "[engine]") {
    Market m;
    m.open();
    RecordingListener listener;
    m.engine.set_listener(&listener);

    REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1)).ok());
    REQUIRE(m.engine.execute_buy(MANAGER, OptionType::PUT, wad(1900), dec("0.5")).ok());
    REQUIRE(m.engine.execute_buy(STRANGER, OptionType::PUT, wad(1900), wad(1)).status
            == errors::UNAUTHORIZED);

    REQUIRE(listener.trades.size() == 2);
    REQUIRE(listener.trades[0].id == 1);
    REQUIRE(listener.trades[0].option_type == OptionType::CALL);
    REQUIRE(listener.trades[0].side == TradeSide::BUY);
    REQUIRE(listener.trades[1].id == 2);
    REQUIRE(listener.trades[1].size_x18 == dec("0.5"));

    REQUIRE(listener.cost_updates.size() == 2);
    REQUIRE(listener.cost_updates[0].old_cost == 0);
    REQUIRE(listener.cost_updates[1].old_cost == listener.cost_updates[0].new_cost);
    REQUIRE(listener.cost_updates[1].new_cost == m.engine.get_cached_cost());

    auto stats = m.engine.get_stats();
    REQUIRE(stats.total_trades == 2);
    REQUIRE(stats.total_rejections == 1);
}

TEST_CASE("Hypothetical prices", "[engine]") {
    Market m;
    m.open();

    std::vector<I128> q = {0, 0, 0, 0, wad(100), wad(200), wad(1125)};
    auto hypothetical = m.engine.risk_neutral_prices_for(q);
    REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1)).ok());
    REQUIRE(hypothetical == m.engine.get_risk_neutral_prices());

    TradeIntent trade{OptionType::PUT, TradeSide::BUY, wad(2000), wad(1)};
    auto preview = m.engine.preview_distribution(trade);
    REQUIRE(preview.has_value());
    REQUIRE(preview->midpoints.size() == 7);
    REQUIRE(preview->probabilities[0] > m.engine.get_risk_neutral_prices()[0]);
}

TEST_CASE("Engine recenter", "[engine]") {
    Market m;
    m.open();
    RecordingListener listener;
    m.engine.set_listener(&listener);
    m.registry.set_listener(&listener);
    REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1)).ok());
    auto before = m.engine.get_quantities();

    SECTION("Remaps exposure and re-derives cost") {
        REQUIRE(m.engine.recenter(OWNER, wad(2200)) == errors::OK);
        REQUIRE(m.registry.get_center_price() == wad(2200));

        auto after = m.engine.get_quantities();
        REQUIRE(sum_of(after) == sum_of(before));
        // Old 2100 and 2200 midpoints land in new buckets 2 and 3
        REQUIRE(after[2] == wad(100));
        REQUIRE(after[3] == wad(200));
        REQUIRE(after[6] == wad(1125));

        auto state = m.engine.state();
        REQUIRE(state.grid_epoch == m.registry.epoch());
        REQUIRE(state.cached_cost_x18 == evaluate_cost(
            CostModel{m.engine.get_liquidity(), m.engine.get_priors()}, after));

        REQUIRE(listener.recenters.size() == 1);
        REQUIRE(listener.cost_updates.back().new_cost == state.cached_cost_x18);
        REQUIRE(m.engine.get_stats().total_recenters == 1);

        // Trading continues on the new grid
        REQUIRE(m.engine.quote_buy(OptionType::CALL, wad(2200), wad(1)).ok());
    }

    SECTION("Option manager may recenter, others may not") {
        REQUIRE(m.engine.recenter(STRANGER, wad(2200)) == errors::UNAUTHORIZED);
        REQUIRE(m.engine.recenter(MANAGER, wad(2200)) == errors::OK);
    }

    SECTION("Invalid geometry leaves everything unchanged") {
        REQUIRE(m.engine.recenter(OWNER, wad(200)) == errors::INVALID_GEOMETRY);
        REQUIRE(m.engine.get_quantities() == before);
        REQUIRE(m.registry.epoch() == 0);
    }

    SECTION("Direct registry recenter desynchronizes the engine") {
        REQUIRE(m.registry.recenter(wad(2100)) == errors::OK);
        REQUIRE(m.engine.quote_buy(OptionType::CALL, wad(2000), wad(1)).status
                == errors::GRID_OUT_OF_SYNC);
        REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1)).status
                == errors::GRID_OUT_OF_SYNC);
        REQUIRE(m.engine.recenter(OWNER, wad(2000)) == errors::GRID_OUT_OF_SYNC);
    }

    SECTION("Stale engine publishes no distribution") {
        REQUIRE(m.registry.recenter(wad(2100)) == errors::OK);
        REQUIRE(m.engine.get_risk_neutral_prices().empty());
        auto distribution = m.engine.get_implied_distribution();
        REQUIRE(distribution.probabilities.empty());
    }
}

namespace {

// Reads engine state from inside the grid callback
class ReentrantListener : public IEngineListener {
public:
    ReentrantListener(const ClumEngine& engine, const BucketRegistry& registry)
        : engine_(engine), registry_(registry) {}

    void on_grid_recentered(I128, I128 new_center_x18) override {
        observed_center = new_center_x18;
        observed_cost = engine_.get_cached_cost();
        observed_state = engine_.state();
        registry_epoch = registry_.epoch();
        has_context = engine_.verification_context().has_value();
        ++calls;
    }
    void on_trade_executed(const TradeRecord&) override {}
    void on_cost_updated(I128, I128) override {}

    int calls = 0;
    I128 observed_center = 0;
    I128 observed_cost = 0;
    EngineState observed_state{};
    uint64_t registry_epoch = 0;
    bool has_context = false;

private:
    const ClumEngine& engine_;
    const BucketRegistry& registry_;
};

} // namespace

TEST_CASE("Grid listener may query the engine", "[engine]") {
    Market m;
    m.open();
    ReentrantListener listener(m.engine, m.registry);
    m.registry.set_listener(&listener);
    REQUIRE(m.engine.execute_buy(MANAGER, OptionType::CALL, wad(2000), wad(1)).ok());

    SECTION("Owner recenter") {
        REQUIRE(m.engine.recenter(OWNER, wad(2200)) == errors::OK);
    }

    SECTION("Permissionless rebalance") {
        REQUIRE(m.spot.set_price(wad(2230)) == errors::OK);
        REQUIRE(m.engine.rebalance() == errors::OK);
    }

    REQUIRE(listener.calls == 1);
    REQUIRE(listener.observed_center == wad(2200));
    REQUIRE(listener.registry_epoch == 1);
    REQUIRE(listener.observed_state.grid_epoch == listener.registry_epoch);
    REQUIRE(listener.observed_state.quantities == m.engine.get_quantities());
    REQUIRE(listener.observed_cost == m.engine.get_cached_cost());
    REQUIRE(listener.has_context);
}

TEST_CASE("Permissionless rebalance", "[engine]") {
    Market m;
    m.open();

    SECTION("Refused while spot is near the center") {
        REQUIRE(m.engine.rebalance() == errors::NO_REBALANCE_NEEDED);
    }

    SECTION("Recenters on spot rounded to the bucket width") {
        REQUIRE(m.spot.set_price(wad(2430)) == errors::OK);
        REQUIRE(m.engine.rebalance() == errors::OK);
        REQUIRE(m.registry.get_center_price() == wad(2400));
        REQUIRE_FALSE(m.registry.needs_rebalance());
        REQUIRE(m.engine.rebalance() == errors::NO_REBALANCE_NEEDED);
    }
}

TEST_CASE("Cost is monotone in every bucket", "[engine][cost]") {
    CostModel model{wad(1000), make_priors(7, PriorShape::GAUSSIAN, dec("1.25"), dec("0.001"))};

    std::vector<std::vector<I128>> states = {
        std::vector<I128>(7, 0),
        {0, 0, 0, 0, wad(100), wad(200), wad(1125)},
        {wad(1125), wad(200), wad(100), 0, 0, 0, 0},
        {-wad(3000), wad(40), -wad(250), wad(900), 0, -wad(75), wad(2500)},
    };
    std::vector<I128> steps = {wad(1) / 10000000, wad(1), wad(50), wad(2000)};

    for (const auto& q : states) {
        I128 base = evaluate_cost(model, q);
        for (size_t i = 0; i < q.size(); ++i) {
            for (I128 step : steps) {
                std::vector<I128> raised = q;
                raised[i] += step;
                INFO("bucket " << i << " step " << x18::to_string(step));
                REQUIRE(evaluate_cost(model, raised) > base);
                REQUIRE(trade_cost(model, q, raised, TradeSide::BUY) > 0);
            }

            // A single wei still costs the buyer and pays the seller nothing extra
            std::vector<I128> dust = q;
            dust[i] += 1;
            REQUIRE(trade_cost(model, q, dust, TradeSide::BUY) >= 1);
            REQUIRE(trade_cost(model, dust, q, TradeSide::SELL) <
                    trade_cost(model, q, dust, TradeSide::BUY));
        }
    }
}

TEST_CASE("Dust trades always charge the buyer", "[engine][cost]") {
    Market m;
    m.open();

    // Only the lower tail pays: 125 wei per trade
    I128 previous = m.engine.get_cached_cost();
    for (int i = 0; i < 20; ++i) {
        auto result = m.engine.execute_buy(MANAGER, OptionType::PUT, wad(1000), 1);
        REQUIRE(result.ok());
        REQUIRE(result.trade.cost_x18 > 0);
        REQUIRE(m.engine.get_cached_cost() > previous);
        previous = m.engine.get_cached_cost();
    }
    REQUIRE(m.engine.get_quantity(0) == 20 * 125);

    for (int i = 0; i < 20; ++i) {
        auto result = m.engine.execute_sell(MANAGER, OptionType::PUT, wad(1000), 1);
        REQUIRE(result.ok());
        REQUIRE(result.trade.cost_x18 >= 0);
        REQUIRE(m.engine.get_cached_cost() < previous);
        previous = m.engine.get_cached_cost();
    }
    REQUIRE(m.engine.get_quantities() == std::vector<I128>(7, 0));
}

TEST_CASE("Prices stay on the simplex along any trade path", "[engine][cost]") {
    Market m;
    m.open(wad(1000000));
    std::mt19937_64 rng(20250101);

    const std::vector<I128> strikes = {wad(1000), wad(1800), wad(1950), wad(2000),
                                       wad(2050), wad(2200), wad(2600)};
    const std::vector<I128> sizes = {1, dec("0.001"), dec("0.3"), wad(1), wad(4)};
    size_t executed = 0;

    for (int step = 0; step < 200; ++step) {
        OptionType type = rng() % 2 == 0 ? OptionType::CALL : OptionType::PUT;
        I128 strike = strikes[rng() % strikes.size()];
        I128 size = sizes[rng() % sizes.size()];
        TradeResult result = rng() % 3 == 0
            ? m.engine.execute_sell(MANAGER, type, strike, size)
            : m.engine.execute_buy(MANAGER, type, strike, size);
        if (!result.ok()) continue;
        ++executed;

        auto prices = m.engine.get_risk_neutral_prices();
        REQUIRE(prices.size() == 7);
        for (I128 p : prices) {
            REQUIRE(p >= 0);
        }
        I128 shortfall = X18_ONE - sum_of(prices);
        REQUIRE(shortfall >= 0);
        REQUIRE(shortfall <= 7);
    }
    REQUIRE(executed > 100);
}
