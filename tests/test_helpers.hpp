// Shared fixtures for the CLUM tests

#ifndef CLUM_TEST_HELPERS_HPP
#define CLUM_TEST_HELPERS_HPP

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_tostring.hpp>
#include <clum/engine.hpp>
#include <clum/fixed_point.hpp>
#include <clum/spot_source.hpp>

#include <memory>
#include <string>
#include <vector>

namespace Catch {
template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) {
        return clum::x18::to_string(value);
    }
};
} // namespace Catch

namespace clum::test {

inline I128 wad(int64_t v) { return x18::from_int(v); }
inline I128 dec(const char* s) { return x18::from_string(s); }

inline bool approx_equal(I128 a, I128 b, I128 tolerance) {
    return x18::abs(a - b) <= tolerance;
}

inline I128 sum_of(const std::vector<I128>& values) {
    I128 total = 0;
    for (I128 v : values) total += v;
    return total;
}

const Address OWNER = address_from_id(1);
const Address MANAGER = address_from_id(2);
const Address STRANGER = address_from_id(99);

// 5 regular buckets of 100 around 2000 plus two tails, b = 1000
struct Market {
    StaticPriceSource spot{wad(2000)};
    BucketRegistry registry;
    ClumEngine engine;

    explicit Market(EngineConfig config = default_engine_config(),
                    GridConfig grid = default_grid())
        : registry(grid, spot)
        , engine(registry, config, OWNER) {}

    static GridConfig default_grid() {
        GridConfig grid;
        grid.center_price_x18 = wad(2000);
        grid.bucket_width_x18 = wad(100);
        grid.num_regular = 5;
        grid.rebalance_threshold_x18 = dec("0.1");
        return grid;
    }

    static EngineConfig default_engine_config() {
        EngineConfig config;
        config.liquidity_x18 = wad(1000);
        return config;
    }

    // Initializes with the given subsidy and installs MANAGER
    void open(I128 subsidy_x18 = wad(10000)) {
        REQUIRE(engine.initialize(OWNER, subsidy_x18) == errors::OK);
        REQUIRE(engine.set_option_manager(OWNER, MANAGER) == errors::OK);
    }
};

// Records every event in order
class RecordingListener : public IEngineListener {
public:
    struct Recenter { I128 old_center; I128 new_center; };
    struct CostUpdate { I128 old_cost; I128 new_cost; };

    std::vector<Recenter> recenters;
    std::vector<TradeRecord> trades;
    std::vector<CostUpdate> cost_updates;

    void on_grid_recentered(I128 old_center_x18, I128 new_center_x18) override {
        recenters.push_back({old_center_x18, new_center_x18});
    }
    void on_trade_executed(const TradeRecord& trade) override {
        trades.push_back(trade);
    }
    void on_cost_updated(I128 old_cost_x18, I128 new_cost_x18) override {
        cost_updates.push_back({old_cost_x18, new_cost_x18});
    }
};

} // namespace clum::test

#endif // CLUM_TEST_HELPERS_HPP
