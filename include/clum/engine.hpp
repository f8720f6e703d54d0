#ifndef CLUM_ENGINE_HPP
#define CLUM_ENGINE_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "types.hpp"
#include "events.hpp"
#include "bucket_registry.hpp"
#include "cost_function.hpp"
#include "verifier.hpp"

namespace clum {

// Engine configuration
struct EngineConfig {
    I128 liquidity_x18 = 0;                          // b; 0 derives subsidy / ln(N)
    I128 fee_x18 = 0;                                // Quote spread, e.g. 0.003 = 30 bps
    I128 max_quantity_x18 = X18_ONE * 1000000000LL;  // Per-bucket |q_i| bound
    PriorShape prior_shape = PriorShape::GAUSSIAN;
    I128 prior_sigma_buckets_x18 = 0;                // 0 = num_regular / 4
    I128 prior_floor_x18 = 1000000000000000LL;       // 0.001
    I128 cost_tolerance_x18 = 1000000000LL;          // 1e-9
    I128 simplex_tolerance_x18 = 1000000000LL;       // 1e-9
    uint32_t max_batch_trades = 16;
};

// Quote result: amount owed (buy) or received (sell), fee included
struct QuoteResult {
    int32_t status;
    I128 amount_x18;
    I128 fee_x18;

    bool ok() const { return status == errors::OK; }
};

struct TradeResult {
    int32_t status;
    TradeRecord trade;

    bool ok() const { return status == errors::OK; }
};

// Grid midpoints paired with risk-neutral probabilities
struct ImpliedDistribution {
    std::vector<I128> midpoints;
    std::vector<I128> probabilities;
};

// =============================================================================
// ClumEngine - cost-function market maker over a bucket grid
// =============================================================================
//
// Locking: the engine mutex is always taken before the registry's.
// Listener callbacks run after the engine lock is released.
//

class ClumEngine {
public:
    ClumEngine(BucketRegistry& registry, const EngineConfig& config, const Address& owner);
    ~ClumEngine() = default;

    // Non-copyable
    ClumEngine(const ClumEngine&) = delete;
    ClumEngine& operator=(const ClumEngine&) = delete;

    // =========================================================================
    // Administration
    // =========================================================================

    // Owner only, once
    int32_t initialize(const Address& caller, I128 subsidy_x18);
    bool is_initialized() const;

    // Owner only
    int32_t set_option_manager(const Address& caller, const Address& manager);
    Address get_owner() const { return owner_; }
    Address get_option_manager() const;

    void set_listener(IEngineListener* listener);

    // =========================================================================
    // Trading
    // =========================================================================

    QuoteResult quote_buy(OptionType type, I128 strike_x18, I128 size_x18) const;
    QuoteResult quote_sell(OptionType type, I128 strike_x18, I128 size_x18) const;

    // Option manager only
    TradeResult execute_buy(const Address& caller, OptionType type,
                            I128 strike_x18, I128 size_x18);
    TradeResult execute_sell(const Address& caller, OptionType type,
                             I128 strike_x18, I128 size_x18);

    // Option manager only; commits only a fully verified, solvent proposal
    VerifyResult verify_and_set_cost(const Address& caller, const CostProposal& proposal);

    // =========================================================================
    // Grid Maintenance
    // =========================================================================

    // Owner or option manager
    int32_t recenter(const Address& caller, I128 new_center_x18);

    // Anyone, only when the registry reports needs_rebalance(). Recenters on
    // spot rounded to the nearest bucket width.
    int32_t rebalance();

    // =========================================================================
    // Queries
    // =========================================================================

    // Empty probabilities before initialization or while the registry epoch
    // differs from the engine's (GRID_OUT_OF_SYNC)
    std::vector<I128> get_risk_neutral_prices() const;
    ImpliedDistribution get_implied_distribution() const;
    std::vector<I128> risk_neutral_prices_for(const std::vector<I128>& quantities) const;

    // Distribution after a hypothetical trade, or nullopt if the trade
    // is malformed or cannot be evaluated
    std::optional<ImpliedDistribution> preview_distribution(const TradeIntent& trade) const;

    I128 get_quantity(size_t index) const;
    std::vector<I128> get_quantities() const;
    I128 get_cached_cost() const;
    I128 get_initial_cost() const;
    I128 get_utility_level() const;
    I128 get_subsidy() const;
    I128 get_liquidity() const;
    std::vector<I128> get_priors() const;
    size_t get_num_buckets() const;
    I128 worst_case_loss() const;
    EngineState state() const;
    const EngineConfig& config() const { return config_; }

    // Inputs for verify_cost_update() and off-path solvers
    std::optional<VerificationContext> verification_context() const;

    // Statistics
    struct Stats {
        uint64_t total_trades;
        uint64_t total_cost_updates;
        uint64_t total_recenters;
        uint64_t total_rejections;
    };
    Stats get_stats() const;

private:
    BucketRegistry& registry_;
    const EngineConfig config_;
    const Address owner_;

    bool initialized_{false};
    Address option_manager_{};
    I128 subsidy_x18_{0};
    I128 utility_level_x18_{0};
    I128 initial_cost_x18_{0};
    CostModel model_;
    EngineState state_;
    mutable std::shared_mutex mutex_;

    IEngineListener* listener_{nullptr};

    std::atomic<uint64_t> next_trade_id_{1};
    std::atomic<uint64_t> total_trades_{0};
    std::atomic<uint64_t> total_cost_updates_{0};
    std::atomic<uint64_t> total_recenters_{0};
    std::atomic<uint64_t> total_rejections_{0};

    // Post-trade quantities and the amount settled, fee included
    struct PricedTrade {
        std::vector<I128> next_quantities;
        I128 fee_x18;
        I128 amount_x18;
    };

    QuoteResult quote(const TradeIntent& trade) const;
    PricedTrade price_locked(const std::vector<I128>& delta, TradeSide side) const;
    TradeResult execute(const Address& caller, const TradeIntent& trade);
    int32_t recenter_locked(std::unique_lock<std::shared_mutex>& lock, I128 new_center_x18);
    int32_t check_solvency(const std::vector<I128>& quantities, I128 cost_x18) const;
    int32_t check_ready() const;
    VerificationContext context_locked(const BucketGrid& grid) const;
};

} // namespace clum

#endif // CLUM_ENGINE_HPP
