// =============================================================================
// engine.cpp - Cost-function engine: quotes, trades, verification, recenter
// =============================================================================

#include "clum/engine.hpp"
#include "clum/fixed_point.hpp"
#include <algorithm>
#include <mutex>

namespace clum {

ClumEngine::ClumEngine(BucketRegistry& registry, const EngineConfig& config,
                       const Address& owner)
    : registry_(registry), config_(config), owner_(owner) {
    state_.cached_cost_x18 = 0;
    state_.grid_epoch = 0;
}

// =============================================================================
// Administration
// =============================================================================

int32_t ClumEngine::initialize(const Address& caller, I128 subsidy_x18) {
    if (caller != owner_) return errors::UNAUTHORIZED;
    if (subsidy_x18 <= 0) return errors::INVALID_SIZE;

    std::unique_lock lock(mutex_);
    if (initialized_) return errors::ALREADY_INITIALIZED;

    GridSnapshot snap = registry_.snapshot();
    const size_t n = snap.grid.num_buckets();

    CostModel model;
    EngineState state;
    I128 utility;
    I128 initial_cost;
    try {
        I128 sigma = config_.prior_sigma_buckets_x18;
        if (sigma == 0) {
            sigma = std::max<I128>(x18::from_int(snap.grid.num_regular()) / 4, X18_ONE);
        }
        model.priors_x18 = make_priors(n, config_.prior_shape, sigma, config_.prior_floor_x18);
        model.liquidity_x18 = config_.liquidity_x18 > 0
            ? config_.liquidity_x18
            : x18::div(subsidy_x18, x18::ln(x18::from_int(static_cast<int64_t>(n))));
        if (model.liquidity_x18 <= 0) return errors::INVALID_CONFIG;

        state.quantities.assign(n, 0);
        initial_cost = evaluate_cost(model, state.quantities);
        utility = x18::ln(subsidy_x18);
    } catch (const NumericOverflow&) {
        return errors::NUMERIC_OVERFLOW;
    } catch (const std::invalid_argument&) {
        return errors::INVALID_CONFIG;
    }

    state.cached_cost_x18 = initial_cost;
    state.grid_epoch = snap.epoch;

    model_ = std::move(model);
    state_ = std::move(state);
    subsidy_x18_ = subsidy_x18;
    utility_level_x18_ = utility;
    initial_cost_x18_ = initial_cost;
    initialized_ = true;
    return errors::OK;
}

bool ClumEngine::is_initialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

int32_t ClumEngine::set_option_manager(const Address& caller, const Address& manager) {
    if (caller != owner_) return errors::UNAUTHORIZED;
    std::unique_lock lock(mutex_);
    option_manager_ = manager;
    return errors::OK;
}

Address ClumEngine::get_option_manager() const {
    std::shared_lock lock(mutex_);
    return option_manager_;
}

void ClumEngine::set_listener(IEngineListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

int32_t ClumEngine::check_ready() const {
    if (!initialized_) return errors::NOT_INITIALIZED;
    if (registry_.epoch() != state_.grid_epoch) return errors::GRID_OUT_OF_SYNC;
    return errors::OK;
}

// =============================================================================
// Quotes
// =============================================================================

QuoteResult ClumEngine::quote_buy(OptionType type, I128 strike_x18, I128 size_x18) const {
    return quote(TradeIntent{type, TradeSide::BUY, strike_x18, size_x18});
}

QuoteResult ClumEngine::quote_sell(OptionType type, I128 strike_x18, I128 size_x18) const {
    return quote(TradeIntent{type, TradeSide::SELL, strike_x18, size_x18});
}

QuoteResult ClumEngine::quote(const TradeIntent& trade) const {
    int32_t status = validate_trade_input(trade.option_type, trade.strike_x18, trade.size_x18);
    if (status != errors::OK) return QuoteResult{status, 0, 0};

    std::shared_lock lock(mutex_);
    status = check_ready();
    if (status != errors::OK) return QuoteResult{status, 0, 0};

    try {
        std::vector<I128> delta = trade_delta(registry_.grid().midpoints(), trade.option_type,
                                              trade.strike_x18, trade.size_x18);
        if (is_zero_delta(delta)) return QuoteResult{errors::OK, 0, 0};

        PricedTrade priced = price_locked(delta, trade.side);
        return QuoteResult{errors::OK, priced.amount_x18, priced.fee_x18};
    } catch (const NumericOverflow&) {
        return QuoteResult{errors::NUMERIC_OVERFLOW, 0, 0};
    }
}

// =============================================================================
// Execution
// =============================================================================

TradeResult ClumEngine::execute_buy(const Address& caller, OptionType type,
                                    I128 strike_x18, I128 size_x18) {
    return execute(caller, TradeIntent{type, TradeSide::BUY, strike_x18, size_x18});
}

TradeResult ClumEngine::execute_sell(const Address& caller, OptionType type,
                                     I128 strike_x18, I128 size_x18) {
    return execute(caller, TradeIntent{type, TradeSide::SELL, strike_x18, size_x18});
}

ClumEngine::PricedTrade ClumEngine::price_locked(const std::vector<I128>& delta,
                                                 TradeSide side) const {
    PricedTrade priced;
    priced.next_quantities = apply_delta(state_.quantities, delta, side);
    I128 raw = trade_cost(model_, state_.quantities, priced.next_quantities, side);
    priced.fee_x18 = raw > 0 ? x18::mul_up(raw, config_.fee_x18) : 0;
    priced.amount_x18 = side == TradeSide::BUY ? x18::add(raw, priced.fee_x18)
                                               : raw - priced.fee_x18;
    return priced;
}

int32_t ClumEngine::check_solvency(const std::vector<I128>& quantities, I128 cost_x18) const {
    for (I128 q : quantities) {
        if (x18::abs(q) > config_.max_quantity_x18) return errors::SOLVENCY_VIOLATION;
    }
    if (clum::worst_case_loss(quantities, cost_x18, initial_cost_x18_) > subsidy_x18_) {
        return errors::SOLVENCY_VIOLATION;
    }
    return errors::OK;
}

TradeResult ClumEngine::execute(const Address& caller, const TradeIntent& trade) {
    TradeRecord record{0, trade.option_type, trade.side, trade.strike_x18, trade.size_x18, 0, 0, 0};

    int32_t status = validate_trade_input(trade.option_type, trade.strike_x18, trade.size_x18);
    if (status != errors::OK) return TradeResult{status, record};

    std::unique_lock lock(mutex_);
    status = check_ready();
    if (status == errors::OK && (is_zero_address(option_manager_) || caller != option_manager_)) {
        status = errors::UNAUTHORIZED;
    }
    if (status != errors::OK) {
        total_rejections_.fetch_add(1, std::memory_order_relaxed);
        return TradeResult{status, record};
    }

    EngineState next;
    try {
        std::vector<I128> delta = trade_delta(registry_.grid().midpoints(), trade.option_type,
                                              trade.strike_x18, trade.size_x18);
        if (is_zero_delta(delta)) {
            total_rejections_.fetch_add(1, std::memory_order_relaxed);
            return TradeResult{errors::ZERO_PAYOFF, record};
        }

        PricedTrade priced = price_locked(delta, trade.side);
        record.fee_x18 = priced.fee_x18;
        record.cost_x18 = priced.amount_x18;

        next.quantities = std::move(priced.next_quantities);
        next.grid_epoch = state_.grid_epoch;
        next.cached_cost_x18 = evaluate_cost(model_, next.quantities);
        // The committed cost moves strictly with the trade even where the
        // point estimate is flat within its rounding error
        if (trade.side == TradeSide::BUY) {
            next.cached_cost_x18 = std::max(next.cached_cost_x18,
                                            x18::add(state_.cached_cost_x18, 1));
        } else {
            next.cached_cost_x18 = std::min(next.cached_cost_x18,
                                            x18::sub(state_.cached_cost_x18, 1));
        }

        status = check_solvency(next.quantities, next.cached_cost_x18);
    } catch (const NumericOverflow&) {
        status = errors::NUMERIC_OVERFLOW;
    }
    if (status != errors::OK) {
        total_rejections_.fetch_add(1, std::memory_order_relaxed);
        return TradeResult{status, record};
    }

    I128 old_cost = state_.cached_cost_x18;
    state_ = std::move(next);
    record.id = next_trade_id_.fetch_add(1, std::memory_order_relaxed);
    record.cached_cost_after_x18 = state_.cached_cost_x18;
    total_trades_.fetch_add(1, std::memory_order_relaxed);

    IEngineListener* listener = listener_;
    lock.unlock();

    if (listener) {
        listener->on_trade_executed(record);
        listener->on_cost_updated(old_cost, record.cached_cost_after_x18);
    }
    return TradeResult{errors::OK, record};
}

VerifyResult ClumEngine::verify_and_set_cost(const Address& caller, const CostProposal& proposal) {
    std::unique_lock lock(mutex_);
    int32_t status = check_ready();
    if (status == errors::OK && (is_zero_address(option_manager_) || caller != option_manager_)) {
        status = errors::UNAUTHORIZED;
    }
    if (status != errors::OK) {
        total_rejections_.fetch_add(1, std::memory_order_relaxed);
        return VerifyResult{status, std::nullopt, CostBounds{0, 0}};
    }

    VerifyResult result = verify_cost_update(context_locked(registry_.grid()), state_, proposal);
    if (result.ok()) {
        try {
            status = check_solvency(result.next_state->quantities,
                                    result.next_state->cached_cost_x18);
        } catch (const NumericOverflow&) {
            status = errors::NUMERIC_OVERFLOW;
        }
        if (status != errors::OK) {
            result.status = status;
            result.next_state.reset();
        }
    }
    if (!result.ok()) {
        total_rejections_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }

    I128 old_cost = state_.cached_cost_x18;
    state_ = *result.next_state;
    total_cost_updates_.fetch_add(1, std::memory_order_relaxed);

    IEngineListener* listener = listener_;
    lock.unlock();

    if (listener) {
        listener->on_cost_updated(old_cost, result.next_state->cached_cost_x18);
    }
    return result;
}

// =============================================================================
// Grid Maintenance
// =============================================================================

int32_t ClumEngine::recenter(const Address& caller, I128 new_center_x18) {
    std::unique_lock lock(mutex_);
    if (caller != owner_ && (is_zero_address(option_manager_) || caller != option_manager_)) {
        return errors::UNAUTHORIZED;
    }
    return recenter_locked(lock, new_center_x18);
}

int32_t ClumEngine::rebalance() {
    if (!registry_.needs_rebalance()) return errors::NO_REBALANCE_NEEDED;

    auto spot = registry_.get_spot_price();
    if (!spot) return errors::PRICE_UNAVAILABLE;

    I128 width = registry_.get_bucket_width();
    I128 center = ((*spot + width / 2) / width) * width;
    if (center <= 0) center = width;

    std::unique_lock lock(mutex_);
    return recenter_locked(lock, center);
}

int32_t ClumEngine::recenter_locked(std::unique_lock<std::shared_mutex>& lock,
                                    I128 new_center_x18) {
    GridSnapshot snap = registry_.snapshot();
    if (initialized_ && snap.epoch != state_.grid_epoch) return errors::GRID_OUT_OF_SYNC;

    auto next_grid = registry_.preview_recenter(new_center_x18);
    if (!next_grid) return errors::INVALID_GEOMETRY;

    EngineState next;
    if (initialized_) {
        try {
            next.quantities = remap_quantities(snap.grid, state_.quantities, *next_grid);
            next.cached_cost_x18 = evaluate_cost(model_, next.quantities);
        } catch (const NumericOverflow&) {
            return errors::NUMERIC_OVERFLOW;
        }
    }

    auto old_center = registry_.commit_recenter(new_center_x18);
    if (!old_center) return errors::INVALID_GEOMETRY;
    total_recenters_.fetch_add(1, std::memory_order_relaxed);

    I128 old_cost = state_.cached_cost_x18;
    I128 new_cost = old_cost;
    if (initialized_) {
        next.grid_epoch = registry_.epoch();
        state_ = std::move(next);
        new_cost = state_.cached_cost_x18;
    }

    IEngineListener* grid_listener = registry_.listener();
    IEngineListener* listener = initialized_ ? listener_ : nullptr;
    lock.unlock();

    if (grid_listener) {
        grid_listener->on_grid_recentered(*old_center, new_center_x18);
    }
    if (listener) {
        listener->on_cost_updated(old_cost, new_cost);
    }
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::vector<I128> ClumEngine::get_risk_neutral_prices() const {
    std::shared_lock lock(mutex_);
    if (check_ready() != errors::OK) return {};
    return risk_neutral_prices(model_, state_.quantities);
}

ImpliedDistribution ClumEngine::get_implied_distribution() const {
    std::shared_lock lock(mutex_);
    ImpliedDistribution dist;
    dist.midpoints = registry_.grid().midpoints();
    if (check_ready() == errors::OK) {
        dist.probabilities = risk_neutral_prices(model_, state_.quantities);
    }
    return dist;
}

std::vector<I128> ClumEngine::risk_neutral_prices_for(const std::vector<I128>& quantities) const {
    std::shared_lock lock(mutex_);
    if (!initialized_) return {};
    return risk_neutral_prices(model_, quantities);
}

std::optional<ImpliedDistribution> ClumEngine::preview_distribution(const TradeIntent& trade) const {
    if (validate_trade_input(trade.option_type, trade.strike_x18, trade.size_x18) != errors::OK) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    if (check_ready() != errors::OK) return std::nullopt;

    try {
        ImpliedDistribution dist;
        dist.midpoints = registry_.grid().midpoints();
        std::vector<I128> delta = trade_delta(dist.midpoints, trade.option_type,
                                              trade.strike_x18, trade.size_x18);
        dist.probabilities = risk_neutral_prices(
            model_, apply_delta(state_.quantities, delta, trade.side));
        return dist;
    } catch (const NumericOverflow&) {
        return std::nullopt;
    }
}

I128 ClumEngine::get_quantity(size_t index) const {
    std::shared_lock lock(mutex_);
    if (index >= state_.quantities.size()) {
        throw std::out_of_range("ClumEngine: bucket index out of range");
    }
    return state_.quantities[index];
}

std::vector<I128> ClumEngine::get_quantities() const {
    std::shared_lock lock(mutex_);
    return state_.quantities;
}

I128 ClumEngine::get_cached_cost() const {
    std::shared_lock lock(mutex_);
    return state_.cached_cost_x18;
}

I128 ClumEngine::get_initial_cost() const {
    std::shared_lock lock(mutex_);
    return initial_cost_x18_;
}

I128 ClumEngine::get_utility_level() const {
    std::shared_lock lock(mutex_);
    return utility_level_x18_;
}

I128 ClumEngine::get_subsidy() const {
    std::shared_lock lock(mutex_);
    return subsidy_x18_;
}

I128 ClumEngine::get_liquidity() const {
    std::shared_lock lock(mutex_);
    return model_.liquidity_x18;
}

std::vector<I128> ClumEngine::get_priors() const {
    std::shared_lock lock(mutex_);
    return model_.priors_x18;
}

size_t ClumEngine::get_num_buckets() const {
    return registry_.num_buckets();
}

I128 ClumEngine::worst_case_loss() const {
    std::shared_lock lock(mutex_);
    return clum::worst_case_loss(state_.quantities, state_.cached_cost_x18, initial_cost_x18_);
}

EngineState ClumEngine::state() const {
    std::shared_lock lock(mutex_);
    return state_;
}

VerificationContext ClumEngine::context_locked(const BucketGrid& grid) const {
    return VerificationContext{model_, grid.midpoints(), config_.cost_tolerance_x18,
                               config_.simplex_tolerance_x18, config_.max_batch_trades};
}

std::optional<VerificationContext> ClumEngine::verification_context() const {
    std::shared_lock lock(mutex_);
    if (check_ready() != errors::OK) return std::nullopt;
    return context_locked(registry_.grid());
}

ClumEngine::Stats ClumEngine::get_stats() const {
    return Stats{
        total_trades_.load(std::memory_order_relaxed),
        total_cost_updates_.load(std::memory_order_relaxed),
        total_recenters_.load(std::memory_order_relaxed),
        total_rejections_.load(std::memory_order_relaxed)
    };
}

} // namespace clum
