// =============================================================================
// bucket_registry.cpp - Discretized price grid, rebalancing and remap
// =============================================================================

#include "clum/bucket_registry.hpp"
#include "clum/fixed_point.hpp"
#include <mutex>
#include <stdexcept>

namespace clum {

// =============================================================================
// BucketGrid
// =============================================================================

std::optional<BucketGrid> BucketGrid::create(I128 center_x18, I128 width_x18,
                                             uint32_t num_regular) {
    if (center_x18 <= 0 || width_x18 <= 0 || num_regular == 0) {
        return std::nullopt;
    }
    if (center_x18 > MAX_PRICE_X18 || width_x18 > MAX_PRICE_X18) {
        return std::nullopt;
    }

    I128 span;
    if (__builtin_mul_overflow(width_x18, static_cast<I128>(num_regular), &span) ||
        span > MAX_PRICE_X18) {
        return std::nullopt;
    }

    I128 lower = center_x18 - span / 2;
    I128 upper = lower + span;
    if (lower <= 0 || upper > MAX_PRICE_X18) {
        return std::nullopt;
    }

    BucketGrid grid;
    grid.center_x18_ = center_x18;
    grid.width_x18_ = width_x18;
    grid.num_regular_ = num_regular;
    grid.lower_edge_x18_ = lower;
    grid.upper_edge_x18_ = upper;
    return grid;
}

size_t BucketGrid::bucket_index(I128 price_x18) const {
    if (price_x18 < lower_edge_x18_) return 0;
    if (price_x18 >= upper_edge_x18_) return num_buckets() - 1;
    return 1 + static_cast<size_t>((price_x18 - lower_edge_x18_) / width_x18_);
}

std::pair<I128, I128> BucketGrid::bucket_bounds(size_t index) const {
    if (index >= num_buckets()) {
        throw std::out_of_range("BucketGrid: bucket index out of range");
    }
    if (index == 0) {
        return {0, lower_edge_x18_};
    }
    if (index == num_buckets() - 1) {
        return {upper_edge_x18_, I128_MAX};
    }
    I128 lower = lower_edge_x18_ + static_cast<I128>(index - 1) * width_x18_;
    return {lower, lower + width_x18_};
}

I128 BucketGrid::bucket_midpoint(size_t index) const {
    if (index >= num_buckets()) {
        throw std::out_of_range("BucketGrid: bucket index out of range");
    }
    if (index == 0) {
        return lower_edge_x18_ / 2;
    }
    if (index == num_buckets() - 1) {
        // Mirror of the lower tail's half-span above the upper edge
        return upper_edge_x18_ + lower_edge_x18_ / 2;
    }
    return lower_edge_x18_ + static_cast<I128>(index - 1) * width_x18_ + width_x18_ / 2;
}

std::vector<I128> BucketGrid::midpoints() const {
    std::vector<I128> mids(num_buckets());
    for (size_t i = 0; i < mids.size(); ++i) {
        mids[i] = bucket_midpoint(i);
    }
    return mids;
}

// =============================================================================
// Remap
// =============================================================================

std::vector<I128> remap_quantities(const BucketGrid& old_grid,
                                   const std::vector<I128>& old_quantities,
                                   const BucketGrid& new_grid) {
    if (old_quantities.size() != old_grid.num_buckets() ||
        old_grid.num_buckets() != new_grid.num_buckets()) {
        throw std::invalid_argument("remap_quantities: grid size mismatch");
    }

    std::vector<I128> remapped(new_grid.num_buckets(), 0);
    for (size_t i = 0; i < old_quantities.size(); ++i) {
        if (old_quantities[i] == 0) continue;
        size_t target = new_grid.bucket_index(old_grid.bucket_midpoint(i));
        remapped[target] = x18::add(remapped[target], old_quantities[i]);
    }
    return remapped;
}

// =============================================================================
// BucketRegistry
// =============================================================================

BucketRegistry::BucketRegistry(const GridConfig& config, const ISpotPriceSource& spot)
    : spot_(spot), rebalance_threshold_x18_(config.rebalance_threshold_x18) {
    auto grid = BucketGrid::create(config.center_price_x18, config.bucket_width_x18,
                                   config.num_regular);
    if (!grid) {
        throw std::invalid_argument("BucketRegistry: invalid grid geometry");
    }
    if (config.rebalance_threshold_x18 < 0) {
        throw std::invalid_argument("BucketRegistry: negative rebalance threshold");
    }
    grid_ = *grid;
}

size_t BucketRegistry::num_buckets() const {
    std::shared_lock lock(mutex_);
    return grid_.num_buckets();
}

I128 BucketRegistry::get_bucket_midpoint(size_t index) const {
    std::shared_lock lock(mutex_);
    return grid_.bucket_midpoint(index);
}

std::pair<I128, I128> BucketRegistry::get_bucket_bounds(size_t index) const {
    std::shared_lock lock(mutex_);
    return grid_.bucket_bounds(index);
}

size_t BucketRegistry::get_bucket_index(I128 price_x18) const {
    std::shared_lock lock(mutex_);
    return grid_.bucket_index(price_x18);
}

I128 BucketRegistry::get_center_price() const {
    std::shared_lock lock(mutex_);
    return grid_.center();
}

I128 BucketRegistry::get_bucket_width() const {
    std::shared_lock lock(mutex_);
    return grid_.width();
}

BucketGrid BucketRegistry::grid() const {
    std::shared_lock lock(mutex_);
    return grid_;
}

uint64_t BucketRegistry::epoch() const {
    std::shared_lock lock(mutex_);
    return epoch_;
}

GridSnapshot BucketRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return GridSnapshot{grid_, epoch_};
}

std::optional<I128> BucketRegistry::get_spot_price() const {
    return spot_.get_spot_price();
}

bool BucketRegistry::is_oracle_fresh() const {
    return spot_.is_oracle_fresh();
}

bool BucketRegistry::needs_rebalance() const {
    auto spot = spot_.get_spot_price();
    if (!spot) return false;

    std::shared_lock lock(mutex_);
    I128 deviation = x18::abs(*spot - grid_.center());
    return deviation > x18::mul(rebalance_threshold_x18_, grid_.center());
}

std::optional<BucketGrid> BucketRegistry::preview_recenter(I128 new_center_x18) const {
    std::shared_lock lock(mutex_);
    return BucketGrid::create(new_center_x18, grid_.width(), grid_.num_regular());
}

int32_t BucketRegistry::recenter(I128 new_center_x18) {
    auto old_center = commit_recenter(new_center_x18);
    if (!old_center) {
        return errors::INVALID_GEOMETRY;
    }

    IEngineListener* current = listener();
    if (current) {
        current->on_grid_recentered(*old_center, new_center_x18);
    }
    return errors::OK;
}

std::optional<I128> BucketRegistry::commit_recenter(I128 new_center_x18) {
    std::unique_lock lock(mutex_);

    auto next = BucketGrid::create(new_center_x18, grid_.width(), grid_.num_regular());
    if (!next) return std::nullopt;

    I128 old_center = grid_.center();
    grid_ = *next;
    ++epoch_;
    return old_center;
}

void BucketRegistry::set_listener(IEngineListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

IEngineListener* BucketRegistry::listener() const {
    std::shared_lock lock(mutex_);
    return listener_;
}

} // namespace clum
