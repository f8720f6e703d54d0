#ifndef CLUM_BUCKET_REGISTRY_HPP
#define CLUM_BUCKET_REGISTRY_HPP

#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "types.hpp"
#include "events.hpp"
#include "spot_source.hpp"

namespace clum {

// =============================================================================
// Grid Configuration
// =============================================================================

struct GridConfig {
    I128 center_price_x18;
    I128 bucket_width_x18;
    uint32_t num_regular;             // Regular buckets; two tails are added
    I128 rebalance_threshold_x18;     // Fraction of center, e.g. 0.1 = 10%
};

// =============================================================================
// BucketGrid - immutable geometry value
// =============================================================================
//
// Bucket 0 is the lower tail [0, lower_edge), buckets 1..num_regular are
// [lower_edge + (i-1)*width, lower_edge + i*width), and the last bucket is
// the upper tail [upper_edge, +inf).
//

class BucketGrid {
public:
    BucketGrid() = default;

    // Returns nullopt if the geometry is invalid (non-positive lower edge,
    // upper edge beyond MAX_PRICE_X18, zero width or zero regular buckets)
    static std::optional<BucketGrid> create(I128 center_x18, I128 width_x18,
                                            uint32_t num_regular);

    size_t num_buckets() const { return static_cast<size_t>(num_regular_) + 2; }
    uint32_t num_regular() const { return num_regular_; }

    I128 center() const { return center_x18_; }
    I128 width() const { return width_x18_; }
    I128 lower_edge() const { return lower_edge_x18_; }
    I128 upper_edge() const { return upper_edge_x18_; }

    size_t bucket_index(I128 price_x18) const;
    std::pair<I128, I128> bucket_bounds(size_t index) const;
    I128 bucket_midpoint(size_t index) const;
    std::vector<I128> midpoints() const;

    bool operator==(const BucketGrid& other) const {
        return center_x18_ == other.center_x18_ &&
               width_x18_ == other.width_x18_ &&
               num_regular_ == other.num_regular_;
    }

private:
    I128 center_x18_{0};
    I128 width_x18_{0};
    uint32_t num_regular_{0};
    I128 lower_edge_x18_{0};
    I128 upper_edge_x18_{0};
};

// Exposure migration between grids of equal size: each old bucket's
// quantity moves to the new bucket containing the old midpoint.
// Pure and total; the sum of quantities is conserved exactly.
std::vector<I128> remap_quantities(const BucketGrid& old_grid,
                                   const std::vector<I128>& old_quantities,
                                   const BucketGrid& new_grid);

// Geometry paired with the epoch it was read at
struct GridSnapshot {
    BucketGrid grid;
    uint64_t epoch;
};

// =============================================================================
// BucketRegistry - discretized outcome space keyed to a spot source
// =============================================================================

class BucketRegistry {
public:
    // Throws std::invalid_argument if the initial geometry is invalid
    BucketRegistry(const GridConfig& config, const ISpotPriceSource& spot);
    ~BucketRegistry() = default;

    // Non-copyable
    BucketRegistry(const BucketRegistry&) = delete;
    BucketRegistry& operator=(const BucketRegistry&) = delete;

    // =========================================================================
    // Geometry Queries
    // =========================================================================

    size_t num_buckets() const;
    I128 get_bucket_midpoint(size_t index) const;
    std::pair<I128, I128> get_bucket_bounds(size_t index) const;
    size_t get_bucket_index(I128 price_x18) const;
    I128 get_center_price() const;
    I128 get_bucket_width() const;
    I128 get_rebalance_threshold() const { return rebalance_threshold_x18_; }

    // Snapshot of the current geometry and its epoch
    BucketGrid grid() const;
    uint64_t epoch() const;
    GridSnapshot snapshot() const;

    // =========================================================================
    // Spot & Rebalancing
    // =========================================================================

    std::optional<I128> get_spot_price() const;
    bool is_oracle_fresh() const;

    // True when |spot - center| > threshold * center
    bool needs_rebalance() const;

    // =========================================================================
    // Recenter
    // =========================================================================

    // Geometry for new_center with the current width, or nullopt if invalid
    std::optional<BucketGrid> preview_recenter(I128 new_center_x18) const;

    // Commits new geometry, advances the epoch and notifies the listener.
    // Callers holding per-bucket state must remap it first (see
    // ClumEngine::recenter).
    int32_t recenter(I128 new_center_x18);

    // Same commit without the notification; returns the previous center,
    // or nullopt if the geometry is invalid. The caller notifies once its
    // own state is consistent with the new grid.
    std::optional<I128> commit_recenter(I128 new_center_x18);

    void set_listener(IEngineListener* listener);
    IEngineListener* listener() const;

private:
    const ISpotPriceSource& spot_;
    I128 rebalance_threshold_x18_;

    BucketGrid grid_;
    uint64_t epoch_{0};
    IEngineListener* listener_{nullptr};
    mutable std::shared_mutex mutex_;
};

} // namespace clum

#endif // CLUM_BUCKET_REGISTRY_HPP
