#ifndef CLUM_SPOT_SOURCE_HPP
#define CLUM_SPOT_SOURCE_HPP

#include <optional>
#include <shared_mutex>

#include "types.hpp"

namespace clum {

// =============================================================================
// Spot Price Source Interface
// =============================================================================
//
// The core treats spot as a black box; freshness is the source's concern.
//

class ISpotPriceSource {
public:
    virtual ~ISpotPriceSource() = default;

    // Latest spot price (X18), nullopt if the source has none
    virtual std::optional<I128> get_spot_price() const = 0;

    virtual bool is_oracle_fresh() const = 0;
};

// =============================================================================
// StaticPriceSource - settable in-process source with a staleness window
// =============================================================================

class StaticPriceSource : public ISpotPriceSource {
public:
    // max_staleness of 0 disables the staleness check
    explicit StaticPriceSource(uint64_t max_staleness = 0);
    StaticPriceSource(I128 price_x18, uint64_t max_staleness = 0);

    // timestamp 0 = now
    int32_t set_price(I128 price_x18, uint64_t timestamp = 0);
    void clear();

    std::optional<I128> get_spot_price() const override;
    bool is_oracle_fresh() const override;

    uint64_t price_age() const;
    uint64_t max_staleness() const { return max_staleness_; }

private:
    uint64_t max_staleness_;
    std::optional<I128> price_x18_;
    uint64_t updated_at_{0};
    mutable std::shared_mutex mutex_;

    uint64_t current_timestamp() const;
};

} // namespace clum

#endif // CLUM_SPOT_SOURCE_HPP
