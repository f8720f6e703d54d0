#ifndef CLUM_FUNDING_HPP
#define CLUM_FUNDING_HPP

#include <optional>

#include "types.hpp"
#include "engine.hpp"
#include "bucket_registry.hpp"

namespace clum {

// =============================================================================
// Funding Parameters
// =============================================================================

struct FundingParams {
    I128 premium_factor_x18 = X18_ONE;                   // Fraction of premium paid per period
    uint64_t funding_period = 86400;                     // Seconds (1 day)
    I128 max_funding_rate_per_second_x18 = X18_ONE / 86400;  // Cap per unit size
};

// All funding figures for one position
struct FundingQuote {
    I128 mark_price_x18;
    I128 intrinsic_value_x18;
    I128 time_value_x18;
    I128 funding_per_second_x18;
    I128 funding_per_second_usdc;     // 6 decimals
    I128 funding_per_day_usdc;
};

// =============================================================================
// FundingDeriver - mark price and funding for perpetual option positions
// =============================================================================
//
// mark      = sum_i p_i * payoff(midpoint_i)
// intrinsic = payoff(spot)
// funding   = clamp((mark - intrinsic) * premium_factor / period, 0, max) * size
//

class FundingDeriver {
public:
    // Throws std::invalid_argument on a zero period or negative factors
    FundingDeriver(const ClumEngine& engine, const BucketRegistry& registry,
                   const FundingParams& params = {});

    // nullopt when the engine is not initialized or strike is invalid
    std::optional<I128> get_mark_price(OptionType type, I128 strike_x18) const;

    // nullopt when spot is unavailable
    std::optional<I128> get_intrinsic_value(OptionType type, I128 strike_x18) const;

    // mark - intrinsic, floored at zero
    std::optional<I128> get_time_value(OptionType type, I128 strike_x18) const;

    std::optional<I128> get_funding_per_second(OptionType type, I128 strike_x18,
                                               I128 size_x18) const;
    std::optional<I128> funding_per_second_usdc(OptionType type, I128 strike_x18,
                                                I128 size_x18) const;
    std::optional<I128> accrued_funding_usdc(OptionType type, I128 strike_x18,
                                             I128 size_x18, uint64_t elapsed_seconds) const;

    std::optional<FundingQuote> get_funding_quote(OptionType type, I128 strike_x18,
                                                  I128 size_x18) const;

    // premium_factor / funding_period
    I128 rate_factor() const;
    const FundingParams& params() const { return params_; }

private:
    const ClumEngine& engine_;
    const BucketRegistry& registry_;
    FundingParams params_;

    I128 funding_rate(I128 mark_x18, I128 intrinsic_x18) const;
};

} // namespace clum

#endif // CLUM_FUNDING_HPP
