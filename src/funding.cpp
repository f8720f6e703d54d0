// =============================================================================
// funding.cpp - Mark price, intrinsic value and funding rate
// =============================================================================

#include "clum/funding.hpp"
#include "clum/fixed_point.hpp"
#include <algorithm>
#include <stdexcept>

namespace clum {

namespace {

constexpr uint64_t SECONDS_PER_DAY = 86400;

} // namespace

FundingDeriver::FundingDeriver(const ClumEngine& engine, const BucketRegistry& registry,
                               const FundingParams& params)
    : engine_(engine), registry_(registry), params_(params) {
    if (params.funding_period == 0) {
        throw std::invalid_argument("FundingDeriver: zero funding period");
    }
    if (params.premium_factor_x18 < 0 || params.max_funding_rate_per_second_x18 < 0) {
        throw std::invalid_argument("FundingDeriver: negative funding parameter");
    }
}

I128 FundingDeriver::rate_factor() const {
    return params_.premium_factor_x18 / static_cast<I128>(params_.funding_period);
}

std::optional<I128> FundingDeriver::get_mark_price(OptionType type, I128 strike_x18) const {
    if (!is_valid_option_type(type) || strike_x18 <= 0) return std::nullopt;

    try {
        ImpliedDistribution dist = engine_.get_implied_distribution();
        if (dist.probabilities.size() != dist.midpoints.size()) return std::nullopt;

        I128 mark = 0;
        for (size_t i = 0; i < dist.midpoints.size(); ++i) {
            I128 payoff = option_payoff(type, dist.midpoints[i], strike_x18);
            if (payoff == 0) continue;
            mark = x18::add(mark, x18::mul(dist.probabilities[i], payoff));
        }
        return mark;
    } catch (const NumericOverflow&) {
        return std::nullopt;
    }
}

std::optional<I128> FundingDeriver::get_intrinsic_value(OptionType type, I128 strike_x18) const {
    if (!is_valid_option_type(type) || strike_x18 <= 0) return std::nullopt;
    auto spot = registry_.get_spot_price();
    if (!spot) return std::nullopt;
    return option_payoff(type, *spot, strike_x18);
}

std::optional<I128> FundingDeriver::get_time_value(OptionType type, I128 strike_x18) const {
    auto mark = get_mark_price(type, strike_x18);
    auto intrinsic = get_intrinsic_value(type, strike_x18);
    if (!mark || !intrinsic) return std::nullopt;
    return std::max<I128>(*mark - *intrinsic, 0);
}

I128 FundingDeriver::funding_rate(I128 mark_x18, I128 intrinsic_x18) const {
    I128 premium = mark_x18 - intrinsic_x18;
    if (premium <= 0) return 0;
    I128 rate = x18::mul_div(premium, params_.premium_factor_x18,
                             X18_ONE * static_cast<I128>(params_.funding_period));
    return std::min(rate, params_.max_funding_rate_per_second_x18);
}

std::optional<I128> FundingDeriver::get_funding_per_second(OptionType type, I128 strike_x18,
                                                           I128 size_x18) const {
    if (size_x18 <= 0) return std::nullopt;
    auto mark = get_mark_price(type, strike_x18);
    auto intrinsic = get_intrinsic_value(type, strike_x18);
    if (!mark || !intrinsic) return std::nullopt;

    try {
        return x18::mul(funding_rate(*mark, *intrinsic), size_x18);
    } catch (const NumericOverflow&) {
        return std::nullopt;
    }
}

std::optional<I128> FundingDeriver::funding_per_second_usdc(OptionType type, I128 strike_x18,
                                                            I128 size_x18) const {
    auto funding = get_funding_per_second(type, strike_x18, size_x18);
    if (!funding) return std::nullopt;
    return x18::to_usdc(*funding);
}

std::optional<I128> FundingDeriver::accrued_funding_usdc(OptionType type, I128 strike_x18,
                                                         I128 size_x18,
                                                         uint64_t elapsed_seconds) const {
    auto funding = get_funding_per_second(type, strike_x18, size_x18);
    if (!funding) return std::nullopt;

    I128 accrued;
    if (__builtin_mul_overflow(*funding, static_cast<I128>(elapsed_seconds), &accrued)) {
        return std::nullopt;
    }
    return x18::to_usdc(accrued);
}

std::optional<FundingQuote> FundingDeriver::get_funding_quote(OptionType type, I128 strike_x18,
                                                              I128 size_x18) const {
    auto mark = get_mark_price(type, strike_x18);
    auto intrinsic = get_intrinsic_value(type, strike_x18);
    if (!mark || !intrinsic || size_x18 <= 0) return std::nullopt;

    FundingQuote quote;
    quote.mark_price_x18 = *mark;
    quote.intrinsic_value_x18 = *intrinsic;
    quote.time_value_x18 = std::max<I128>(*mark - *intrinsic, 0);
    try {
        quote.funding_per_second_x18 = x18::mul(funding_rate(*mark, *intrinsic), size_x18);
    } catch (const NumericOverflow&) {
        return std::nullopt;
    }
    quote.funding_per_second_usdc = x18::to_usdc(quote.funding_per_second_x18);

    I128 per_day;
    if (__builtin_mul_overflow(quote.funding_per_second_x18, static_cast<I128>(SECONDS_PER_DAY),
                               &per_day)) {
        return std::nullopt;
    }
    quote.funding_per_day_usdc = x18::to_usdc(per_day);
    return quote;
}

} // namespace clum
