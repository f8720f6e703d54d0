// =============================================================================
// spot_source.cpp - In-process spot price source
// =============================================================================

#include "clum/spot_source.hpp"
#include <chrono>
#include <mutex>
#include <stdexcept>

namespace clum {

StaticPriceSource::StaticPriceSource(uint64_t max_staleness)
    : max_staleness_(max_staleness) {}

StaticPriceSource::StaticPriceSource(I128 price_x18, uint64_t max_staleness)
    : max_staleness_(max_staleness) {
    if (set_price(price_x18) != errors::OK) {
        throw std::invalid_argument("StaticPriceSource: price must be positive");
    }
}

int32_t StaticPriceSource::set_price(I128 price_x18, uint64_t timestamp) {
    if (price_x18 <= 0) {
        return errors::INVALID_PRICE;
    }
    if (timestamp == 0) {
        timestamp = current_timestamp();
    }

    std::unique_lock lock(mutex_);
    price_x18_ = price_x18;
    updated_at_ = timestamp;
    return errors::OK;
}

void StaticPriceSource::clear() {
    std::unique_lock lock(mutex_);
    price_x18_.reset();
    updated_at_ = 0;
}

std::optional<I128> StaticPriceSource::get_spot_price() const {
    std::shared_lock lock(mutex_);
    return price_x18_;
}

bool StaticPriceSource::is_oracle_fresh() const {
    std::shared_lock lock(mutex_);
    if (!price_x18_) return false;
    if (max_staleness_ == 0) return true;

    uint64_t now = current_timestamp();
    return now < updated_at_ || now - updated_at_ <= max_staleness_;
}

uint64_t StaticPriceSource::price_age() const {
    std::shared_lock lock(mutex_);
    uint64_t now = current_timestamp();
    return now > updated_at_ ? now - updated_at_ : 0;
}

uint64_t StaticPriceSource::current_timestamp() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace clum
