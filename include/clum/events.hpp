#ifndef CLUM_EVENTS_HPP
#define CLUM_EVENTS_HPP

#include <cstdint>

#include "types.hpp"

namespace clum {

// Record of one executed trade
struct TradeRecord {
    uint64_t id;
    OptionType option_type;
    TradeSide side;
    I128 strike_x18;
    I128 size_x18;
    I128 cost_x18;      // Paid by buyer / received by seller, fee included
    I128 fee_x18;
    I128 cached_cost_after_x18;
};

// Callback interface for engine notifications
class IEngineListener {
public:
    virtual ~IEngineListener() = default;
    virtual void on_grid_recentered(I128 old_center_x18, I128 new_center_x18) = 0;
    virtual void on_trade_executed(const TradeRecord& trade) = 0;
    virtual void on_cost_updated(I128 old_cost_x18, I128 new_cost_x18) = 0;
};

// No-op listener for when notifications aren't needed
class NullListener : public IEngineListener {
public:
    void on_grid_recentered(I128, I128) override {}
    void on_trade_executed(const TradeRecord&) override {}
    void on_cost_updated(I128, I128) override {}
};

} // namespace clum

#endif // CLUM_EVENTS_HPP
