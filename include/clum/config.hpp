#ifndef CLUM_CONFIG_HPP
#define CLUM_CONFIG_HPP

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "bucket_registry.hpp"
#include "engine.hpp"
#include "funding.hpp"

namespace clum {

// Spot source settings
struct OracleConfig {
    I128 initial_price_x18 = 0;      // 0 leaves the source empty
    uint64_t max_staleness = 3600;   // Seconds; 0 disables the freshness check
};

struct SystemConfig {
    GridConfig grid;
    EngineConfig engine;
    FundingParams funding;
    OracleConfig oracle;
    I128 subsidy_x18;
    I128 arbitrage_tolerance_x18;
};

namespace config {

// 3000 center, 100 width, 20 regular buckets, 10% threshold, 10000 subsidy
SystemConfig defaults();

// Throw std::runtime_error naming the offending key on malformed input.
// Missing sections and keys keep their defaults.
SystemConfig load_file(std::string_view path);
SystemConfig load_json(std::string_view text);
SystemConfig from_json(const nlohmann::json& j);

nlohmann::json to_json(const SystemConfig& config);

// errors::OK or errors::INVALID_CONFIG / INVALID_GEOMETRY
int32_t validate(const SystemConfig& config);

} // namespace config

} // namespace clum

#endif // CLUM_CONFIG_HPP
