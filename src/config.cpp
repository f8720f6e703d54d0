// =============================================================================
// config.cpp - JSON configuration loading
// =============================================================================

#include "clum/config.hpp"
#include "clum/fixed_point.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

namespace clum::config {

using json = nlohmann::json;

namespace {

// Decimal from a JSON string ("1500.25") or number
I128 read_decimal(const json& j, const std::string& key) {
    try {
        if (j.is_string()) {
            return x18::from_string(j.get<std::string>());
        }
        if (j.is_number_integer()) {
            return x18::from_int(j.get<int64_t>());
        }
        if (j.is_number()) {
            return x18::from_double(j.get<double>());
        }
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid decimal for '" + key + "': " + e.what());
    }
    throw std::runtime_error("Expected decimal for '" + key + "'");
}

uint64_t read_uint(const json& j, const std::string& key) {
    if (!j.is_number_unsigned() && !(j.is_number_integer() && j.get<int64_t>() >= 0)) {
        throw std::runtime_error("Expected non-negative integer for '" + key + "'");
    }
    return j.get<uint64_t>();
}

void read_decimal_if(const json& section, const char* name, const std::string& prefix, I128& out) {
    if (section.contains(name)) out = read_decimal(section.at(name), prefix + name);
}

template <typename T>
void read_uint_if(const json& section, const char* name, const std::string& prefix, T& out) {
    if (!section.contains(name)) return;
    uint64_t value = read_uint(section.at(name), prefix + name);
    if (value > std::numeric_limits<T>::max()) {
        throw std::runtime_error("Value out of range for '" + prefix + name + "'");
    }
    out = static_cast<T>(value);
}

const json& section_of(const json& j, const char* name) {
    static const json empty = json::object();
    if (!j.contains(name)) return empty;
    const json& s = j.at(name);
    if (!s.is_object()) {
        throw std::runtime_error(std::string("Section '") + name + "' must be an object");
    }
    return s;
}

PriorShape parse_prior_shape(const json& j) {
    if (!j.is_string()) throw std::runtime_error("Expected string for 'engine.prior_shape'");
    std::string s = j.get<std::string>();
    if (s == "uniform") return PriorShape::UNIFORM;
    if (s == "gaussian") return PriorShape::GAUSSIAN;
    throw std::runtime_error("Unknown prior shape for 'engine.prior_shape': " + s);
}

} // namespace

SystemConfig defaults() {
    SystemConfig config;
    config.grid.center_price_x18 = x18::from_int(3000);
    config.grid.bucket_width_x18 = x18::from_int(100);
    config.grid.num_regular = 20;
    config.grid.rebalance_threshold_x18 = X18_ONE / 10;
    config.subsidy_x18 = x18::from_int(10000);
    config.arbitrage_tolerance_x18 = X18_ONE / 1000000;
    return config;
}

SystemConfig load_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

SystemConfig load_json(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Config parse error: ") + e.what());
    }
    return from_json(j);
}

SystemConfig from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }
    SystemConfig config = defaults();

    const json& grid = section_of(j, "grid");
    read_decimal_if(grid, "center_price", "grid.", config.grid.center_price_x18);
    read_decimal_if(grid, "bucket_width", "grid.", config.grid.bucket_width_x18);
    read_uint_if(grid, "num_regular", "grid.", config.grid.num_regular);
    read_decimal_if(grid, "rebalance_threshold", "grid.", config.grid.rebalance_threshold_x18);

    const json& engine = section_of(j, "engine");
    read_decimal_if(engine, "subsidy", "engine.", config.subsidy_x18);
    read_decimal_if(engine, "liquidity", "engine.", config.engine.liquidity_x18);
    read_decimal_if(engine, "fee", "engine.", config.engine.fee_x18);
    read_decimal_if(engine, "max_quantity", "engine.", config.engine.max_quantity_x18);
    if (engine.contains("prior_shape")) {
        config.engine.prior_shape = parse_prior_shape(engine.at("prior_shape"));
    }
    read_decimal_if(engine, "prior_sigma_buckets", "engine.", config.engine.prior_sigma_buckets_x18);
    read_decimal_if(engine, "prior_floor", "engine.", config.engine.prior_floor_x18);
    read_decimal_if(engine, "cost_tolerance", "engine.", config.engine.cost_tolerance_x18);
    read_decimal_if(engine, "simplex_tolerance", "engine.", config.engine.simplex_tolerance_x18);
    read_uint_if(engine, "max_batch_trades", "engine.", config.engine.max_batch_trades);

    const json& funding = section_of(j, "funding");
    read_decimal_if(funding, "premium_factor", "funding.", config.funding.premium_factor_x18);
    read_uint_if(funding, "funding_period", "funding.", config.funding.funding_period);
    read_decimal_if(funding, "max_funding_rate_per_second", "funding.",
                    config.funding.max_funding_rate_per_second_x18);

    const json& oracle = section_of(j, "oracle");
    read_decimal_if(oracle, "initial_price", "oracle.", config.oracle.initial_price_x18);
    read_uint_if(oracle, "max_staleness", "oracle.", config.oracle.max_staleness);

    const json& arbitrage = section_of(j, "arbitrage");
    read_decimal_if(arbitrage, "tolerance", "arbitrage.", config.arbitrage_tolerance_x18);

    return config;
}

json to_json(const SystemConfig& config) {
    json j;
    j["grid"] = {
        {"center_price", x18::to_string(config.grid.center_price_x18)},
        {"bucket_width", x18::to_string(config.grid.bucket_width_x18)},
        {"num_regular", config.grid.num_regular},
        {"rebalance_threshold", x18::to_string(config.grid.rebalance_threshold_x18)}
    };
    j["engine"] = {
        {"subsidy", x18::to_string(config.subsidy_x18)},
        {"liquidity", x18::to_string(config.engine.liquidity_x18)},
        {"fee", x18::to_string(config.engine.fee_x18)},
        {"max_quantity", x18::to_string(config.engine.max_quantity_x18)},
        {"prior_shape", config.engine.prior_shape == PriorShape::UNIFORM ? "uniform" : "gaussian"},
        {"prior_sigma_buckets", x18::to_string(config.engine.prior_sigma_buckets_x18)},
        {"prior_floor", x18::to_string(config.engine.prior_floor_x18)},
        {"cost_tolerance", x18::to_string(config.engine.cost_tolerance_x18)},
        {"simplex_tolerance", x18::to_string(config.engine.simplex_tolerance_x18)},
        {"max_batch_trades", config.engine.max_batch_trades}
    };
    j["funding"] = {
        {"premium_factor", x18::to_string(config.funding.premium_factor_x18)},
        {"funding_period", config.funding.funding_period},
        {"max_funding_rate_per_second", x18::to_string(config.funding.max_funding_rate_per_second_x18)}
    };
    j["oracle"] = {
        {"initial_price", x18::to_string(config.oracle.initial_price_x18)},
        {"max_staleness", config.oracle.max_staleness}
    };
    j["arbitrage"] = {
        {"tolerance", x18::to_string(config.arbitrage_tolerance_x18)}
    };
    return j;
}

int32_t validate(const SystemConfig& config) {
    if (!BucketGrid::create(config.grid.center_price_x18, config.grid.bucket_width_x18,
                            config.grid.num_regular)) {
        return errors::INVALID_GEOMETRY;
    }
    if (config.grid.rebalance_threshold_x18 < 0) return errors::INVALID_CONFIG;

    const EngineConfig& e = config.engine;
    if (config.subsidy_x18 <= 0) return errors::INVALID_CONFIG;
    if (e.liquidity_x18 < 0 || e.max_quantity_x18 <= 0) return errors::INVALID_CONFIG;
    if (e.fee_x18 < 0 || e.fee_x18 >= X18_ONE) return errors::INVALID_CONFIG;
    if (e.prior_sigma_buckets_x18 < 0) return errors::INVALID_CONFIG;
    if (e.prior_floor_x18 <= 0 || e.prior_floor_x18 > X18_ONE) return errors::INVALID_CONFIG;
    if (e.cost_tolerance_x18 < 0 || e.simplex_tolerance_x18 < 0) return errors::INVALID_CONFIG;
    if (e.max_batch_trades == 0) return errors::INVALID_CONFIG;

    if (config.funding.funding_period == 0) return errors::INVALID_CONFIG;
    if (config.funding.premium_factor_x18 < 0 ||
        config.funding.max_funding_rate_per_second_x18 < 0) {
        return errors::INVALID_CONFIG;
    }
    if (config.oracle.initial_price_x18 < 0) return errors::INVALID_CONFIG;
    if (config.arbitrage_tolerance_x18 < 0) return errors::INVALID_CONFIG;
    return errors::OK;
}

} // namespace clum::config
