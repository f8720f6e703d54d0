// CLUM CLI
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Interactive driver for the pricing core. Builds a registry, engine,
// funding deriver and arbitrage guard from a JSON config, then reads
// commands from stdin and prints results and engine events as JSON lines.

#include "clum/arbitrage.hpp"
#include "clum/config.hpp"
#include "clum/engine.hpp"
#include "clum/fixed_point.hpp"
#include "clum/funding.hpp"
#include "clum/solver.hpp"
#include "clum/spot_source.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace clum;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct CliConfig {
    std::string config_path;
    bool verbose = false;
};

// The CLI acts as both owner and option manager
const Address OWNER = address_from_id(1);
const Address MANAGER = address_from_id(2);

//------------------------------------------------------------------------------
// Event Printer
//------------------------------------------------------------------------------

class JsonEventPrinter : public IEngineListener {
public:
    void on_grid_recentered(I128 old_center_x18, I128 new_center_x18) override {
        std::cout << json{{"event", "grid_recentered"},
                          {"old_center", x18::to_string(old_center_x18)},
                          {"new_center", x18::to_string(new_center_x18)}}.dump() << "\n";
    }

    void on_trade_executed(const TradeRecord& trade) override {
        std::cout << json{{"event", "trade_executed"},
                          {"id", trade.id},
                          {"type", trade.option_type == OptionType::CALL ? "call" : "put"},
                          {"side", trade.side == TradeSide::BUY ? "buy" : "sell"},
                          {"strike", x18::to_string(trade.strike_x18)},
                          {"size", x18::to_string(trade.size_x18)},
                          {"cost", x18::to_string(trade.cost_x18)},
                          {"fee", x18::to_string(trade.fee_x18)}}.dump() << "\n";
    }

    void on_cost_updated(I128 old_cost_x18, I128 new_cost_x18) override {
        std::cout << json{{"event", "cost_updated"},
                          {"old_cost", x18::to_string(old_cost_x18)},
                          {"new_cost", x18::to_string(new_cost_x18)}}.dump() << "\n";
    }
};

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

OptionType parse_option_type(const std::string& s) {
    if (s == "call") return OptionType::CALL;
    if (s == "put") return OptionType::PUT;
    throw std::invalid_argument("option type must be 'call' or 'put'");
}

json decimals(const std::vector<I128>& values) {
    json arr = json::array();
    for (I128 v : values) arr.push_back(x18::to_string(v));
    return arr;
}

json status_json(int32_t status) {
    return json{{"status", status}, {"error", error_name(status)}};
}

void print(const json& j) {
    std::cout << j.dump() << "\n";
}

//------------------------------------------------------------------------------
// Session
//------------------------------------------------------------------------------

class Session {
public:
    explicit Session(const SystemConfig& config)
        : config_(config)
        , spot_(config.oracle.max_staleness)
        , registry_(config.grid, spot_)
        , engine_(registry_, config.engine, OWNER)
        , funding_(engine_, registry_, config.funding)
        , guard_(engine_, config.arbitrage_tolerance_x18)
    {
        if (config.oracle.initial_price_x18 > 0) {
            int32_t status = spot_.set_price(config.oracle.initial_price_x18);
            if (status != errors::OK) {
                throw std::runtime_error(std::string("Initial price rejected: ") + error_name(status));
            }
        }
        registry_.set_listener(&printer_);
        engine_.set_listener(&printer_);

        int32_t status = engine_.initialize(OWNER, config.subsidy_x18);
        if (status == errors::OK) status = engine_.set_option_manager(OWNER, MANAGER);
        if (status != errors::OK) {
            throw std::runtime_error(std::string("Engine initialization failed: ") + error_name(status));
        }
    }

    // Returns false on quit
    bool handle(const std::vector<std::string>& parts) {
        std::string cmd = parts[0];
        for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (cmd == "quit" || cmd == "exit") return false;
        if (cmd == "help") {
            print_help();
        } else if (cmd == "spot") {
            require(parts, 2, "spot <price>");
            print(status_json(spot_.set_price(x18::from_string(parts[1]))));
        } else if (cmd == "quote_buy" || cmd == "quote_sell") {
            require(parts, 4, cmd + " <call|put> <strike> <size>");
            OptionType type = parse_option_type(parts[1]);
            I128 strike = x18::from_string(parts[2]);
            I128 size = x18::from_string(parts[3]);
            QuoteResult q = cmd == "quote_buy" ? engine_.quote_buy(type, strike, size)
                                               : engine_.quote_sell(type, strike, size);
            json out = status_json(q.status);
            out["amount"] = x18::to_string(q.amount_x18);
            out["fee"] = x18::to_string(q.fee_x18);
            print(out);
        } else if (cmd == "buy" || cmd == "sell") {
            require(parts, 4, cmd + " <call|put> <strike> <size>");
            OptionType type = parse_option_type(parts[1]);
            I128 strike = x18::from_string(parts[2]);
            I128 size = x18::from_string(parts[3]);
            TradeResult r = cmd == "buy" ? engine_.execute_buy(MANAGER, type, strike, size)
                                         : engine_.execute_sell(MANAGER, type, strike, size);
            print(status_json(r.status));
        } else if (cmd == "propose") {
            require(parts, 5, "propose <buy|sell> <call|put> <strike> <size>");
            TradeSide side = parts[1] == "sell" ? TradeSide::SELL : TradeSide::BUY;
            TradeIntent trade{parse_option_type(parts[2]), side,
                              x18::from_string(parts[3]), x18::from_string(parts[4])};
            submit_proposal({trade});
        } else if (cmd == "refresh") {
            submit_proposal({});
        } else if (cmd == "prices" || cmd == "distribution") {
            ImpliedDistribution dist = engine_.get_implied_distribution();
            print(json{{"midpoints", decimals(dist.midpoints)},
                       {"probabilities", decimals(dist.probabilities)}});
        } else if (cmd == "funding") {
            require(parts, 4, "funding <call|put> <strike> <size>");
            auto quote = funding_.get_funding_quote(parse_option_type(parts[1]),
                                                    x18::from_string(parts[2]),
                                                    x18::from_string(parts[3]));
            if (!quote) {
                print(status_json(errors::PRICE_UNAVAILABLE));
            } else {
                print(json{{"mark", x18::to_string(quote->mark_price_x18)},
                           {"intrinsic", x18::to_string(quote->intrinsic_value_x18)},
                           {"time_value", x18::to_string(quote->time_value_x18)},
                           {"funding_per_second", x18::to_string(quote->funding_per_second_x18)},
                           {"funding_per_day_usdc", x18::raw_to_string(quote->funding_per_day_usdc)}});
            }
        } else if (cmd == "check") {
            require(parts, 5, "check <buy|sell> <call|put> <strike> <size>");
            bool ok = guard_.validate_trade(parse_option_type(parts[2]), x18::from_string(parts[3]),
                                            x18::from_string(parts[4]), parts[1] != "sell");
            print(json{{"arbitrage_free", ok}});
        } else if (cmd == "recenter") {
            require(parts, 2, "recenter <price>");
            print(status_json(engine_.recenter(OWNER, x18::from_string(parts[1]))));
        } else if (cmd == "rebalance") {
            print(status_json(engine_.rebalance()));
        } else if (cmd == "state") {
            EngineState s = engine_.state();
            print(json{{"quantities", decimals(s.quantities)},
                       {"cached_cost", x18::to_string(s.cached_cost_x18)},
                       {"grid_epoch", s.grid_epoch},
                       {"center", x18::to_string(registry_.get_center_price())},
                       {"worst_case_loss", x18::to_string(engine_.worst_case_loss())}});
        } else if (cmd == "stats") {
            auto stats = engine_.get_stats();
            print(json{{"trades", stats.total_trades},
                       {"cost_updates", stats.total_cost_updates},
                       {"recenters", stats.total_recenters},
                       {"rejections", stats.total_rejections}});
        } else if (cmd == "config") {
            print(config::to_json(config_));
        } else {
            print(json{{"error", "unknown command: " + cmd}});
        }
        return true;
    }

private:
    SystemConfig config_;
    StaticPriceSource spot_;
    BucketRegistry registry_;
    ClumEngine engine_;
    FundingDeriver funding_;
    ArbitrageGuard guard_;
    JsonEventPrinter printer_;

    static void require(const std::vector<std::string>& parts, size_t n, const std::string& usage) {
        if (parts.size() < n) {
            throw std::invalid_argument("usage: " + usage);
        }
    }

    void submit_proposal(const std::vector<TradeIntent>& trades) {
        auto ctx = engine_.verification_context();
        if (!ctx) {
            print(status_json(errors::GRID_OUT_OF_SYNC));
            return;
        }
        CostSolver solver(*ctx);
        CostProposal proposal = solver.propose(engine_.state(), trades);
        VerifyResult result = engine_.verify_and_set_cost(MANAGER, proposal);
        json out = status_json(result.status);
        out["proposed_cost"] = x18::to_string(proposal.proposed_cost_x18);
        out["lower_bound"] = x18::to_string(result.bounds.lower_x18);
        out["upper_bound"] = x18::to_string(result.bounds.upper_x18);
        print(out);
    }

    static void print_help() {
        std::cout << "Commands:\n"
                  << "  spot <price>                               Set spot price\n"
                  << "  quote_buy|quote_sell <call|put> <K> <size> Quote a trade\n"
                  << "  buy|sell <call|put> <K> <size>             Execute a trade\n"
                  << "  propose <buy|sell> <call|put> <K> <size>   Solve and verify off-path\n"
                  << "  refresh                                    Re-verify current cost\n"
                  << "  prices                                     Implied distribution\n"
                  << "  funding <call|put> <K> <size>              Funding quote\n"
                  << "  check <buy|sell> <call|put> <K> <size>     Arbitrage check\n"
                  << "  recenter <price> | rebalance               Grid maintenance\n"
                  << "  state | stats | config\n"
                  << "  quit\n";
    }
};

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "CLUM pricing core CLI\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <path>  JSON config file (default: built-in defaults)\n"
              << "  -v, --verbose        Print the effective config on start\n"
              << "  -h, --help           Show this help message\n";
}

CliConfig parse_args(int argc, char* argv[]) {
    CliConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path\n";
                std::exit(1);
            }
            config.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return config;
}

int main(int argc, char* argv[]) {
    CliConfig cli = parse_args(argc, argv);

    SystemConfig system_config;
    try {
        system_config = cli.config_path.empty() ? config::defaults()
                                                : config::load_file(cli.config_path);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    int32_t status = config::validate(system_config);
    if (status != errors::OK) {
        std::cerr << "Invalid config: " << error_name(status) << "\n";
        return 1;
    }
    if (cli.verbose) {
        std::cout << config::to_json(system_config).dump(2) << "\n";
    }

    try {
        Session session(system_config);
        std::string line;
        while (std::getline(std::cin, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;
            try {
                if (!session.handle(split(line))) break;
            } catch (const std::invalid_argument& e) {
                print(json{{"error", e.what()}});
            } catch (const NumericOverflow& e) {
                print(json{{"error", e.what()}});
            }
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
