// mart-cli - Marketplace Scenario Runner
//
// Replays a JSON scenario (mints, balances, royalties, list/delist/buy/transfer
// steps, clock changes) against a Marketplace backed by the in-memory ledgers,
// then prints the event log as JSON.

#include <mart/bank.hpp>
#include <mart/config.hpp>
#include <mart/ledger.hpp>
#include <mart/log.hpp>
#include <mart/market.hpp>
#include <mart/royalty.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string scenario_path;
    bool verbose = false;
    bool quiet = false;
    bool pretty = true;
};

class ScenarioError : public std::runtime_error {
public:
    explicit ScenarioError(const std::string& msg) : std::runtime_error(msg) {}
};

//------------------------------------------------------------------------------
// Scenario Runner
//------------------------------------------------------------------------------

class Runner {
public:
    Runner(const mart::MarketConfig& config, const json& scenario)
        : config_(config)
        , royalties_(config.royalty.fee_denominator)
        , now_(scenario.value("now", mart::system_now())) {

        if (scenario.contains("accounts")) {
            for (const auto& [name, hex] : scenario["accounts"].items()) {
                auto addr = mart::addresses::from_hex(hex.get<std::string>());
                if (!addr) throw ScenarioError("accounts." + name + ": invalid address");
                accounts_[name] = *addr;
            }
        }
        accounts_["market"] = config_.market_address;

        int32_t status = config_.royalty.apply(royalties_);
        if (status != mart::errors::OK) {
            throw ScenarioError(std::string("default royalty rejected: ") + mart::errors::name(status));
        }

        market_ = std::make_unique<mart::Marketplace>(
            assets_, royalties_, native_, config_, [this]() { return now_; });

        setup(scenario);
    }

    // Returns the number of steps whose "expect" did not match
    int run(const json& steps) {
        int mismatches = 0;
        size_t index = 0;
        for (const auto& step : steps) {
            ++index;
            std::string op = step.at("op").get<std::string>();
            int32_t status = execute(op, step);

            std::string name = mart::errors::name(status);
            std::cout << "step " << index << " " << op << ": " << name;
            if (step.contains("expect")) {
                std::string expected = step["expect"].get<std::string>();
                if (expected != name) {
                    std::cout << " (expected " << expected << ")";
                    ++mismatches;
                }
            }
            std::cout << "\n";
        }
        return mismatches;
    }

    json report() const {
        json out;
        out["events"] = market_->events().to_json();

        json balances = json::object();
        for (const auto& [name, addr] : accounts_) {
            balances[name] = mart::amounts::to_string(native_.balance_of(addr));
        }
        out["native_balances"] = balances;

        json owners = json::object();
        for (auto id : asset_ids_) {
            auto owner = assets_.owner_of(id);
            owners[std::to_string(id)] = owner ? label(*owner) : "burned";
        }
        out["owners"] = owners;
        return out;
    }

private:
    mart::MarketConfig config_;
    mart::AssetLedger assets_;
    mart::RoyaltyRegistry royalties_;
    mart::NativeBank native_;
    std::map<std::string, std::unique_ptr<mart::TokenLedger>> tokens_;
    std::map<std::string, mart::Address> accounts_;
    std::vector<mart::AssetId> asset_ids_;
    mart::Timestamp now_;
    std::unique_ptr<mart::Marketplace> market_;

    mart::Address address(const json& value) const {
        std::string s = value.get<std::string>();
        auto it = accounts_.find(s);
        if (it != accounts_.end()) return it->second;
        auto addr = mart::addresses::from_hex(s);
        if (!addr) throw ScenarioError("unknown account '" + s + "'");
        return *addr;
    }

    std::string label(const mart::Address& addr) const {
        for (const auto& [name, a] : accounts_) {
            if (a == addr) return name;
        }
        return mart::addresses::to_hex(addr);
    }

    static mart::Amount amount(const json& value) {
        if (value.is_number_unsigned()) return value.get<uint64_t>();
        auto parsed = mart::amounts::from_string(value.get<std::string>());
        if (!parsed) throw ScenarioError("invalid amount '" + value.dump() + "'");
        return *parsed;
    }

    mart::Currency currency(const json& value) const {
        std::string s = value.get<std::string>();
        if (s == "native") return mart::NATIVE;
        auto it = tokens_.find(s);
        if (it != tokens_.end()) return it->second->currency();
        return mart::Currency{address(value)};
    }

    void setup(const json& scenario) {
        if (scenario.contains("native_balances")) {
            for (const auto& [name, value] : scenario["native_balances"].items()) {
                native_.credit(address(json(name)), amount(value));
            }
        }

        if (scenario.contains("tokens")) {
            for (const auto& token : scenario["tokens"]) {
                std::string symbol = token.at("symbol").get<std::string>();
                auto ledger = std::make_unique<mart::TokenLedger>(address(token.at("address")));
                if (token.contains("balances")) {
                    for (const auto& [name, value] : token["balances"].items()) {
                        ledger->mint(address(json(name)), amount(value));
                    }
                }
                if (token.contains("allowances")) {
                    for (const auto& a : token["allowances"]) {
                        ledger->approve(address(a.at("owner")), address(a.at("spender")),
                                        amount(a.at("amount")));
                    }
                }
                market_->register_token(ledger->currency(), ledger.get());
                tokens_[symbol] = std::move(ledger);
            }
        }

        if (scenario.contains("assets")) {
            for (const auto& asset : scenario["assets"]) {
                auto id = asset.at("id").get<mart::AssetId>();
                int32_t status = assets_.mint(address(asset.at("owner")), id);
                if (status != mart::errors::OK) {
                    throw ScenarioError("mint " + std::to_string(id) + ": " + mart::errors::name(status));
                }
                asset_ids_.push_back(id);
            }
        }

        if (scenario.contains("royalties")) {
            for (const auto& r : scenario["royalties"]) {
                int32_t status = royalties_.set_asset_royalty(
                    r.at("asset").get<mart::AssetId>(), address(r.at("receiver")),
                    r.at("fee").get<uint32_t>());
                if (status != mart::errors::OK) {
                    throw ScenarioError(std::string("royalty: ") + mart::errors::name(status));
                }
            }
        }
    }

    int32_t execute(const std::string& op, const json& step) {
        if (op == "list") {
            return market_->list_item(address(step.at("caller")),
                                      step.at("asset").get<mart::AssetId>(),
                                      amount(step.at("price")),
                                      step.at("expires_at").get<mart::Timestamp>(),
                                      currency(step.value("currency", json("native"))),
                                      amount(step.value("historical_price", json("0"))));
        }
        if (op == "delist") {
            return market_->delist_item(address(step.at("caller")),
                                        step.at("asset").get<mart::AssetId>());
        }
        if (op == "buy") {
            return market_->buy_item(address(step.at("buyer")),
                                     step.at("asset").get<mart::AssetId>(),
                                     amount(step.at("price")),
                                     currency(step.value("currency", json("native"))),
                                     amount(step.value("value", json("0"))));
        }
        if (op == "transfer") {
            return assets_.transfer_from(address(step.at("caller")), address(step.at("from")),
                                         address(step.at("to")),
                                         step.at("asset").get<mart::AssetId>());
        }
        if (op == "approve") {
            return assets_.approve(address(step.at("caller")), address(step.at("to")),
                                   step.at("asset").get<mart::AssetId>());
        }
        if (op == "approve_all") {
            return assets_.set_approval_for_all(address(step.at("owner")),
                                                address(step.at("operator")),
                                                step.value("approved", true));
        }
        if (op == "burn") {
            return assets_.burn(address(step.at("caller")), step.at("asset").get<mart::AssetId>());
        }
        if (op == "advance") {
            now_ += step.at("seconds").get<mart::Timestamp>();
            return mart::errors::OK;
        }
        if (op == "set_time") {
            now_ = step.at("now").get<mart::Timestamp>();
            return mart::errors::OK;
        }
        if (op == "get") {
            auto id = step.at("asset").get<mart::AssetId>();
            mart::Listing l = market_->get_listing(id);
            std::cout << "  listing " << id << ": price=" << mart::amounts::to_string(l.sale_price)
                      << " expires_at=" << l.expires_at
                      << " currency=" << mart::addresses::to_hex(l.currency.addr)
                      << " historical=" << mart::amounts::to_string(l.historical_price) << "\n";
            return mart::errors::OK;
        }
        throw ScenarioError("unknown op '" + op + "'");
    }
};

//------------------------------------------------------------------------------
// Command Line
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "mart scenario runner\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Marketplace config (JSON)\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -q, --quiet          No logging\n"
              << "  --compact            Single-line JSON report\n"
              << "  -h, --help           Show this help message\n\n"
              << "Steps: list, delist, buy, transfer, approve, approve_all, burn,\n"
              << "       advance, set_time, get. A step may carry \"expect\": \"<STATUS>\".\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "--compact") {
            options.pretty = false;
        } else if (arg[0] != '-' && options.scenario_path.empty()) {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.scenario_path.empty()) {
        std::cerr << "No scenario specified. Use -h for help.\n";
        std::exit(1);
    }
    return options;
}

json load_json(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ScenarioError("Cannot open scenario file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return json::parse(buffer.str());
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        mart::MarketConfig config;
        if (!options.config_path.empty()) {
            config = mart::MarketConfig::from_file(options.config_path);
        }

        if (options.quiet) {
            mart::loggers::disable();
        } else {
            auto lvl = options.verbose ? mart::loggers::level::debug
                                       : mart::loggers::parse_level(config.log_level)
                                             .value_or(mart::loggers::level::info);
            mart::loggers::configure(lvl);
        }

        json scenario = load_json(options.scenario_path);
        Runner runner(config, scenario);
        int mismatches = runner.run(scenario.value("steps", json::array()));

        std::cout << runner.report().dump(options.pretty ? 2 : -1) << "\n";

        if (mismatches > 0) {
            std::cerr << mismatches << " step(s) did not match expectations\n";
            return 2;
        }
    } catch (const mart::ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const ScenarioError& e) {
        std::cerr << "Scenario error: " << e.what() << "\n";
        return 1;
    } catch (const json::exception& e) {
        std::cerr << "JSON error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
