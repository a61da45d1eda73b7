#include "config/json_config.hpp"
#include "engine/dnmm_engine.hpp"
#include "engine/event_log.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct CliOptions {
    std::string config_path = "data/config.json";
    std::string primary_mid;
    std::string primary_bid;
    std::string primary_ask;
    std::string primary_ema;
    uint64_t    primary_age = 0;
    std::string secondary_mid;
    uint32_t    secondary_conf_bps = 0;
    uint64_t    secondary_age = 0;
    std::string amount = "1";
    bool        base_in = true;
    dnmm::OracleMode mode = dnmm::OracleMode::Spot;
    uint64_t    timestamp = 0;
    uint64_t    block = 1;
    bool        commit = false;
};

void print_usage() {
    std::cout << "Usage: dnmm_quote [options]\n"
              << "  --config <path>          Engine config (default: data/config.json)\n"
              << "  --primary-mid <price>    Primary mid, quote per base (required)\n"
              << "  --primary-bid <price>    Primary best bid\n"
              << "  --primary-ask <price>    Primary best ask\n"
              << "  --primary-ema <price>    Primary EMA mid used as fallback\n"
              << "  --primary-age <sec>      Age of the primary reading (default: 0)\n"
              << "  --secondary-mid <price>  Secondary mid\n"
              << "  --secondary-conf <bps>   Secondary confidence (default: 0)\n"
              << "  --secondary-age <sec>    Age of the secondary reading (default: 0)\n"
              << "  --amount <units>         Amount in, whole tokens (default: 1)\n"
              << "  --side <base|quote>      Token paid in (default: base)\n"
              << "  --mode <spot|strict>     Oracle mode (default: spot)\n"
              << "  --timestamp <sec>        Evaluation time (default: 0)\n"
              << "  --block <n>              Evaluation block (default: 1)\n"
              << "  --swap                   Commit the trade instead of quoting it\n"
              << "  --help                   Show this help\n";
}

std::optional<dnmm::uint256> parse_price(const std::string& text) {
    if (text.empty()) return std::nullopt;
    return dnmm::fp::parse_units(text, 18);
}

int fail(const std::string& what, dnmm::ErrorCode code) {
    std::cerr << "[ERROR] " << what << " error=" << code << "\n";
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opt;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string { return i + 1 < argc ? argv[++i] : std::string{}; };
        if (arg == "--config") {
            opt.config_path = value();
        } else if (arg == "--primary-mid") {
            opt.primary_mid = value();
        } else if (arg == "--primary-bid") {
            opt.primary_bid = value();
        } else if (arg == "--primary-ask") {
            opt.primary_ask = value();
        } else if (arg == "--primary-ema") {
            opt.primary_ema = value();
        } else if (arg == "--primary-age") {
            opt.primary_age = std::strtoull(value().c_str(), nullptr, 10);
        } else if (arg == "--secondary-mid") {
            opt.secondary_mid = value();
        } else if (arg == "--secondary-conf") {
            opt.secondary_conf_bps = static_cast<uint32_t>(std::strtoul(value().c_str(), nullptr, 10));
        } else if (arg == "--secondary-age") {
            opt.secondary_age = std::strtoull(value().c_str(), nullptr, 10);
        } else if (arg == "--amount") {
            opt.amount = value();
        } else if (arg == "--side") {
            opt.base_in = value() != "quote";
        } else if (arg == "--mode") {
            opt.mode = value() == "strict" ? dnmm::OracleMode::Strict : dnmm::OracleMode::Spot;
        } else if (arg == "--timestamp") {
            opt.timestamp = std::strtoull(value().c_str(), nullptr, 10);
        } else if (arg == "--block") {
            opt.block = std::strtoull(value().c_str(), nullptr, 10);
        } else if (arg == "--swap") {
            opt.commit = true;
        } else if (arg == "--help") {
            print_usage();
            return 0;
        } else {
            std::cerr << "[ERROR] unknown option " << arg << "\n";
            print_usage();
            return 2;
        }
    }

    std::cout << "Loading config from: " << opt.config_path << "\n";
    auto loaded = dnmm::load_engine_config_json(opt.config_path);
    if (!loaded) {
        return fail("config " + opt.config_path, loaded.error());
    }

    auto primary_mid = parse_price(opt.primary_mid);
    if (!primary_mid) {
        std::cerr << "[ERROR] --primary-mid is required and must be a decimal price\n";
        return 2;
    }

    dnmm::OracleReadings readings;
    readings.primary.mid = *primary_mid;
    readings.primary.age_sec = opt.primary_age;
    readings.primary.bid = parse_price(opt.primary_bid);
    readings.primary.ask = parse_price(opt.primary_ask);
    if (auto ema = parse_price(opt.primary_ema)) {
        readings.primary_ema = dnmm::OracleSample{.mid = *ema};
    }
    if (auto sec = parse_price(opt.secondary_mid)) {
        readings.secondary = dnmm::OracleSample{
            .mid      = *sec,
            .conf_bps = opt.secondary_conf_bps,
            .age_sec  = opt.secondary_age,
        };
    }

    const auto& tokens = loaded->tokens;
    const uint8_t in_decimals = opt.base_in ? tokens.base.decimals : tokens.quote.decimals;
    const uint8_t out_decimals = opt.base_in ? tokens.quote.decimals : tokens.base.decimals;
    auto amount = dnmm::fp::parse_units(opt.amount, in_decimals);
    if (!amount) {
        std::cerr << "[ERROR] --amount must be a decimal token amount\n";
        return 2;
    }

    dnmm::StreamEventLog log(std::cout);
    dnmm::DnmmEngine engine(loaded->config, tokens, loaded->inventory, &log);
    for (const auto& [caller, bps] : loaded->rebates) {
        if (auto s = engine.set_rebate(caller, bps); !s) {
            return fail("rebate " + caller, s.error());
        }
    }

    const dnmm::BlockTime at{.timestamp = opt.timestamp, .block = opt.block};
    const dnmm::QuoteRequest req{.amount_in = *amount, .is_base_in = opt.base_in, .mode = opt.mode};

    auto result = opt.commit ? engine.swap(req, readings, at) : engine.quote(req, readings, at);
    if (!result) {
        return fail(opt.commit ? "swap" : "quote", result.error());
    }

    std::cout << "[QUOTE] side=" << (opt.base_in ? "base_in" : "quote_in")
              << " mode=" << dnmm::to_string(opt.mode)
              << " amount_in=" << dnmm::fp::format_units(result->partial_fill_amount_in, in_decimals)
              << " amount_out=" << dnmm::fp::format_units(result->amount_out, out_decimals)
              << " mid=" << dnmm::fp::format_units(result->mid_used, 18)
              << " fee_bps=" << result->fee_bps_used
              << " source=" << dnmm::to_string(result->source)
              << " reason=" << dnmm::to_string(result->reason)
              << " flags=" << dnmm::describe_clamp_flags(result->clamp_flags)
              << " haircut_bps=" << result->divergence_haircut_bps << "\n";

    auto snap = engine.refresh_preview_snapshot(opt.mode, readings, at);
    if (!snap) {
        return fail("preview refresh", snap.error());
    }
    auto ladder = engine.preview_ladder(0, at);
    if (!ladder) {
        return fail("preview ladder", ladder.error());
    }

    std::cout << "\nFee ladder at mid " << dnmm::fp::format_units(ladder->mid_used, 18) << "\n";
    std::cout << "size_base,ask_fee_bps,bid_fee_bps,ask_clamped,bid_clamped\n";
    for (const auto& row : ladder->rows) {
        std::cout << dnmm::fp::format_units(row.size, tokens.base.decimals) << ","
                  << row.ask_fee_bps << "," << row.bid_fee_bps << ","
                  << (row.ask_clamped ? 1 : 0) << "," << (row.bid_clamped ? 1 : 0) << "\n";
    }

    return 0;
}
