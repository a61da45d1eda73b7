#pragma once

#include "basics/errors.hpp"
#include "config/engine_config.hpp"
#include "config/token_config.hpp"
#include "risk/inventory_engine.hpp"

#include <string>
#include <utility>
#include <vector>

namespace dnmm {

struct LoadedConfig {
    EngineConfig   config;
    TokenPair      tokens;
    InventoryState inventory;
    std::vector<std::pair<std::string, Bps>> rebates;
};

// Reads engine parameters, token decimals, the opening inventory and the
// rebate allowlist from a JSON document. 256-bit amounts are written as
// integer strings in native token units. Missing keys keep their defaults;
// the result is validated before it is returned.
Result<LoadedConfig> parse_engine_config_json(const std::string& text);
Result<LoadedConfig> load_engine_config_json(const std::string& path);

} // namespace dnmm
