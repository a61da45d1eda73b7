#include "config/json_config.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>

namespace dnmm {

namespace {

// Minimal JSON value. Numbers keep their source text so integers wider than
// 64 bits survive.
struct JsonValue {
    enum Type { Null, Bool, Number, String, Array, Object };
    Type type = Null;
    bool boolean = false;
    std::string text;   // number literal or string contents
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    const JsonValue* get(const std::string& key) const {
        for (const auto& [k, v] : obj) {
            if (k == key) return &v;
        }
        return nullptr;
    }
    const JsonValue* get_object(const std::string& key) const {
        const JsonValue* v = get(key);
        return (v != nullptr && v->type == Object) ? v : nullptr;
    }
};

// Recursive descent parser; sets `failed` instead of throwing.
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    std::optional<JsonValue> parse() {
        skip_ws();
        JsonValue v = parse_value();
        skip_ws();
        if (failed_ || pos_ != input_.size()) return std::nullopt;
        return v;
    }

private:
    const std::string& input_;
    size_t pos_;
    bool failed_ = false;

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char next() { return pos_ < input_.size() ? input_[pos_++] : '\0'; }
    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }
    void expect(char c) {
        if (next() != c) failed_ = true;
    }
    bool consume_literal(const char* lit) {
        std::string_view l(lit);
        if (input_.compare(pos_, l.size(), l) != 0) {
            failed_ = true;
            return false;
        }
        pos_ += l.size();
        return true;
    }

    JsonValue parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') return parse_string();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        JsonValue v;
        if (c == 'n') { consume_literal("null"); return v; }
        if (c == 't') { if (consume_literal("true")) { v.type = JsonValue::Bool; v.boolean = true; } return v; }
        if (c == 'f') { if (consume_literal("false")) { v.type = JsonValue::Bool; v.boolean = false; } return v; }
        return parse_number();
    }

    JsonValue parse_string() {
        expect('"');
        JsonValue v;
        v.type = JsonValue::String;
        while (peek() != '"' && peek() != '\0') {
            if (peek() == '\\') { next(); v.text += next(); }
            else v.text += next();
        }
        expect('"');
        return v;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') next();
        while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        if (peek() == '.') { next(); while (std::isdigit(static_cast<unsigned char>(peek()))) next(); }
        if (peek() == 'e' || peek() == 'E') {
            next();
            if (peek() == '+' || peek() == '-') next();
            while (std::isdigit(static_cast<unsigned char>(peek()))) next();
        }
        JsonValue v;
        if (pos_ == start) {
            failed_ = true;
            return v;
        }
        v.type = JsonValue::Number;
        v.text = input_.substr(start, pos_ - start);
        return v;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue v;
        v.type = JsonValue::Array;
        skip_ws();
        if (peek() == ']') { next(); return v; }
        while (!failed_) {
            v.arr.push_back(parse_value());
            skip_ws();
            if (peek() == ',') { next(); skip_ws(); }
            else break;
        }
        skip_ws();
        expect(']');
        return v;
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue v;
        v.type = JsonValue::Object;
        skip_ws();
        if (peek() == '}') { next(); return v; }
        while (!failed_) {
            auto key = parse_string();
            skip_ws();
            expect(':');
            auto val = parse_value();
            v.obj.emplace_back(key.text, std::move(val));
            skip_ws();
            if (peek() == ',') { next(); skip_ws(); }
            else break;
        }
        skip_ws();
        expect('}');
        return v;
    }
};

// Typed field reader. Remembers the first malformed field; absent fields
// leave the target untouched.
class FieldReader {
public:
    explicit FieldReader(const JsonValue* obj) : obj_(obj) {}

    template <class T>
    void unsigned_field(const char* key, T& out) {
        const JsonValue* v = lookup(key);
        if (v == nullptr) return;
        auto parsed = integer(*v);
        if (!parsed || *parsed > std::numeric_limits<T>::max()) {
            failed_ = true;
            return;
        }
        out = static_cast<T>(*parsed);
    }

    void u256(const char* key, uint256& out) {
        const JsonValue* v = lookup(key);
        if (v == nullptr) return;
        auto parsed = integer(*v);
        if (!parsed) {
            failed_ = true;
            return;
        }
        out = *parsed;
    }

    void boolean(const char* key, bool& out) {
        const JsonValue* v = lookup(key);
        if (v == nullptr) return;
        if (v->type != JsonValue::Bool) {
            failed_ = true;
            return;
        }
        out = v->boolean;
    }

    bool failed() const { return failed_; }

private:
    const JsonValue* lookup(const char* key) const {
        return obj_ == nullptr ? nullptr : obj_->get(key);
    }

    static std::optional<uint256> integer(const JsonValue& v) {
        if (v.type != JsonValue::Number && v.type != JsonValue::String) return std::nullopt;
        return fp::parse_uint256(v.text);
    }

    const JsonValue* obj_;
    bool failed_ = false;
};

bool read_fee(const JsonValue* o, FeeConfig& c) {
    FieldReader r(o);
    r.unsigned_field("base_bps", c.base_bps);
    r.unsigned_field("alpha_conf_num", c.alpha_conf_num);
    r.unsigned_field("alpha_conf_den", c.alpha_conf_den);
    r.unsigned_field("beta_inv_dev_num", c.beta_inv_dev_num);
    r.unsigned_field("beta_inv_dev_den", c.beta_inv_dev_den);
    r.unsigned_field("cap_bps", c.cap_bps);
    r.unsigned_field("decay_pct_per_block", c.decay_pct_per_block);
    r.unsigned_field("gamma_size_lin_bps", c.gamma_size_lin_bps);
    r.unsigned_field("gamma_size_quad_bps", c.gamma_size_quad_bps);
    r.unsigned_field("size_fee_cap_bps", c.size_fee_cap_bps);
    r.unsigned_field("kappa_lvr_bps", c.kappa_lvr_bps);
    r.unsigned_field("lvr_fee_cap_bps", c.lvr_fee_cap_bps);
    return !r.failed();
}

bool read_oracle(const JsonValue* o, OracleConfig& c) {
    FieldReader r(o);
    r.unsigned_field("max_age_sec", c.max_age_sec);
    r.unsigned_field("secondary_max_age_sec", c.secondary_max_age_sec);
    r.unsigned_field("secondary_max_age_sec_strict", c.secondary_max_age_sec_strict);
    r.boolean("allow_ema_fallback", c.allow_ema_fallback);
    r.unsigned_field("conf_cap_bps_spot", c.conf_cap_bps_spot);
    r.unsigned_field("conf_cap_bps_strict", c.conf_cap_bps_strict);
    r.unsigned_field("conf_weight_spread_bps", c.conf_weight_spread_bps);
    r.unsigned_field("conf_weight_sigma_bps", c.conf_weight_sigma_bps);
    r.unsigned_field("conf_weight_secondary_bps", c.conf_weight_secondary_bps);
    r.unsigned_field("sigma_ewma_lambda_bps", c.sigma_ewma_lambda_bps);
    r.unsigned_field("divergence_bps", c.divergence_bps);
    r.unsigned_field("divergence_accept_bps", c.divergence_accept_bps);
    r.unsigned_field("divergence_soft_bps", c.divergence_soft_bps);
    r.unsigned_field("divergence_hard_bps", c.divergence_hard_bps);
    r.unsigned_field("haircut_min_bps", c.haircut_min_bps);
    r.unsigned_field("haircut_slope_bps", c.haircut_slope_bps);
    r.unsigned_field("divergence_healthy_required", c.divergence_healthy_required);
    return !r.failed();
}

bool read_inventory_config(const JsonValue* o, InventoryConfig& c) {
    FieldReader r(o);
    r.unsigned_field("floor_bps", c.floor_bps);
    r.unsigned_field("recenter_threshold_pct", c.recenter_threshold_pct);
    r.unsigned_field("recenter_cooldown_sec", c.recenter_cooldown_sec);
    r.unsigned_field("recenter_healthy_required", c.recenter_healthy_required);
    r.unsigned_field("inv_tilt_bps_per_1pct", c.inv_tilt_bps_per_1pct);
    r.unsigned_field("inv_tilt_max_bps", c.inv_tilt_max_bps);
    r.unsigned_field("tilt_conf_weight_bps", c.tilt_conf_weight_bps);
    r.unsigned_field("tilt_spread_weight_bps", c.tilt_spread_weight_bps);
    return !r.failed();
}

bool read_maker(const JsonValue* o, MakerConfig& c) {
    FieldReader r(o);
    r.u256("s0_notional", c.s0_notional);
    r.unsigned_field("ttl_ms", c.ttl_ms);
    r.unsigned_field("alpha_bbo_bps", c.alpha_bbo_bps);
    r.unsigned_field("beta_floor_bps", c.beta_floor_bps);
    return !r.failed();
}

bool read_aomq(const JsonValue* o, AomqConfig& c) {
    FieldReader r(o);
    r.u256("min_quote_notional", c.min_quote_notional);
    r.unsigned_field("emergency_spread_bps", c.emergency_spread_bps);
    r.unsigned_field("floor_epsilon_bps", c.floor_epsilon_bps);
    return !r.failed();
}

bool read_preview(const JsonValue* o, PreviewConfig& c) {
    FieldReader r(o);
    r.unsigned_field("max_age_sec", c.max_age_sec);
    r.unsigned_field("snapshot_cooldown_sec", c.snapshot_cooldown_sec);
    r.boolean("revert_on_stale_preview", c.revert_on_stale_preview);
    r.boolean("enable_preview_fresh", c.enable_preview_fresh);
    return !r.failed();
}

bool read_flags(const JsonValue* o, FeatureFlags& f) {
    FieldReader r(o);
    r.boolean("blend_on", f.blend_on);
    r.boolean("enable_soft_divergence", f.enable_soft_divergence);
    r.boolean("enable_size_fee", f.enable_size_fee);
    r.boolean("enable_bbo_floor", f.enable_bbo_floor);
    r.boolean("enable_inv_tilt", f.enable_inv_tilt);
    r.boolean("enable_aomq", f.enable_aomq);
    r.boolean("enable_rebates", f.enable_rebates);
    r.boolean("enable_auto_recenter", f.enable_auto_recenter);
    r.boolean("enable_lvr_fee", f.enable_lvr_fee);
    return !r.failed();
}

bool read_tokens(const JsonValue* o, TokenPair& t) {
    uint8_t base_decimals = t.base.decimals;
    uint8_t quote_decimals = t.quote.decimals;
    FieldReader r(o);
    r.unsigned_field("base_decimals", base_decimals);
    r.unsigned_field("quote_decimals", quote_decimals);
    if (r.failed() || base_decimals > 36 || quote_decimals > 36) return false;
    t = make_token_pair(base_decimals, quote_decimals);
    return true;
}

bool read_state(const JsonValue* o, InventoryState& s) {
    FieldReader r(o);
    r.u256("base_reserves", s.base_reserves);
    r.u256("quote_reserves", s.quote_reserves);
    r.u256("target_base_star", s.target_base_star);
    r.u256("last_rebalance_price", s.last_rebalance_price);
    r.unsigned_field("last_rebalance_at", s.last_rebalance_at);
    return !r.failed();
}

bool read_rebates(const JsonValue* o, std::vector<std::pair<std::string, Bps>>& out) {
    if (o == nullptr) return true;
    for (const auto& [caller, value] : o->obj) {
        auto bps = (value.type == JsonValue::Number) ? fp::parse_uint256(value.text) : std::nullopt;
        if (!bps || *bps > kMaxRebateBps || caller.empty()) return false;
        out.emplace_back(caller, static_cast<Bps>(*bps));
    }
    return true;
}

} // anonymous namespace

Result<LoadedConfig> parse_engine_config_json(const std::string& text) {
    JsonParser parser(text);
    auto root = parser.parse();
    if (!root || root->type != JsonValue::Object) {
        return Unexpected(ErrorCode::InvalidConfig);
    }

    LoadedConfig loaded;
    loaded.tokens = make_token_pair(18, 18);

    bool ok = read_tokens(root->get_object("tokens"), loaded.tokens)
           && read_fee(root->get_object("fee"), loaded.config.fee)
           && read_oracle(root->get_object("oracle"), loaded.config.oracle)
           && read_inventory_config(root->get_object("inventory_config"), loaded.config.inventory)
           && read_maker(root->get_object("maker"), loaded.config.maker)
           && read_aomq(root->get_object("aomq"), loaded.config.aomq)
           && read_preview(root->get_object("preview"), loaded.config.preview)
           && read_flags(root->get_object("flags"), loaded.config.flags)
           && read_state(root->get_object("inventory"), loaded.inventory)
           && read_rebates(root->get_object("rebates"), loaded.rebates);
    if (!ok) {
        return Unexpected(ErrorCode::InvalidConfig);
    }

    if (auto valid = validate_engine_config(loaded.config); !valid) {
        return Unexpected(valid.error());
    }
    return loaded;
}

Result<LoadedConfig> load_engine_config_json(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    std::string content((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
    return parse_engine_config_json(content);
}

} // namespace dnmm
