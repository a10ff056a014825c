// QuickRoute - Configuration Implementation

#include <quickroute/config.hpp>
#include <quickroute/errors.hpp>
#include <fstream>
#include <sstream>

namespace quickroute {

// Simple TOML parser (scalars and flat string/number arrays)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" that sits outside quotes
std::string strip_comment(const std::string& s) {
    bool in_quotes = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') in_quotes = !in_quotes;
        if (s[i] == '#' && !in_quotes) return s.substr(0, i);
    }
    return s;
}

std::vector<std::string> parse_array(const std::string& value) {
    std::vector<std::string> items;
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        throw ConfigError("expected array, got: " + value);
    }

    std::string body = value.substr(1, value.size() - 2);
    std::istringstream stream{body};
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(unquote(item));
    }
    return items;
}

bool parse_bool(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigError("expected boolean, got: " + value);
}

int64_t parse_int(const std::string& value) {
    try {
        size_t pos = 0;
        int64_t result = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return result;
    } catch (const std::logic_error&) {
        throw ConfigError("expected integer, got: " + value);
    }
}

double parse_double(const std::string& value) {
    try {
        size_t pos = 0;
        double result = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return result;
    } catch (const std::logic_error&) {
        throw ConfigError("expected number, got: " + value);
    }
}

void set_aggregator(AggregatorConfig& cfg, const std::string& key, const std::string& raw) {
    std::string value = unquote(raw);
    if (key == "update_interval_ms") cfg.update_interval_ms = parse_int(value);
    else if (key == "max_stale_time_ms") cfg.max_stale_time_ms = parse_int(value);
    else if (key == "feeds_enabled") cfg.feeds_enabled = parse_bool(value);
    else if (key == "cache_enabled") cfg.cache_enabled = parse_bool(value);
    else if (key == "cache_ttl_ms") cfg.cache_ttl_ms = parse_int(value);
    else if (key == "max_concurrent_requests") cfg.max_concurrent_requests = static_cast<size_t>(parse_int(value));
    else if (key == "timeout_ms") cfg.timeout_ms = parse_int(value);
    else if (key == "retry_attempts") cfg.retry_attempts = static_cast<int>(parse_int(value));
    else if (key == "retry_base_delay_ms") cfg.retry_base_delay_ms = parse_int(value);
    else if (key == "outlier_detection") cfg.outlier_detection = parse_bool(value);
    else if (key == "arbitrage_threshold") cfg.arbitrage_threshold = parse_double(value);
    else if (key == "min_liquidity") cfg.min_liquidity = parse_double(value);
    else if (key == "arbitrage_fee_buffer") cfg.arbitrage_fee_buffer = parse_double(value);
    else if (key == "max_reconnect_attempts") cfg.max_reconnect_attempts = static_cast<int>(parse_int(value));
    else if (key == "heartbeat_timeout_ms") cfg.heartbeat_timeout_ms = parse_int(value);
    else if (key == "enabled_sources") cfg.enabled_sources = parse_array(raw);
}

void set_routing(RoutingConfig& cfg, const std::string& key, const std::string& raw) {
    std::string value = unquote(raw);
    if (key == "optimize_for") cfg.optimize_for = routing::parse_optimize_for(value);
    else if (key == "max_hops") cfg.max_hops = static_cast<int>(parse_int(value));
    else if (key == "max_routes") cfg.max_routes = static_cast<size_t>(parse_int(value));
    else if (key == "use_multi_path") cfg.use_multi_path = parse_bool(value);
    else if (key == "include_stablecoin_routes") cfg.include_stablecoin_routes = parse_bool(value);
    else if (key == "min_liquidity_usd") cfg.min_liquidity_usd = parse_double(value);
    else if (key == "stablecoins") cfg.stablecoins = parse_array(raw);
    else if (key == "gas_per_hop") cfg.gas_per_hop = static_cast<uint64_t>(parse_int(value));
    else if (key == "min_arbitrage_profit") cfg.min_arbitrage_profit = parse_double(value);
    else if (key == "low_risk_tvl") cfg.low_risk_tvl = parse_double(value);
    else if (key == "medium_risk_tvl") cfg.medium_risk_tvl = parse_double(value);
    else if (key == "route_cache_ttl_ms") cfg.route_cache_ttl_ms = parse_int(value);
    else if (key == "history_size") cfg.history_size = static_cast<size_t>(parse_int(value));
    else if (key == "large_order_threshold") cfg.large_order_threshold = parse_double(value);
    else if (key == "max_split_size") cfg.max_split_size = parse_double(value);
    else if (key == "split_time_penalty_s") cfg.split_time_penalty_s = parse_int(value);
    else if (key == "split_risk_reduction") cfg.split_risk_reduction = parse_double(value);
    else if (key == "service_fee_rate") cfg.service_fee_rate = parse_double(value);
}

void set_weights(BalancedWeights& w, const std::string& key, const std::string& value) {
    if (key == "output") w.output = parse_double(value);
    else if (key == "gas") w.gas = parse_double(value);
    else if (key == "speed") w.speed = parse_double(value);
    else if (key == "confidence") w.confidence = parse_double(value);
    else if (key == "risk") w.risk = parse_double(value);
    else if (key == "gas_ceiling") w.gas_ceiling = parse_double(value);
    else if (key == "time_ceiling_s") w.time_ceiling_s = parse_double(value);
}

void set_source(SourceConfig& cfg, const std::string& key, const std::string& raw) {
    std::string value = unquote(raw);
    if (key == "name") cfg.name = value;
    else if (key == "api_endpoint") cfg.api_endpoint = value;
    else if (key == "feed_url") cfg.feed_url = value;
    else if (key == "rate_limit") cfg.rate_limit = static_cast<size_t>(parse_int(value));
    else if (key == "window_ms") cfg.window_ms = parse_int(value);
    else if (key == "reliability") cfg.reliability = parse_double(value);
    else if (key == "active") cfg.active = parse_bool(value);
    else if (key == "supported_chains") {
        cfg.supported_chains.clear();
        for (const auto& c : parse_array(raw)) {
            cfg.supported_chains.push_back(static_cast<uint64_t>(parse_int(c)));
        }
    }
}

}  // namespace

aggregation::SourceInfo SourceConfig::apply(aggregation::SourceInfo base) const {
    base.id = id;
    if (name) base.name = *name;
    if (api_endpoint) base.api_endpoint = *api_endpoint;
    if (feed_url) base.feed_url = *feed_url;
    if (rate_limit) base.rate_limit = *rate_limit;
    if (window_ms) base.window_ms = *window_ms;
    if (reliability) base.reliability = *reliability;
    if (active) base.active = *active;
    if (!supported_chains.empty()) base.supported_chains = supported_chains;
    for (const auto& [k, v] : headers) {
        base.headers[k] = v;
    }
    return base;
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            std::string section = line.substr(1, end - 1);

            // Check for subsection [section.name]
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = section.substr(dot + 1);
            } else {
                current_section = section;
                current_subsection.clear();
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = unquote(value);
        }
        else if (current_section == "aggregator") {
            set_aggregator(config.aggregator, key, value);
        }
        else if (current_section == "routing" && current_subsection.empty()) {
            set_routing(config.routing, key, value);
        }
        else if (current_section == "routing" && current_subsection == "weights") {
            set_weights(config.routing.weights, key, unquote(value));
        }
        else if (current_section == "sources" && !current_subsection.empty()) {
            auto& source_cfg = config.sources[current_subsection];
            source_cfg.id = current_subsection;
            set_source(source_cfg, key, value);
        }
    }

    return config;
}

}  // namespace quickroute
