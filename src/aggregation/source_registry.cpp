// QuickRoute - Source Registry Implementation

#include <quickroute/aggregation/source_registry.hpp>
#include <quickroute/config.hpp>
#include <algorithm>
#include <stdexcept>

namespace quickroute::aggregation {

void SourceRegistry::add(SourceInfo info, std::unique_ptr<SourceAdapter> adapter) {
    if (!adapter) {
        adapter = make_adapter(info.id);
    }
    auto limiter = std::make_unique<RateLimiter>(info.rate_limit, info.window_ms);
    std::string id = info.id;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[id] = Entry{std::move(info), std::move(adapter), std::move(limiter)};
}

SourceRegistry::Entry* SourceRegistry::entry(std::string_view id) {
    auto it = entries_.find(std::string(id));
    return it == entries_.end() ? nullptr : &it->second;
}

const SourceRegistry::Entry* SourceRegistry::entry(std::string_view id) const {
    auto it = entries_.find(std::string(id));
    return it == entries_.end() ? nullptr : &it->second;
}

std::optional<SourceInfo> SourceRegistry::find(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* e = entry(id);
    if (!e) return std::nullopt;
    return e->info;
}

std::shared_ptr<const SourceAdapter> SourceRegistry::adapter(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* e = entry(id);
    if (!e) {
        throw std::out_of_range("unknown source: " + std::string(id));
    }
    return e->adapter;
}

bool SourceRegistry::can_admit(std::string_view id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = entry(id);
    return e && e->limiter->can_admit(now_ms);
}

void SourceRegistry::record(std::string_view id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Entry* e = entry(id)) {
        e->limiter->record(now_ms);
    }
}

bool SourceRegistry::try_admit(std::string_view id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = entry(id);
    return e && e->limiter->try_admit(now_ms);
}

void SourceRegistry::set_active(std::string_view id, bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Entry* e = entry(id)) {
        e->info.active = active;
    }
}

bool SourceRegistry::is_active(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* e = entry(id);
    return e && e->info.active;
}

std::vector<std::string> SourceRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [id, e] : entries_) {
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t SourceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<SourceInfo> SourceRegistry::default_sources() {
    std::vector<SourceInfo> out;

    SourceInfo uniswap;
    uniswap.id = std::string(sources::UNISWAP_V3);
    uniswap.name = "Uniswap V3";
    uniswap.api_endpoint = "https://api.uniswap.org/v1";
    uniswap.feed_url = "wss://api.uniswap.org/v1/ws";
    uniswap.rate_limit = 5;
    uniswap.reliability = 95;
    uniswap.supported_chains = {1, 42161, 137, 10, 8453};
    out.push_back(uniswap);

    SourceInfo jupiter;
    jupiter.id = std::string(sources::JUPITER);
    jupiter.name = "Jupiter";
    jupiter.api_endpoint = "https://quote-api.jup.ag/v6";
    jupiter.rate_limit = 10;
    jupiter.reliability = 92;
    jupiter.supported_chains = {101};
    out.push_back(jupiter);

    SourceInfo sushi;
    sushi.id = std::string(sources::SUSHISWAP);
    sushi.name = "SushiSwap";
    sushi.api_endpoint = "https://api.sushi.com/v1";
    sushi.rate_limit = 3;
    sushi.reliability = 88;
    sushi.supported_chains = {1, 42161, 137, 56, 43114};
    out.push_back(sushi);

    SourceInfo curve;
    curve.id = std::string(sources::CURVE);
    curve.name = "Curve Finance";
    curve.api_endpoint = "https://api.curve.fi/api";
    curve.rate_limit = 2;
    curve.reliability = 90;
    curve.supported_chains = {1, 42161, 137, 10};
    out.push_back(curve);

    SourceInfo balancer;
    balancer.id = std::string(sources::BALANCER);
    balancer.name = "Balancer";
    balancer.api_endpoint = "https://api.balancer.fi";
    balancer.rate_limit = 2;
    balancer.reliability = 87;
    balancer.supported_chains = {1, 42161, 137};
    out.push_back(balancer);

    SourceInfo pancake;
    pancake.id = std::string(sources::PANCAKESWAP);
    pancake.name = "PancakeSwap";
    pancake.api_endpoint = "https://api.pancakeswap.info/api/v2";
    pancake.rate_limit = 5;
    pancake.reliability = 85;
    pancake.supported_chains = {56};
    out.push_back(pancake);

    return out;
}

std::unique_ptr<SourceRegistry> SourceRegistry::from_config(const Config& config) {
    auto registry = std::make_unique<SourceRegistry>();

    for (auto info : default_sources()) {
        auto it = config.sources.find(info.id);
        if (it != config.sources.end()) {
            info = it->second.apply(std::move(info));
        }
        registry->add(std::move(info));
    }

    // Sources only named in config start from blank metadata
    for (const auto& [id, source_cfg] : config.sources) {
        if (registry->find(id)) continue;
        SourceInfo base;
        base.name = id;
        registry->add(source_cfg.apply(std::move(base)));
    }
    return registry;
}

}  // namespace quickroute::aggregation
