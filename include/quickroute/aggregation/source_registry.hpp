// QuickRoute - Source Registry
// Static source metadata, adapters and per-source rate limiters

#pragma once

#include <quickroute/aggregation/rate_limiter.hpp>
#include <quickroute/aggregation/source_adapter.hpp>
#include <quickroute/aggregation/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quickroute {
class Config;
}

namespace quickroute::aggregation {

class SourceRegistry {
public:
    SourceRegistry() = default;

    SourceRegistry(const SourceRegistry&) = delete;
    SourceRegistry& operator=(const SourceRegistry&) = delete;

    /// Register or replace a source. Without an adapter one is chosen by id.
    void add(SourceInfo info, std::unique_ptr<SourceAdapter> adapter = nullptr);

    [[nodiscard]] std::optional<SourceInfo> find(std::string_view id) const;

    /// Throws std::out_of_range for an unknown source
    [[nodiscard]] std::shared_ptr<const SourceAdapter> adapter(std::string_view id) const;

    [[nodiscard]] bool can_admit(std::string_view id, int64_t now_ms);
    void record(std::string_view id, int64_t now_ms);
    bool try_admit(std::string_view id, int64_t now_ms);

    void set_active(std::string_view id, bool active);
    [[nodiscard]] bool is_active(std::string_view id) const;

    [[nodiscard]] std::vector<std::string> ids() const;
    [[nodiscard]] size_t size() const;

    /// Uniswap V3, Jupiter, SushiSwap, Curve, Balancer and PancakeSwap
    static std::vector<SourceInfo> default_sources();

    /// Defaults overlaid with the config's [sources.*] sections
    static std::unique_ptr<SourceRegistry> from_config(const Config& config);

private:
    struct Entry {
        SourceInfo info;
        std::shared_ptr<const SourceAdapter> adapter;
        std::unique_ptr<RateLimiter> limiter;
    };

    Entry* entry(std::string_view id);
    const Entry* entry(std::string_view id) const;

    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace quickroute::aggregation
