// QuickRoute - Route Demo
// Loads a config and a pool snapshot, then prints ranked routes for one pair.
//
//   quickroute_route_demo <pools.json> <token_in> <token_out> <amount_in> [config.toml]

#include <quickroute/engine.hpp>
#include <quickroute/logging.hpp>
#include <quickroute/routing/liquidity_graph.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>

using namespace quickroute;

namespace {

const Token* find_token(const std::vector<LiquidityPool>& pools, const std::string& key) {
    for (const auto& pool : pools) {
        for (const Token* t : {&pool.token0, &pool.token1}) {
            if (t->address == key || t->symbol == key) return t;
        }
    }
    return nullptr;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 5) {
        std::cerr << "usage: " << argv[0] << " <pools.json> <token_in> <token_out> <amount_in> [config.toml]\n";
        return EXIT_FAILURE;
    }

    try {
        Config config = argc > 5 ? Config::from_file(argv[5]) : Config{};
        setup_logging(config.general.log_level);

        auto pools = routing::LiquidityGraph::load_file(argv[1]);
        const Token* in = find_token(pools, argv[2]);
        const Token* out = find_token(pools, argv[3]);
        if (!in || !out) {
            spdlog::error("token not present in snapshot");
            return EXIT_FAILURE;
        }

        Token token_in = *in;
        Token token_out = *out;
        Amount amount_in = amount::from_units(std::stod(argv[4]), token_in.decimals);

        config.enable_feeds(false);
        Engine engine(config);
        engine.load_pools(std::move(pools));

        auto routes = engine.find_optimal_routes(token_in, token_out, amount_in);
        if (routes.empty()) {
            spdlog::warn("no route from {} to {}", token_in.symbol, token_out.symbol);
            return EXIT_FAILURE;
        }

        spdlog::info("{} routes, optimizing for {}", routes.size(),
                     routing::to_string(config.routing.optimize_for));
        for (size_t i = 0; i < routes.size(); ++i) {
            const auto& r = routes[i];
            std::cout << i + 1 << ". " << r.signature()
                      << "  out=" << amount::to_units(r.estimated_output, token_out.decimals)
                      << " " << token_out.symbol
                      << "  gas=" << r.total_gas
                      << "  impact=" << r.total_price_impact << "%"
                      << "  confidence=" << r.confidence
                      << "  risk=" << r.risk_score << "\n";
            for (const auto& step : r.steps) {
                std::cout << "     " << step.token_in.symbol << " -> " << step.token_out.symbol
                          << " via " << step.source
                          << (step.pool_address ? " (" + *step.pool_address + ")" : std::string{})
                          << "\n";
            }
        }

        auto fee = engine.router().quote_service_fee(routes.front());
        std::cout << "service fee: " << amount::to_units(fee.fee_amount, token_out.decimals)
                  << " " << token_out.symbol << "\n";
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
