#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <thread>
#include <vector>

#include "core/app_state.hpp"
#include "core/event_bus.hpp"
#include "core/exceptions.hpp"
#include "core/execution_coordinator.hpp"
#include "core/market_context.hpp"
#include "core/path_catalog.hpp"
#include "core/resource_lock_table.hpp"
#include "core/risk_gate.hpp"
#include "core/scan_scheduler.hpp"
#include "core/venue_health.hpp"
#include "data/fee_schedule.hpp"
#include "data/snapshot_cache.hpp"
#include "exchange/paper_exchange.hpp"
#include "utils/config_manager.hpp"
#include "utils/logger.hpp"

// Global application state
arbx::AppState app_state;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        app_state.shutdown();
    }
}

namespace {

constexpr const char* kDefaultConfigPath = "config/settings.json";

// Reference USD prices for the synthetic feed.
const std::map<std::string, double> kReferencePrices = {
    {"BTC", 60000.0}, {"ETH", 3000.0}, {"SOL", 150.0}
};

double reference_price(const std::string& asset, const std::vector<std::string>& stablecoins) {
    for (const auto& stable : stablecoins) {
        if (asset == stable) {
            return 1.0;
        }
    }
    auto it = kReferencePrices.find(asset);
    return it == kReferencePrices.end() ? 10.0 : it->second;
}

// Random-walk books per (venue, market) with a persistent per-venue skew so
// cross-venue and triangular gaps open now and then.
class SyntheticFeed {
public:
    SyntheticFeed(const arbx::EngineConfig& config, arbx::SnapshotCache& cache)
        : cache_(cache), rng_(std::random_device{}()) {
        std::normal_distribution<double> skew(0.0, 0.002);
        for (const auto& [venue, exchange] : config.exchanges) {
            if (!exchange.enabled) {
                continue;
            }
            for (const auto& symbol : exchange.markets) {
                auto pair = arbx::Pair::parse(symbol);
                double price = reference_price(pair.base, config.universe.stablecoins) /
                               reference_price(pair.quote, config.universe.stablecoins);
                markets_.push_back(Market{venue, pair, price * (1.0 + skew(rng_))});
            }
        }
    }

    void tick() {
        std::normal_distribution<double> step(0.0, 0.0005);
        std::uniform_real_distribution<double> shock(0.0, 1.0);

        for (auto& market : markets_) {
            double move = step(rng_);
            if (shock(rng_) < 0.01) {
                move += (shock(rng_) < 0.5 ? -1.0 : 1.0) * 0.012;
            }
            market.mid *= 1.0 + move;
            cache_.update(make_book(market));
        }
    }

    size_t market_count() const { return markets_.size(); }

private:
    struct Market {
        std::string venue;
        arbx::Pair pair;
        double mid;
    };

    arbx::OrderBookSnapshot make_book(const Market& market) const {
        constexpr double kHalfSpread = 0.0002;
        constexpr double kLevelStep = 0.0005;
        constexpr double kLevelNotional = 250000.0;

        arbx::OrderBookSnapshot book;
        book.venue = market.venue;
        book.pair = market.pair;
        book.observed_at = cache_.now();

        double quantity = kLevelNotional / market.mid;
        for (int level = 0; level < 10; ++level) {
            double bid = market.mid * (1.0 - kHalfSpread - kLevelStep * level);
            double ask = market.mid * (1.0 + kHalfSpread + kLevelStep * level);
            book.bids.push_back(arbx::DepthLevel{arbx::Decimal::from_double(bid), arbx::Decimal::from_double(quantity)});
            book.asks.push_back(arbx::DepthLevel{arbx::Decimal::from_double(ask), arbx::Decimal::from_double(quantity)});
        }
        book.best_bid = book.bids.front().price;
        book.best_ask = book.asks.front().price;
        return book;
    }

    arbx::SnapshotCache& cache_;
    std::mt19937 rng_;
    std::vector<Market> markets_;
};

void fund_paper_accounts(const arbx::EngineConfig& config, arbx::PaperExchange& exchange) {
    constexpr double kNotionalPerAsset = 50000.0;
    for (const auto& [venue, settings] : config.exchanges) {
        if (!settings.enabled) {
            continue;
        }
        for (const auto& stable : config.universe.stablecoins) {
            exchange.deposit(venue, stable, arbx::Decimal::from_int(static_cast<int64_t>(kNotionalPerAsset)));
        }
        for (const auto& asset : config.universe.assets) {
            double units = kNotionalPerAsset / reference_price(asset, config.universe.stablecoins);
            exchange.deposit(venue, asset, arbx::Decimal::from_double(units).truncate(8));
        }
    }
}

void log_summary(const arbx::PerformanceSummary& summary) {
    ARBX_LOG_INFO("Executions: {} total, {} completed, {} rolled back, {} stranded, win rate {:.1f}%",
                  summary.total_executions, summary.completed, summary.rolled_back, summary.partially_stranded,
                  summary.win_rate_pct);
    for (const auto& [asset, profit] : summary.realized_profit) {
        ARBX_LOG_INFO("Realized {}: {}", asset, profit.to_string());
    }
}

void log_venue_health(const arbx::VenueHealthTracker& health) {
    for (const auto& venue : health.all()) {
        ARBX_LOG_INFO("Venue {}: {}, {}% errors over {} orders, average fill {}ms", venue.venue,
                      arbx::to_string(venue.status), venue.error_rate_pct.to_string(), venue.samples,
                      venue.average_fill_latency.count());
    }
}

int run(const std::string& config_path) {
    arbx::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        throw arbx::ConfigurationError("cannot load " + config_path + ": " + config_manager.last_error());
    }
    auto config = config_manager.snapshot();

    arbx::Logger::initialize(config->logging, arbx::parse_log_level(config->app.log_level));
    ARBX_LOG_INFO("Starting {} {} ({})", config->app.name, config->app.version,
                  config->app.paper_trading ? "paper trading" : "live");
    if (!config->app.paper_trading) {
        throw arbx::ConfigurationError("only paper venues are available in this build");
    }

    auto catalog = arbx::PathCatalog::from_config(*config);
    ARBX_LOG_INFO("Path catalog: {} cross-venue, {} triangular",
                  catalog.paths_for_family(arbx::PathFamily::CROSS_VENUE).size(),
                  catalog.paths_for_family(arbx::PathFamily::TRIANGULAR).size());

    arbx::SnapshotCache cache(std::chrono::milliseconds(config->scheduler.freshness_window_ms));
    arbx::PaperExchange exchange(cache, config->exchanges);
    fund_paper_accounts(*config, exchange);

    arbx::FeeSchedule fees(&exchange);
    fees.configure(config->exchanges);

    arbx::MarketContextTracker market(config->universe.stablecoins,
                                      static_cast<size_t>(config->risk.volatility_window),
                                      config->risk.volatility_band_pct,
                                      static_cast<size_t>(config->risk.depth_levels));

    arbx::EventBus events;
    events.subscribe([](const arbx::Event& event) {
        if (const auto* finished = std::get_if<arbx::ExecutionResultEvent>(&event)) {
            app_state.record_execution(finished->result);
        } else if (const auto* alert = std::get_if<arbx::AlertEvent>(&event)) {
            app_state.record_alert(alert->alert);
        }
    });

    arbx::RiskGate risk_gate(catalog, config->risk);
    arbx::ResourceLockTable locks;
    arbx::VenueHealthTracker health(config->health, &events);
    arbx::ExecutionCoordinator coordinator(catalog, exchange, cache, locks,
                                           arbx::ExecutionSettings::from_config(*config), &risk_gate, &events,
                                           &health);
    exchange.set_fill_listener(&coordinator);

    arbx::ScanScheduler scheduler(config_manager, catalog, cache, fees, market, risk_gate, coordinator, exchange,
                                  &events, &health);

    cache.subscribe([&market](const arbx::OrderBookSnapshot& snapshot) { market.on_snapshot(snapshot); });
    cache.subscribe([&scheduler](const arbx::OrderBookSnapshot& snapshot) { scheduler.on_snapshot_update(snapshot); });

    SyntheticFeed feed(*config, cache);
    ARBX_LOG_INFO("Synthetic feed covering {} markets", feed.market_count());

    events.start();
    fees.refresh();
    scheduler.start();

    std::thread feed_thread([&feed] {
        while (app_state.is_running()) {
            feed.tick();
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    });

    ARBX_LOG_INFO("arbx is running. Press Ctrl+C to stop.");
    auto last_report = std::chrono::steady_clock::now();
    while (app_state.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() - last_report >= std::chrono::seconds(60)) {
            log_summary(app_state.summary());
            log_venue_health(health);
            last_report = std::chrono::steady_clock::now();
        }
    }

    ARBX_LOG_INFO("Stopping all components...");
    if (feed_thread.joinable()) {
        feed_thread.join();
    }
    scheduler.stop();
    events.stop();
    exchange.set_fill_listener(nullptr);

    log_summary(app_state.summary());
    ARBX_LOG_INFO("arbx has shut down gracefully.");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path = arbx::get_env_var("ARBX_CONFIG");
    if (argc > 1) {
        config_path = argv[1];
    }
    if (config_path.empty()) {
        config_path = kDefaultConfigPath;
    }

    // Console only until the configured sinks are known.
    arbx::LoggingConfig bootstrap;
    bootstrap.file_output = false;
    arbx::Logger::initialize(bootstrap);

    int exit_code = 1;
    try {
        exit_code = run(config_path);
    } catch (const arbx::ArbxException& e) {
        ARBX_LOG_CRITICAL("Fatal: {}", e.what());
    } catch (const std::exception& e) {
        ARBX_LOG_CRITICAL("Unhandled exception: {}", e.what());
    }

    arbx::Logger::shutdown();
    return exit_code;
}
