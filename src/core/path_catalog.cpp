#include "path_catalog.hpp"
#include "exceptions.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace arbx {

namespace {

std::string market_key(const Venue& venue, const Pair& pair) {
    return venue + ":" + pair.symbol();
}

} // namespace

PathCatalog::PathCatalog(const std::vector<Asset>& universe, const std::vector<VenueMarkets>& venues)
    : universe_(universe.begin(), universe.end()) {
    for (const auto& venue : venues) {
        auto& listed = markets_[venue.venue];
        for (const auto& pair : venue.markets) {
            if (universe_.count(pair.base) == 0 || universe_.count(pair.quote) == 0) {
                throw ConfigurationError("Market " + pair.symbol() + " on " + venue.venue +
                                         " references an asset outside the universe");
            }
            if (pair.base == pair.quote) {
                throw ConfigurationError("Market " + pair.symbol() + " on " + venue.venue + " trades an asset against itself");
            }
            listed.insert(pair);
        }
    }

    build_cross_venue_paths(venues);
    build_triangular_paths(venues);

    ARBX_LOG_INFO("Path catalog built: {} cross-venue, {} triangular paths",
                  paths_for_family(PathFamily::CROSS_VENUE).size(),
                  paths_for_family(PathFamily::TRIANGULAR).size());
}

PathCatalog PathCatalog::from_config(const EngineConfig& config) {
    std::vector<Asset> universe = config.universe.assets;
    universe.insert(universe.end(), config.universe.stablecoins.begin(), config.universe.stablecoins.end());

    std::vector<VenueMarkets> venues;
    for (const auto& [name, exchange] : config.exchanges) {
        if (!exchange.enabled) {
            continue;
        }
        VenueMarkets entry{name, {}};
        for (const auto& symbol : exchange.markets) {
            try {
                entry.markets.push_back(Pair::parse(symbol));
            } catch (const ValidationError& e) {
                throw ConfigurationError(std::string(e.what()) + " on " + name);
            }
        }
        venues.push_back(std::move(entry));
    }
    return PathCatalog(universe, venues);
}

void PathCatalog::validate(const Path& path) {
    const std::string where = "path #" + std::to_string(path.id);

    if (path.legs.size() < 2 || path.legs.size() > 3) {
        throw InvalidPathError(where + " must have 2 or 3 legs");
    }
    if (path.legs.front().consumed() != path.start_asset) {
        throw InvalidPathError(where + " first leg does not consume " + path.start_asset);
    }
    for (size_t i = 0; i + 1 < path.legs.size(); ++i) {
        if (path.legs[i].received() != path.legs[i + 1].consumed()) {
            throw InvalidPathError(where + " leg " + std::to_string(i + 1) + " receives " +
                                   path.legs[i].received() + " but leg " + std::to_string(i + 2) +
                                   " consumes " + path.legs[i + 1].consumed());
        }
    }
    if (path.legs.back().received() != path.start_asset) {
        throw InvalidPathError(where + " does not return to " + path.start_asset);
    }

    if (path.family == PathFamily::CROSS_VENUE) {
        const Leg& first = path.legs[0];
        const Leg& second = path.legs[1];
        if (path.legs.size() != 2 || first.pair != second.pair || first.venue == second.venue) {
            throw InvalidPathError(where + " cross-venue legs must trade one pair on two venues");
        }
        return;
    }

    if (path.legs.size() != 3) {
        throw InvalidPathError(where + " triangular path must have 3 legs");
    }
    std::set<Pair> pairs;
    for (const auto& leg : path.legs) {
        if (leg.venue != path.legs.front().venue) {
            throw InvalidPathError(where + " triangular legs must share one venue");
        }
        pairs.insert(leg.pair);
    }
    if (pairs.size() != 3 || path.assets().size() != 3) {
        throw InvalidPathError(where + " triangular path must use three pairs over three assets");
    }
}

const Path& PathCatalog::path(size_t id) const {
    if (id >= paths_.size()) {
        throw std::out_of_range("Unknown path id " + std::to_string(id));
    }
    return paths_[id];
}

std::vector<size_t> PathCatalog::paths_for_family(PathFamily family) const {
    std::vector<size_t> ids;
    for (const auto& path : paths_) {
        if (path.family == family) {
            ids.push_back(path.id);
        }
    }
    return ids;
}

std::vector<size_t> PathCatalog::paths_touching(const Asset& asset) const {
    std::vector<size_t> ids;
    for (const auto& path : paths_) {
        if (path.touches(asset)) {
            ids.push_back(path.id);
        }
    }
    return ids;
}

std::vector<size_t> PathCatalog::paths_using(const Venue& venue, const Pair& pair) const {
    auto it = paths_by_market_.find(market_key(venue, pair));
    return it == paths_by_market_.end() ? std::vector<size_t>{} : it->second;
}

std::optional<Leg> PathCatalog::find_market(const Venue& venue, const Asset& from, const Asset& to) const {
    if (from == to) {
        return std::nullopt;
    }
    if (has_market(venue, Pair{from, to})) {
        return Leg{venue, Pair{from, to}, OrderSide::SELL};
    }
    if (has_market(venue, Pair{to, from})) {
        return Leg{venue, Pair{to, from}, OrderSide::BUY};
    }
    return std::nullopt;
}

bool PathCatalog::has_market(const Venue& venue, const Pair& pair) const {
    auto it = markets_.find(venue);
    return it != markets_.end() && it->second.count(pair) > 0;
}

std::vector<Venue> PathCatalog::venues() const {
    std::vector<Venue> result;
    for (const auto& [venue, markets] : markets_) {
        result.push_back(venue);
    }
    return result;
}

void PathCatalog::add_path(PathFamily family, const Asset& start, std::vector<Leg> legs) {
    Path path;
    path.id = paths_.size();
    path.family = family;
    path.start_asset = start;
    path.legs = std::move(legs);

    validate(path);

    for (const auto& leg : path.legs) {
        auto& ids = paths_by_market_[market_key(leg.venue, leg.pair)];
        if (ids.empty() || ids.back() != path.id) {
            ids.push_back(path.id);
        }
    }
    ARBX_LOG_DEBUG("Catalog path {}", path.describe());
    paths_.push_back(std::move(path));
}

void PathCatalog::build_cross_venue_paths(const std::vector<VenueMarkets>& venues) {
    // Pairs in first-listed order, venues in declaration order.
    std::vector<Pair> pairs;
    std::map<Pair, std::vector<Venue>> venues_by_pair;
    for (const auto& venue : venues) {
        for (const auto& pair : venue.markets) {
            auto& listed = venues_by_pair[pair];
            if (listed.empty()) {
                pairs.push_back(pair);
            }
            if (std::find(listed.begin(), listed.end(), venue.venue) == listed.end()) {
                listed.push_back(venue.venue);
            }
        }
    }

    for (const auto& pair : pairs) {
        const auto& listed = venues_by_pair[pair];
        if (listed.size() < 2) {
            continue;
        }
        for (const auto& buy_venue : listed) {
            for (const auto& sell_venue : listed) {
                if (buy_venue == sell_venue) {
                    continue;
                }
                add_path(PathFamily::CROSS_VENUE, pair.quote,
                         {Leg{buy_venue, pair, OrderSide::BUY}, Leg{sell_venue, pair, OrderSide::SELL}});
            }
        }
    }
}

void PathCatalog::build_triangular_paths(const std::vector<VenueMarkets>& venues) {
    for (const auto& venue : venues) {
        std::set<Asset> listed_assets;
        for (const auto& pair : markets_[venue.venue]) {
            listed_assets.insert(pair.base);
            listed_assets.insert(pair.quote);
        }
        std::vector<Asset> assets(listed_assets.begin(), listed_assets.end());

        for (const auto& x : assets) {
            for (const auto& y : assets) {
                for (const auto& z : assets) {
                    if (x == y || y == z || x == z) {
                        continue;
                    }
                    auto first = find_market(venue.venue, x, y);
                    auto second = find_market(venue.venue, y, z);
                    auto third = find_market(venue.venue, z, x);
                    if (!first || !second || !third) {
                        continue;
                    }
                    add_path(PathFamily::TRIANGULAR, x, {*first, *second, *third});
                }
            }
        }
    }
}

} // namespace arbx
