#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace arbx {

struct VenueMarkets {
    Venue venue;
    std::vector<Pair> markets;
};

// Every tradable 2-leg cross-venue and 3-leg triangular cycle, built once at
// startup and immutable afterwards. Path ids are indices into all_paths().
class PathCatalog {
public:
    // Throws ConfigurationError for a market outside the universe and
    // InvalidPathError if a generated path breaks chain continuity.
    PathCatalog(const std::vector<Asset>& universe, const std::vector<VenueMarkets>& venues);

    static PathCatalog from_config(const EngineConfig& config);

    // Chain continuity and family shape; throws InvalidPathError.
    static void validate(const Path& path);

    const std::vector<Path>& all_paths() const { return paths_; }
    size_t size() const { return paths_.size(); }

    // Throws std::out_of_range for an unknown id.
    const Path& path(size_t id) const;

    std::vector<size_t> paths_for_family(PathFamily family) const;
    std::vector<size_t> paths_touching(const Asset& asset) const;

    // Paths with a leg on exactly this venue market.
    std::vector<size_t> paths_using(const Venue& venue, const Pair& pair) const;

    // The single leg converting `from` into `to` on `venue`: Sell from/to if
    // listed, otherwise Buy to/from.
    std::optional<Leg> find_market(const Venue& venue, const Asset& from, const Asset& to) const;

    bool has_market(const Venue& venue, const Pair& pair) const;
    std::vector<Venue> venues() const;

private:
    void add_path(PathFamily family, const Asset& start, std::vector<Leg> legs);
    void build_cross_venue_paths(const std::vector<VenueMarkets>& venues);
    void build_triangular_paths(const std::vector<VenueMarkets>& venues);

    std::set<Asset> universe_;
    std::map<Venue, std::set<Pair>> markets_;
    std::vector<Path> paths_;
    std::map<std::string, std::vector<size_t>> paths_by_market_;
};

} // namespace arbx
