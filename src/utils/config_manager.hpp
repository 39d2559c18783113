#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_types.hpp"
#include "config_validator.hpp"

namespace arbx {

// Parses, validates and publishes EngineConfig snapshots. Readers take a
// snapshot once per cycle; a reload swaps the snapshot atomically and never
// mutates one already handed out.
class ConfigManager {
public:
    using Snapshot = std::shared_ptr<const EngineConfig>;

    ConfigManager();

    bool load(const std::string& file_path);
    bool load_from_json(const nlohmann::json& config_data);

    // Re-reads the file given to the last successful load(). On failure the
    // current snapshot stays published.
    bool reload();

    Snapshot snapshot() const;

    const std::vector<ConfigIssue>& last_issues() const { return last_issues_; }
    const std::string& last_error() const { return last_error_; }

private:
    mutable std::mutex mutex_;
    Snapshot current_;
    std::string file_path_;
    std::vector<ConfigIssue> last_issues_;
    std::string last_error_;

    void publish(EngineConfig config);
};

} // namespace arbx
