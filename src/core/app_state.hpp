#pragma once

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "types.hpp"

namespace arbx {

struct PerformanceSummary {
    uint64_t total_executions = 0;
    uint64_t completed = 0;
    uint64_t rolled_back = 0;
    uint64_t partially_stranded = 0;
    uint64_t profitable = 0;
    double win_rate_pct = 0.0;
    std::map<Asset, Decimal> realized_profit;   // per start asset
    std::optional<ExecutionResult> best;
    std::optional<ExecutionResult> worst;
};

// Process-wide run flag plus the ledger of finished executions.
class AppState {
public:
    explicit AppState(size_t history_limit = 1000) : running_(true), history_limit_(history_limit) {}

    void shutdown() { running_ = false; }
    bool is_running() const { return running_; }

    void record_execution(const ExecutionResult& result);

    std::vector<ExecutionResult> recent_executions(size_t limit) const;
    PerformanceSummary summary() const;

    void record_alert(const Alert& alert);
    std::vector<Alert> alerts() const;

private:
    std::atomic<bool> running_;
    size_t history_limit_;

    mutable std::mutex mutex_;
    std::deque<ExecutionResult> history_;
    std::deque<Alert> alerts_;
    PerformanceSummary summary_;
};

} // namespace arbx
