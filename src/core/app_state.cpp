#include "app_state.hpp"

#include <algorithm>
#include <cstddef>

namespace arbx {

namespace {

// Profit relative to the committed size, so executions in different start
// assets rank on one scale.
Decimal return_pct(const ExecutionResult& result) {
    if (!result.start_size.is_positive()) {
        return Decimal::zero();
    }
    return result.realized_profit / result.start_size * Decimal::hundred();
}

} // namespace

void AppState::record_execution(const ExecutionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    history_.push_back(result);
    while (history_.size() > history_limit_) {
        history_.pop_front();
    }

    ++summary_.total_executions;
    switch (result.terminal_state) {
        case TerminalState::COMPLETED: ++summary_.completed; break;
        case TerminalState::ROLLED_BACK: ++summary_.rolled_back; break;
        case TerminalState::PARTIALLY_STRANDED: ++summary_.partially_stranded; break;
    }
    if (result.realized_profit.is_positive()) {
        ++summary_.profitable;
    }
    summary_.win_rate_pct = static_cast<double>(summary_.profitable) /
                            static_cast<double>(summary_.total_executions) * 100.0;

    // Rolled back executions never committed capital.
    if (result.terminal_state == TerminalState::ROLLED_BACK) {
        return;
    }
    summary_.realized_profit[result.start_asset] += result.realized_profit;

    if (!summary_.best || return_pct(result) > return_pct(*summary_.best)) {
        summary_.best = result;
    }
    if (!summary_.worst || return_pct(result) < return_pct(*summary_.worst)) {
        summary_.worst = result;
    }
}

std::vector<ExecutionResult> AppState::recent_executions(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = std::min(limit, history_.size());
    return std::vector<ExecutionResult>(history_.end() - static_cast<std::ptrdiff_t>(count), history_.end());
}

PerformanceSummary AppState::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_;
}

void AppState::record_alert(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);
    alerts_.push_back(alert);
    while (alerts_.size() > history_limit_) {
        alerts_.pop_front();
    }
}

std::vector<Alert> AppState::alerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Alert>(alerts_.begin(), alerts_.end());
}

} // namespace arbx
