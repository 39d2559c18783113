#pragma once

#include "types.hpp"
#include <string>
#include <variant>

namespace arbx {

struct OpportunityEvent {
    Opportunity opportunity;
    std::string path;
};

struct ExecutionResultEvent {
    ExecutionResult result;
};

struct AlertEvent {
    Alert alert;
};

using Event = std::variant<OpportunityEvent, ExecutionResultEvent, AlertEvent>;

} // namespace arbx
