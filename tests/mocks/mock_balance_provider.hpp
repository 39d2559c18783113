#pragma once

#include "exchange/exchange_interface.hpp"
#include <gmock/gmock.h>

namespace arbx {
namespace mocks {

class MockBalanceProvider : public BalanceProvider {
public:
    MOCK_METHOD(Decimal, available, (const Venue& venue, const Asset& asset), (override));
};

} // namespace mocks
} // namespace arbx
