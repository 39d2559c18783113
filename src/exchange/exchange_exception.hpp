#pragma once

#include <stdexcept>
#include <string>

namespace arbx {

// Thrown by venue adapters when a request cannot be accepted.
class ExchangeException : public std::runtime_error {
public:
    ExchangeException(const std::string& venue, const std::string& message)
        : std::runtime_error(venue + ": " + message), venue_(venue) {}

    const std::string& venue() const { return venue_; }

private:
    std::string venue_;
};

} // namespace arbx
