#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace arbx {

template<typename T, typename E = std::string>
class Result {
    static_assert(!std::is_same_v<T, E>, "Result value and error types must differ");

private:
    std::variant<T, E> value_;

public:
    Result(T value) : value_(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : value_(std::in_place_index<1>, std::move(error)) {}

    static Result<T, E> success(T value) {
        return Result<T, E>(std::move(value));
    }

    static Result<T, E> error(E error) {
        return Result<T, E>(std::move(error));
    }

    bool is_success() const {
        return value_.index() == 0;
    }

    bool is_error() const {
        return value_.index() == 1;
    }

    const T& value() const {
        return std::get<0>(value_);
    }

    T& value() {
        return std::get<0>(value_);
    }

    const E& error() const {
        return std::get<1>(value_);
    }
};

} // namespace arbx
