#pragma once

#include <functional>
#include <utility>
#include <variant>

/**
 * @brief Outcome of an operation that either produces a value or a typed error.
 *
 * Alternatives are addressed by index so that T and E may be the same type.
 */
template <typename T, typename E>
class Result
{
public:
    static Result Success(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result Failure(E error)
    {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool ok() const { return data_.index() == 0; }

    const T &value() const { return std::get<0>(data_); }
    T &value() { return std::get<0>(data_); }

    const E &error() const { return std::get<1>(data_); }
    E &error() { return std::get<1>(data_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V &&v) : data_(index, std::forward<V>(v)) {}

    std::variant<T, E> data_;
};

/**
 * @brief Completion handler of a suspended operation. Invoked exactly once.
 */
template <typename T>
using Completion = std::function<void(T)>;
