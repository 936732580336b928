#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace reading_service {
namespace core {

// Holds either a value or an error. Index 0 is always the value, so T and E may be the same type.
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool IsOk() const { return m_data.index() == 0; }
    bool IsError() const { return m_data.index() == 1; }
    explicit operator bool() const { return IsOk(); }

    T& Value() { return std::get<0>(m_data); }
    const T& Value() const { return std::get<0>(m_data); }

    E& Error() { return std::get<1>(m_data); }
    const E& Error() const { return std::get<1>(m_data); }

private:
    template <std::size_t Index, typename U>
    Result(std::in_place_index_t<Index> tag, U&& value)
        : m_data(tag, std::forward<U>(value)) {
    }

    std::variant<T, E> m_data;
};

} // namespace core
} // namespace reading_service
