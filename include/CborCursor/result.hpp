#pragma once

#include <optional>
#include <type_traits>
#include <utility>

#include "errors.hpp"

namespace CborCursor {

/// Value or error. Converts to true on success; `value()` must only be called
/// on a successful result.
template <class T>
class Result {
    std::optional<T> m_value;
    ErrorDetail m_error{};

public:
    using value_type = T;

    constexpr Result(T value): m_value(std::move(value)) {}
    constexpr Result(ErrorDetail error): m_error(error) {}

    template <class U>
        requires (!std::is_same_v<U, T> && std::is_constructible_v<T, U>)
    constexpr Result(Result<U> other)
        : m_error(other.detail()) {
        if (other) {
            m_value.emplace(std::move(other).value());
        }
    }

    constexpr explicit operator bool() const {
        return m_error.code == CborError::NO_ERROR && m_value.has_value();
    }

    constexpr const T& value() const & { return *m_value; }
    constexpr T& value() & { return *m_value; }
    constexpr T&& value() && { return std::move(*m_value); }

    constexpr const T& operator*() const & { return *m_value; }
    constexpr const T* operator->() const { return &*m_value; }

    constexpr T value_or(T fallback) const & {
        return m_value ? *m_value : std::move(fallback);
    }

    constexpr CborError error() const {
        return m_error.code;
    }
    constexpr const ErrorDetail& detail() const {
        return m_error;
    }
};

template <>
class Result<void> {
    ErrorDetail m_error{};

public:
    using value_type = void;

    constexpr Result() = default;
    constexpr Result(ErrorDetail error): m_error(error) {}

    constexpr explicit operator bool() const {
        return m_error.code == CborError::NO_ERROR;
    }
    constexpr CborError error() const {
        return m_error.code;
    }
    constexpr const ErrorDetail& detail() const {
        return m_error;
    }
};

} // namespace CborCursor
