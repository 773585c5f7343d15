#pragma once

#include <dockgrader/common/formatters/debug.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace dockgrader {

struct UnexpectedT
{
};

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<ExpectedT, Args...>)
        : data_{std::in_place_type<ExpectedT>, std::forward<Args>(args)...} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
        : data_{std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::is_convertible_v<Eu, T>)
        : data_{std::forward<Eu>(error)} {}

    template <typename Eu>
    constexpr Expected(UnexpectedT /*unused*/, Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E>)
        : data_{E{std::forward<Eu>(error)}} {}

    constexpr bool has_value() const {
        if constexpr (std::is_void_v<T>) {
            return std::holds_alternative<std::monostate>(data_.data);
        } else {
            return std::holds_alternative<T>(data_.data);
        }
    }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        return const_cast<U&>(const_cast<const Expected*>(this)->value());
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        static_assert(std::same_as<U, T>,
                      "Do not attempt to instantiate Expected<T,E>::value() for any type other than T");
        ASSERT(has_value());
        return std::get<U>(data_.data);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        static_assert(std::same_as<U, T>,
                      "Do not attempt to instantiate Expected<T,E>::value() for any type other than T");
        ASSERT(has_value());
    }

    template <typename U = T>
    constexpr U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<T>(data_.data);
    }

    constexpr E error() const {
        ASSERT(!has_value());
        return std::get<E>(data_.data);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<E>(data_.data);
    }

    template <typename Func>
    constexpr Expected<std::invoke_result_t<Func, T>, E> transform(const Func& func) const
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return Expected<std::invoke_result_t<Func, T>, E>{UnexpectedT{}, error()};
        }

        return func(value());
    }

private:
    template <typename Td, typename Ed>
    struct ExpectedData
    {
        std::variant<Td, Ed> data;
        constexpr bool operator==(const ExpectedData& rhs) const = default;
    };

    template <typename Ed>
    struct ExpectedData<void, Ed>
    {
        std::variant<std::monostate, Ed> data;
        constexpr bool operator==(const ExpectedData& rhs) const = default;
    };

public:
    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && (std::is_void_v<T> || std::equality_comparable<T>))
    {
        return data_ == rhs.data_;
    }

    template <typename Tu>
    constexpr bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        if (!has_value()) {
            return false;
        }

        return value() == rhs;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<Eu, T>))
    {
        if (has_value()) {
            return false;
        }

        return error() == rhs;
    }

private:
    ExpectedData<T, E> data_;
};

} // namespace dockgrader

template <typename T, typename E>
struct fmt::formatter<::dockgrader::Expected<T, E>> : ::dockgrader::DebugFormatter
{
    auto format(const ::dockgrader::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", format_impl(from));
    }

private:
    std::string format_impl(const ::dockgrader::Expected<T, E>& from) const {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::same_as<T, void>) {
            return "Expected(void)";
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
