#pragma once

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace gradebox {

/**
 * @brief A small stand-in for C++23's std::expected, built on std::variant
 *
 * @tparam T The expected value type (may be void)
 * @tparam E The error type
 *
 * Construction is implicit from either a T or an E, so T and E must not be convertible
 * to one another. Accessing the wrong alternative is an assertion failure.
 */
template <typename T = void, typename E = std::error_code>
class [[nodiscard]] Expected
{
    using ValueStorage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    static_assert(!std::is_same_v<ValueStorage, E>, "Expected<T, E> requires T and E to be distinct types");

public:
    using ValueT = T;
    using ErrorT = E;

    Expected()
        requires(std::is_void_v<T> || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename U>
    Expected(U&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && !std::same_as<std::remove_cvref_t<U>, Expected> &&
                 std::convertible_to<U, ValueStorage>)
        : data_{std::in_place_index<0>, std::forward<U>(value)} {}

    template <typename G>
    Expected(G&& error) // NOLINT(*-explicit-*)
        requires(!std::same_as<std::remove_cvref_t<G>, Expected> && std::convertible_to<G, E> &&
                 (std::is_void_v<T> || !std::convertible_to<G, ValueStorage>))
        : data_{std::in_place_index<1>, std::forward<G>(error)} {}

    bool has_value() const noexcept { return data_.index() == 0; }
    bool has_error() const noexcept { return !has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    decltype(auto) value() & {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        if constexpr (std::is_void_v<T>) {
            return;
        } else {
            return std::get<0>(data_);
        }
    }

    decltype(auto) value() const& {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        if constexpr (std::is_void_v<T>) {
            return;
        } else {
            return std::get<0>(data_);
        }
    }

    decltype(auto) value() && {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        if constexpr (std::is_void_v<T>) {
            return;
        } else {
            return std::move(std::get<0>(data_));
        }
    }

    ValueStorage& operator*()
        requires(!std::is_void_v<T>)
    {
        return value();
    }

    const ValueStorage& operator*() const
        requires(!std::is_void_v<T>)
    {
        return value();
    }

    ValueStorage* operator->()
        requires(!std::is_void_v<T>)
    {
        return &value();
    }

    const ValueStorage* operator->() const
        requires(!std::is_void_v<T>)
    {
        return &value();
    }

    const E& error() const {
        ASSERT(has_error(), "error() called on an Expected holding a value");
        return std::get<1>(data_);
    }

    template <typename U>
    ValueStorage value_or(U&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<U, ValueStorage>)
    {
        if (has_value()) {
            return std::get<0>(data_);
        }
        return static_cast<ValueStorage>(std::forward<U>(default_value));
    }

    template <typename G>
    E error_or(G&& default_error) const
        requires(std::convertible_to<G, E>)
    {
        if (has_error()) {
            return std::get<1>(data_);
        }
        return static_cast<E>(std::forward<G>(default_error));
    }

    /// Apply `func` to the contained value, if there is one; errors pass through untouched
    template <typename Func>
        requires(!std::is_void_v<T>)
    auto transform(Func&& func) const -> Expected<std::invoke_result_t<Func, const ValueStorage&>, E> {
        if (has_error()) {
            return error();
        }
        return std::invoke(std::forward<Func>(func), std::get<0>(data_));
    }

    friend bool operator==(const Expected& lhs, const Expected& rhs) = default;

    template <typename U>
    bool operator==(const U& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<U, Expected> && std::equality_comparable_with<U, T>)
    {
        return has_value() && std::get<0>(data_) == rhs;
    }

    template <typename G>
    bool operator==(const G& rhs) const
        requires(!std::same_as<G, Expected> && std::equality_comparable_with<G, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<G, T>))
    {
        return has_error() && std::get<1>(data_) == rhs;
    }

private:
    std::variant<ValueStorage, E> data_;
};

} // namespace gradebox

template <typename T, typename E>
struct fmt::formatter<::gradebox::Expected<T, E>> : fmt::formatter<std::string>
{
    auto format(const ::gradebox::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(format_impl(from), ctx);
    }

private:
    static std::string format_impl(const ::gradebox::Expected<T, E>& from) {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::is_void_v<T>) {
            return "Expected(void)";
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
