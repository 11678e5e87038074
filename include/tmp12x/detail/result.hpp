#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace tmp12x {

template<typename E>
struct error_value {
    E value;
};

template<typename E>
constexpr error_value<std::decay_t<E>> make_error(E &&e) {
    return {std::forward<E>(e)};
}

/// Either a value of type T or an error of type E, never both.
template<typename T, typename E>
struct result {
    constexpr result(T const &v) : storage_(std::in_place_index<0>, v) {}
    constexpr result(T &&v) : storage_(std::in_place_index<0>, std::move(v)) {}

    template<typename F>
    constexpr result(error_value<F> &&e) : storage_(std::in_place_index<1>, std::move(e.value)) {}

    constexpr bool has_value() const noexcept {
        return storage_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept {
        return has_value();
    }

    constexpr T &value() & { return std::get<0>(storage_); }
    constexpr T const &value() const & { return std::get<0>(storage_); }
    constexpr T &&value() && { return std::get<0>(std::move(storage_)); }

    constexpr E &error() & { return std::get<1>(storage_); }
    constexpr E const &error() const & { return std::get<1>(storage_); }

    constexpr T const *operator->() const { return &value(); }
    constexpr T const &operator*() const & { return value(); }

private:
    std::variant<T, E> storage_;
};

template<typename E>
struct result<void, E> {
    constexpr result() noexcept = default;

    template<typename F>
    constexpr result(error_value<F> &&e) : error_(std::move(e.value)) {}

    constexpr bool has_value() const noexcept {
        return not error_.has_value();
    }

    constexpr explicit operator bool() const noexcept {
        return has_value();
    }

    constexpr E const &error() const & { return *error_; }

private:
    std::optional<E> error_;
};

}
