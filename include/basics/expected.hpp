#pragma once

#include <boost/outcome.hpp>

#include <concepts>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace dnmm {

// Expected is a stand-in for std::expected built on boost::outcome_v2::result.
// Accessing the wrong alternative throws bad_expected_access.

struct bad_expected_access : public std::runtime_error {
    bad_expected_access() : std::runtime_error("bad expected access") {}
};

namespace detail {

struct throw_policy : public boost::outcome_v2::policy::base {
    template <class Impl>
    static constexpr void wide_value_check(Impl&& self) {
        if (!base::_has_value(std::forward<Impl>(self)))
            throw bad_expected_access();
    }

    template <class Impl>
    static constexpr void wide_error_check(Impl&& self) {
        if (!base::_has_error(std::forward<Impl>(self)))
            throw bad_expected_access();
    }

    template <class Impl>
    static constexpr void wide_exception_check(Impl&& self) {
        if (!base::_has_exception(std::forward<Impl>(self)))
            throw bad_expected_access();
    }
};

} // namespace detail

template <class E>
class Unexpected {
public:
    static_assert(!std::is_same_v<E, void>, "E must not be void");

    Unexpected() = delete;

    constexpr explicit Unexpected(const E& e) : val_(e) {}
    constexpr explicit Unexpected(E&& e) : val_(std::move(e)) {}

    constexpr const E& value() const& { return val_; }
    constexpr E& value() & { return val_; }
    constexpr E&& value() && { return std::move(val_); }

private:
    E val_;
};

template <class T, class E>
class [[nodiscard]] Expected
    : private boost::outcome_v2::result<T, E, detail::throw_policy> {
    using Base = boost::outcome_v2::result<T, E, detail::throw_policy>;

public:
    template <typename U>
        requires std::convertible_to<U, T>
    constexpr Expected(U&& r)
        : Base(boost::outcome_v2::in_place_type<T>, std::forward<U>(r)) {}

    template <typename U>
        requires std::convertible_to<U, E> && (!std::is_reference_v<U>)
    constexpr Expected(Unexpected<U> e)
        : Base(boost::outcome_v2::in_place_type<E>, std::move(e.value())) {}

    constexpr bool has_value() const { return Base::has_value(); }

    constexpr const T& value() const { return Base::value(); }
    constexpr T& value() { return Base::value(); }

    constexpr const E& error() const { return Base::error(); }
    constexpr E& error() { return Base::error(); }

    constexpr explicit operator bool() const { return has_value(); }

    constexpr T& operator*() { return this->value(); }
    constexpr const T& operator*() const { return this->value(); }
    constexpr T* operator->() { return &this->value(); }
    constexpr const T* operator->() const { return &this->value(); }
};

// Success carries no value; failure carries the reason.
template <class E>
class [[nodiscard]] Expected<void, E>
    : private boost::outcome_v2::result<void, E, detail::throw_policy> {
    using Base = boost::outcome_v2::result<void, E, detail::throw_policy>;

public:
    constexpr Expected() : Base(boost::outcome_v2::success()) {}

    template <typename U>
        requires std::convertible_to<U, E> && (!std::is_reference_v<U>)
    constexpr Expected(Unexpected<U> e)
        : Base(boost::outcome_v2::in_place_type<E>, std::move(e.value())) {}

    constexpr bool has_value() const { return Base::has_value(); }

    constexpr const E& error() const { return Base::error(); }
    constexpr E& error() { return Base::error(); }

    constexpr explicit operator bool() const { return Base::has_value(); }
};

} // namespace dnmm
