/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_ERROROR_HPP
#define CPPLIVE_ERROROR_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ErrorOr template class. */
//------------------------------------------------------------------------------

#include <cassert>
#include <memory>
#include <system_error>
#include <type_traits>
#include <utility>
#include "api.hpp"
#include "exceptions.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Wrapper type used to initialize an ErrorOr with an error in an
    unambiguous manner.
    @see ErrorOr */
//------------------------------------------------------------------------------
template <typename E>
class Unexpected
{
public:
    using error_type = E; ///< Type representing errors.

    Unexpected() = delete;

    /** Constructor taking an error value. */
    explicit Unexpected(error_type error) noexcept : error_(std::move(error)) {}

    /** Accesses the error value. */
    const error_type& value() const& noexcept {return error_;}

    /** Moves the error value. */
    error_type&& value() && noexcept {return std::move(error_);}

private:
    error_type error_;
};

/** Equality comparison.
    @relates Unexpected */
template <typename E1, typename E2>
bool operator==(const Unexpected<E1>& x, const Unexpected<E2>& y)
{
    return x.value() == y.value();
}

/** Factory function needed in C++11 due to lack of CTAD.
    @relates Unexpected */
template <typename E>
constexpr Unexpected<typename std::decay<E>::type> makeUnexpected(E&& error)
{
    return Unexpected<typename std::decay<E>::type>{std::forward<E>(error)};
}

//------------------------------------------------------------------------------
/** Type alias for Unexpected<std::error_code>. */
using UnexpectedError = Unexpected<std::error_code>;

//------------------------------------------------------------------------------
/** Convenience function that creates an UnexpectedError from
    an error code enum. */
//------------------------------------------------------------------------------
template <typename TErrorEnum>
UnexpectedError makeUnexpectedError(TErrorEnum errc)
{
    return UnexpectedError(make_error_code(errc));
}


//------------------------------------------------------------------------------
/** Minimalistic stand-in for `std::expected<T, std::error_code>`.
    @tparam T The contained value type when there is no error. It must be
              default constructible.
    @see UnexpectedError */
//------------------------------------------------------------------------------
template <typename T>
class ErrorOr
{
public:
    using value_type = T;               ///< Type representing result values.
    using error_type = std::error_code; ///< Type representing errors.

    /** Default constructor. */
    ErrorOr() = default;

    // NOLINTBEGIN(google-explicit-constructor)

    /** Converting constructor taking a value. */
    ErrorOr(value_type value) : value_(std::move(value)) {}

    /** Converting constructor taking an Unexpected. */
    template <typename G>
    ErrorOr(Unexpected<G> unex)
        : value_(),
          error_(std::move(unex).value()),
          hasError_(true)
    {}

    // NOLINTEND(google-explicit-constructor)

    /** Unchecked access of a member of the stored value. */
    value_type* operator->()
    {
        assert(has_value());
        return std::addressof(value_);
    }

    /** Unchecked access of a member of the stored value. */
    const value_type* operator->() const
    {
        assert(has_value());
        return std::addressof(value_);
    }

    /** Unchecked access of the stored value.
        @pre `this->has_value() == true` */
    value_type& operator*() &
    {
        assert(has_value());
        return value_;
    }

    /** Unchecked move of the stored value.
        @pre `this->has_value() == true` */
    value_type&& operator*() &&
    {
        assert(has_value());
        return std::move(value_);
    }

    /** Unchecked access of the stored value.
        @pre `this->has_value() == true` */
    const value_type& operator*() const&
    {
        assert(has_value());
        return value_;
    }

    /** Indicates if a value is being contained. */
    explicit operator bool() const noexcept {return has_value();}

    /** Indicates if a value is being contained. */
    bool has_value() const noexcept {return !hasError_;}

    /** Checked access of the stored value.
        @throws error::Failure if `this->has_value() == false` */
    value_type& value() &
    {
        checkError();
        return value_;
    }

    /** Checked move of the stored value.
        @throws error::Failure if `this->has_value() == false` */
    value_type&& value() &&
    {
        checkError();
        return std::move(value_);
    }

    /** Checked access of the stored value.
        @throws error::Failure if `this->has_value() == false` */
    const value_type& value() const&
    {
        checkError();
        return value_;
    }

    /** Unchecked access of the stored error.
        @pre `this->has_value() == false` */
    const error_type& error() const
    {
        assert(!has_value());
        return error_;
    }

    /** Returns the stored value if it exists, or the given fallback value. */
    template <typename U>
    value_type value_or(U&& v) const&
    {
        if (!has_value())
            return std::forward<U>(v);
        return value_;
    }

private:
    void checkError() const
    {
        if (hasError_)
            throw error::Failure{error_};
    }

    value_type value_;
    error_type error_;
    bool hasError_ = false;
};

/** Equality comparison with a value.
    @relates ErrorOr */
template <typename T1, typename T2>
bool operator==(const ErrorOr<T1>& x, const T2& v)
{
    return x.has_value() ? *x == v : false;
}

/** Equality comparison with an error.
    @relates ErrorOr */
template <typename T, typename E>
bool operator==(const ErrorOr<T>& x, const Unexpected<E>& e)
{
    return x.has_value() ? false : x.error() == e.value();
}

//------------------------------------------------------------------------------
/** Used to conveniently check if an operation completed. */
//------------------------------------------------------------------------------
using ErrorOrDone = ErrorOr<bool>;

} // namespace live

#endif // CPPLIVE_ERROROR_HPP
