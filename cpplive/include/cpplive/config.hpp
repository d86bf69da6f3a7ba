/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_CONFIG_HPP
#define CPPLIVE_CONFIG_HPP

//------------------------------------------------------------------------------
#if defined(__cpp_inline_variables) || defined(CPPLIVE_FOR_DOXYGEN)
#define CPPLIVE_INLINE_VARIABLE inline
#else
#define CPPLIVE_INLINE_VARIABLE
#endif

//------------------------------------------------------------------------------
#if (defined(__has_cpp_attribute) && __has_cpp_attribute(nodiscard)) \
    || defined(CPPLIVE_FOR_DOXYGEN)
#define CPPLIVE_NODISCARD [[nodiscard]]
#else
#define CPPLIVE_NODISCARD
#endif

//------------------------------------------------------------------------------
#if (defined(__cpp_constexpr) && (__cpp_constexpr >= 201304)) \
    || defined(CPPLIVE_FOR_DOXYGEN)
#define CPPLIVE_HAS_RELAXED_CONSTEXPR 1
#define CPPLIVE_CONSTEXPR14 constexpr
#else
#define CPPLIVE_CONSTEXPR14
#endif

#endif // CPPLIVE_CONFIG_HPP
