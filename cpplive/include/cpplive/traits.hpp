/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_TRAITS_HPP
#define CPPLIVE_TRAITS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains general-purpose type traits. */
//------------------------------------------------------------------------------

#include <type_traits>

/* Hides Needs decorations in order to keep the generated Doxygen
   documentation clean. */
#ifdef CPPLIVE_FOR_DOXYGEN
#define CPPLIVE_NEEDS(cond)
#else
#define CPPLIVE_NEEDS(cond) Needs<(cond)>
#endif

namespace live
{

//------------------------------------------------------------------------------
/** Metafunction used to enable overloads based on a boolean condition. */
//------------------------------------------------------------------------------
template<bool B, typename T = int>
using Needs = typename std::enable_if<B,T>::type;

} // namespace live

#endif // CPPLIVE_TRAITS_HPP
