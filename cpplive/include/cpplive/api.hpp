/*------------------------------------------------------------------------------
                Copyright Butterfly Energy Systems 2024.
           Distributed under the Boost Software License, Version 1.0.
              (See accompanying file LICENSE_1_0.txt or copy at
                    http://www.boost.org/LICENSE_1_0.txt)
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_API_HPP
#define CPPLIVE_API_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Defines macros related to exporting/importing APIs. */
//------------------------------------------------------------------------------

#ifdef CPPLIVE_COMPILED_LIB
#   define CPPLIVE_INLINE
#   if defined _WIN32 || defined __CYGWIN__
#       define CPPLIVE_API_IMPORT __declspec(dllimport)
#       define CPPLIVE_API_EXPORT __declspec(dllexport)
#       define CPPLIVE_API_HIDDEN
#   else
#       define CPPLIVE_API_IMPORT __attribute__((visibility("default")))
#       define CPPLIVE_API_EXPORT __attribute__((visibility("default")))
#       define CPPLIVE_API_HIDDEN __attribute__((visibility("hidden")))
#   endif
#   ifdef CPPLIVE_IS_STATIC
#       define CPPLIVE_API
#       define CPPLIVE_HIDDEN
#   else
#       ifdef cpplive_core_EXPORTS // We are building this library
#           define CPPLIVE_API CPPLIVE_API_EXPORT
#       else // We are using this library
#           define CPPLIVE_API CPPLIVE_API_IMPORT
#       endif
#       define CPPLIVE_HIDDEN CPPLIVE_API_HIDDEN
#   endif
#else
#   define CPPLIVE_INLINE inline
#   define CPPLIVE_API
#   define CPPLIVE_HIDDEN
#endif

#endif // CPPLIVE_API_HPP
