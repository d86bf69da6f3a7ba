/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_COMPILED_LIB
#error CPPLIVE_COMPILED_LIB must be defined to use this source file
#endif

#include <cpplive/config.hpp>

#include <cpplive/internal/authorizationgate.inl.hpp>
#include <cpplive/internal/connection.inl.hpp>
#include <cpplive/internal/consolelogger.inl.hpp>
#include <cpplive/internal/errorcodes.inl.hpp>
#include <cpplive/internal/event.inl.hpp>
#include <cpplive/internal/exceptions.inl.hpp>
#include <cpplive/internal/hub.inl.hpp>
#include <cpplive/internal/huboptions.inl.hpp>
#include <cpplive/internal/logging.inl.hpp>
#include <cpplive/internal/memorychanneldirectory.inl.hpp>
#include <cpplive/internal/memorymessagestore.inl.hpp>
#include <cpplive/internal/presence.inl.hpp>
#include <cpplive/internal/topicuri.inl.hpp>
#include <cpplive/internal/wire.inl.hpp>
