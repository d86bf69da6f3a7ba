/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_ERRORCODES_HPP
#define CPPLIVE_ERRORCODES_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Provides error codes and their categories. */
//------------------------------------------------------------------------------

#include <string>
#include <system_error>
#include "api.hpp"

namespace live
{

//------------------------------------------------------------------------------
/** Converts an error code to a string containing the category and number. */
//-----------------------------------------------------------------------------
CPPLIVE_API std::string briefErrorCodeString(std::error_code ec);

//------------------------------------------------------------------------------
/** Converts an error to a string containing the category, number, and
    associated message. */
//-----------------------------------------------------------------------------
CPPLIVE_API std::string detailedErrorCodeString(std::error_code ec);


//******************************************************************************
// Real-time Layer Error Codes
//******************************************************************************

//------------------------------------------------------------------------------
/** %Error code values used with the LiveCategory error category.
    The first group doubles as the error taxonomy reported to clients. The
    finer-grained codes that follow are equivalent to one of them:

    std::error_code                            | Equivalent condition value
    ------------------------------------------ | --------------------------
    make_error_code(LiveErrc::archived)        | unauthorized
    make_error_code(LiveErrc::noSuchTopic)     | notFound
    make_error_code(LiveErrc::noSuchMessage)   | notFound
    make_error_code(LiveErrc::noSuchReaction)  | notFound
    make_error_code(LiveErrc::noSuchMeta)      | notFound
    make_error_code(LiveErrc::notJoined)       | invalid
    make_error_code(LiveErrc::alreadyJoined)   | invalid
    make_error_code(LiveErrc::storeTimeout)    | storeFailure */
//------------------------------------------------------------------------------
enum class LiveErrc
{
    success        =  0, ///< Operation successful

    // Taxonomy
    unauthorized   =  1, ///< Join denied, or action on an entity not permitted
    notFound       =  2, ///< Unknown topic, message or reaction
    invalid        =  3, ///< Malformed command payload or missing field
    storeFailure   =  4, ///< A collaborator call failed
    backpressure   =  5, ///< Session outbound queue overflow

    // Refinements
    archived       =  6, ///< The channel is archived
    noSuchTopic    =  7, ///< The topic name is malformed or unknown
    noSuchMessage  =  8, ///< No message exists with the given ID
    noSuchReaction =  9, ///< No matching reaction exists
    noSuchMeta     = 10, ///< No presence meta exists for the device
    notJoined      = 11, ///< The command targets a topic that is not joined
    alreadyJoined  = 12, ///< The topic is already joined on this connection
    storeTimeout   = 13, ///< A collaborator call timed out

    // Session termination reasons
    internalFault  = 14, ///< An unhandled fault occurred while processing
    topicRestarted = 15, ///< The topic owner was restarted
    sessionClosed  = 16, ///< The session was left or closed normally
    disconnected   = 17, ///< The client connection was lost

    count
};

//------------------------------------------------------------------------------
/** std::error_category used for reporting errors in the real-time layer.
    @see LiveErrc */
//------------------------------------------------------------------------------
class CPPLIVE_API LiveCategory : public std::error_category
{
public:
    /** Obtains the name of the category. */
    virtual const char* name() const noexcept override;

    /** Obtains the explanatory string. */
    virtual std::string message(int ev) const override;

    /** Compares `error_code` and and error condition for equivalence. */
    virtual bool equivalent(const std::error_code& code,
                            int condition) const noexcept override;

private:
    CPPLIVE_HIDDEN LiveCategory();

    friend LiveCategory& liveCategory();
};

//------------------------------------------------------------------------------
/** Obtains a reference to the static error category object for Live errors.
    @relates LiveCategory */
//------------------------------------------------------------------------------
CPPLIVE_API LiveCategory& liveCategory();

//------------------------------------------------------------------------------
/** Creates an error code value from a LiveErrc enumerator.
    @relates LiveCategory */
//-----------------------------------------------------------------------------
CPPLIVE_API std::error_code make_error_code(LiveErrc errc);

//------------------------------------------------------------------------------
/** Creates an error condition value from a LiveErrc enumerator.
    @relates LiveCategory */
//-----------------------------------------------------------------------------
CPPLIVE_API std::error_condition make_error_condition(LiveErrc errc);

//------------------------------------------------------------------------------
/** Obtains the reason string sent to clients in `error` events for the given
    error code belonging to LiveCategory.
    @relates LiveCategory */
//-----------------------------------------------------------------------------
CPPLIVE_API const std::string& errorCodeToReason(LiveErrc errc);

//------------------------------------------------------------------------------
/** Generates a client reason string corresponding to the given error code.
    Codes outside of LiveCategory are reported as `store_failure`.
    @relates LiveCategory */
//-----------------------------------------------------------------------------
CPPLIVE_API std::string errorCodeToReason(std::error_code ec);

//------------------------------------------------------------------------------
/** Looks up the LiveErrc enumerator that corresponds to the given reason.
    Returns LiveErrc::count if there is no match.
    @relates LiveCategory */
//-----------------------------------------------------------------------------
CPPLIVE_API LiveErrc reasonToErrorCode(const std::string& reason);

} // namespace live


#if !defined CPPLIVE_FOR_DOXYGEN
namespace std
{

template <>
struct CPPLIVE_API is_error_condition_enum<live::LiveErrc>
    : public true_type
{};

} // namespace std
#endif // !CPPLIVE_FOR_DOXYGEN

#ifndef CPPLIVE_COMPILED_LIB
#include "internal/errorcodes.inl.hpp"
#endif

#endif // CPPLIVE_ERRORCODES_HPP
