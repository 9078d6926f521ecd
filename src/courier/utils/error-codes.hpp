#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup courier-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // Publishing while the channel is down
 * return make_error_code(ecode::not_connected);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace courier
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of courier error codes.
 */
enum class ecode : int {
   okay = 0,           //!< i.e., everything's okay.
   logic_error,        //!< Faulty logic in the program.
   exception_occurred, //!< Exception caught and forwarded as an error_code.
   argument_error,     //!< An invalid argument was supplied.

   stream_not_ready, //!< I/O stream is not ready.
   premature_eof,    //!< I/O stream encountered premature end-of-file.
   fail,             //!< I/O stream set the `fail` bit.
   bad,              //!< I/O stream set the `bad` bit.
   object_too_large, //!< Attempt to read/write an object that is too large.
   invalid_data,     //!< Input data (file/network/config/etc.) was invalid.

   serialization_error,   //!< A message could not be encoded.
   deserialization_error, //!< A message body could not be decoded.
   not_connected,         //!< The channel is not connected to the broker.
   channel_closed,        //!< The channel was closed by its owner.
   unknown_exchange,      //!< Publish or bind to an exchange that does not exist.
   unknown_queue,         //!< Consume or bind to a queue that does not exist.
   precondition_failed,   //!< Redeclaration with different parameters, or passive miss.
   resource_locked        //!< Exclusive queue owned by another channel.
};
} // namespace courier

namespace std
{
template<> struct is_error_code_enum<courier::ecode> : true_type
{};
} // namespace std

namespace courier
{
error_code make_error_code(ecode);
} // namespace courier
