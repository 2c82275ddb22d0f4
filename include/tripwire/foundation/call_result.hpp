#pragma once

/// @file call_result.hpp
/// @brief CallResult<T> alias binding Result to foundation::Error.

#include "tripwire/core/result.hpp"
#include "tripwire/foundation/error.hpp"

namespace tripwire::foundation {

/// Result type specialized with foundation::Error.
///
/// Operations protected by a circuit breaker return CallResult<T>; an error
/// result is what the breaker counts as a failed call.
///
/// Example:
/// @code
///   CallResult<std::string> fetchQuote(std::string_view symbol) {
///       if (symbol.empty()) {
///           return CallResult<std::string>::err(
///               Error(ErrorCode::InvalidArgument, "empty symbol"));
///       }
///       return CallResult<std::string>::ok(lookup(symbol));
///   }
/// @endcode
template <typename T>
using CallResult = tripwire::Result<T, Error>;

}  // namespace tripwire::foundation
