#pragma once
#include <string>
#include <string_view>
#include "rpncalc/errors.hpp"

namespace rpncalc {

// Render the user-facing text for an error; `detail` is the offending
// symbol, operator or wrapped cause, depending on the code.
std::string format_message(ErrorCode code, std::string_view detail);

} // namespace rpncalc
