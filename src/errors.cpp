#include "rpncalc/errors.hpp"
#include "rpncalc/messages.hpp"

#include <utility>

namespace rpncalc {

CalculatorError::CalculatorError(ErrorCode code, std::string detail)
    : std::runtime_error(format_message(code, detail)), code_(code), detail_(std::move(detail)) {}

} // namespace rpncalc
