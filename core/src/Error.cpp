/**
 * @file Error.cpp
 * @brief Implementation of Error::format().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "biosig/core/Error.hpp"

#include <sstream>

namespace biosig::core {

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(code) << "] " << message
       << " (" << location.file_name() << ':' << location.line() << ')';
    return os.str();
}

} // namespace biosig::core
