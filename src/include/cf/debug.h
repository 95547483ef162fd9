#pragma once

#include <string>

namespace cf {
namespace debug {

// Tracing is off unless the CF_PARSE_DEBUG environment variable is set to a
// non-empty value other than "0". The variable is read once per process.
bool enabled();

// Overrides the environment setting for the rest of the process.
void set_enabled(bool on);

// Writes `message` to std::cerr when tracing is enabled.
void log(const std::string& message);

}  // namespace debug
}  // namespace cf
