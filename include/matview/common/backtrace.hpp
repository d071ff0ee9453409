#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace matview::common {

// Symbolized frames of the calling thread, innermost first. Empty where the platform has no
// unwinder available.
std::vector<std::string> capture_backtrace(std::size_t skip = 1U, std::size_t max_frames = 32U);

std::string demangle(const char* mangled);

}  // namespace matview::common
