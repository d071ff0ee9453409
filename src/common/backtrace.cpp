#include "matview/common/backtrace.hpp"

#if defined(__GLIBC__) || defined(__APPLE__)
#include <execinfo.h>
#define MATVIEW_HAS_EXECINFO 1
#endif

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

#include <cstdlib>
#include <memory>

namespace matview::common {

std::vector<std::string> capture_backtrace(std::size_t skip, std::size_t max_frames)
{
    std::vector<std::string> frames;
#if defined(MATVIEW_HAS_EXECINFO)
    std::vector<void*> stack(max_frames + skip + 1U, nullptr);
    const int captured = ::backtrace(stack.data(), static_cast<int>(stack.size()));
    if (captured <= 0) {
        return frames;
    }

    std::unique_ptr<char*, decltype(&std::free)> symbols{::backtrace_symbols(stack.data(), captured), &std::free};
    if (!symbols) {
        return frames;
    }

    // Frame 0 is capture_backtrace itself.
    const auto first = static_cast<std::size_t>(1U + skip);
    for (auto index = first; index < static_cast<std::size_t>(captured) && frames.size() < max_frames; ++index) {
        frames.emplace_back(symbols.get()[index]);
    }
#else
    (void)skip;
    (void)max_frames;
#endif
    return frames;
}

std::string demangle(const char* mangled)
{
    if (mangled == nullptr) {
        return {};
    }
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> result{abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free};
    if (status == 0 && result) {
        return std::string{result.get()};
    }
#endif
    return std::string{mangled};
}

}  // namespace matview::common
