#pragma once

// spi-sim version information.
//
// The version is set in the root CMakeLists.txt (project VERSION x.y.z)
// and injected via compile definitions.

#include <cstdint>

namespace bus
{
namespace version
{
    static constexpr std::uint8_t kMajor = SPISIM_VERSION_MAJOR;
    static constexpr std::uint8_t kMinor = SPISIM_VERSION_MINOR;
    static constexpr std::uint8_t kPatch = SPISIM_VERSION_PATCH;

#define SPISIM_STRINGIFY_(x) #x
#define SPISIM_STRINGIFY(x) SPISIM_STRINGIFY_(x)

    static constexpr const char *kString =
        "spi-sim v"
        SPISIM_STRINGIFY(SPISIM_VERSION_MAJOR) "."
        SPISIM_STRINGIFY(SPISIM_VERSION_MINOR) "."
        SPISIM_STRINGIFY(SPISIM_VERSION_PATCH);

#undef SPISIM_STRINGIFY
#undef SPISIM_STRINGIFY_

}  // namespace version
}  // namespace bus
