#pragma once

#define MRAC_VERSION_MAJOR 0
#define MRAC_VERSION_MINOR 1
#define MRAC_VERSION_PATCH 0
#define MRAC_VERSION_STR   "0.1.0"


namespace mrac {
    constexpr int  kVersionMajor = MRAC_VERSION_MAJOR;
    constexpr int  kVersionMinor = MRAC_VERSION_MINOR;
    constexpr int  kVersionPatch = MRAC_VERSION_PATCH;
    constexpr char kVersionStr[] = MRAC_VERSION_STR;
} // namespace mrac

#if defined(__cplusplus)
extern "C"{
#endif
    const char* mrac_version_string() noexcept;
#if defined(__cplusplus)
}
#endif
