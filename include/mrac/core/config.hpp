#pragma once

namespace mrac{
    #if defined(MRAC_NO_EXCEPTIONS)
    inline constexpr bool kNoExceptions = true;
    #else
    inline constexpr bool kNoExceptions = false;
    #endif

    #if defined(MRAC_NO_RTTI)
    inline constexpr bool kNoRTTI = true;
    #else
    inline constexpr bool kNoRTTI = false;
    #endif

    // // guard threshold on |b_hat| below which the control law falls back to u = 0
    inline constexpr double kDefaultEpsilon = 1e-6;

} // namespace mrac
