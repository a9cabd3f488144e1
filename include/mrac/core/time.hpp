#pragma once
#include <cmath>
#include <cstdint>

#include "mrac/core/types.hpp"

namespace mrac{
    // // Standardized time unit across the toolkit in nanoseconds
    using t_ns = std::int64_t;
    using dt_ns = std::int64_t;

    inline constexpr Scalar kNsToS = Scalar(1e-9);

    inline Scalar to_seconds(t_ns t) noexcept{
        return static_cast<Scalar>(t) * kNsToS;
    }

    // // rounds to the nearest nanosecond; 0.01 s -> 10'000'000 ns
    inline dt_ns from_seconds(Scalar s) noexcept{
        return static_cast<dt_ns>(std::llround(static_cast<double>(s) * 1e9));
    }

} // namespace mrac
