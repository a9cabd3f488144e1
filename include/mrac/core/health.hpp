#pragma once
#include <cstdint>

#include "mrac/core/types.hpp"

namespace mrac{
    struct LoopHealth{

        // // ticks completed since start()
        std::uint64_t ticks{0};

        // // ticks where |b_hat| < epsilon forced the u = 0 fallback
        std::uint64_t degenerate_ticks{0};

        // // true while the last tick was degenerate
        bool degenerate_active{false};

        // // |yr - y| measured at the start of the last tick
        Scalar last_abs_error{0};

        // // running max of |yr - y| over the run
        Scalar max_abs_error{0};

        void clear() noexcept{
            *this = LoopHealth{};
        }
    };

    static_assert(sizeof(LoopHealth) <= 64, "keep health small/fixed");

} // namespace mrac
