#pragma once

#include <cstddef>

#include "mrac/core/types.hpp"

namespace mrac::adaptive{

    // // Online estimates of the plant's unknown parameters. Owned by one run, threaded through every tick
    struct ParameterEstimate{
        Scalar a_hat{0};
        Scalar b_hat{0};
    };

    // // 0 -> a_hat, 1 -> b_hat, 2 -> both finite
    inline std::size_t non_finite_component(const ParameterEstimate& p) noexcept{
        if (!is_finite(p.a_hat)) return 0;
        if (!is_finite(p.b_hat)) return 1;
        return 2;
    }

} // namespace mrac::adaptive
