#pragma once

#include "mrac/core/signal.hpp"

namespace mrac::basis{

    inline Scalar cube_fn(Scalar y, const void* /*user*/) noexcept{
        return y * y * y;
    }

    inline Scalar identity_fn(Scalar y, const void* /*user*/) noexcept{
        return y;
    }

    // // phi(y) = y^3, the default
    inline Basis cubic() noexcept{
        return {&cube_fn, nullptr};
    }

    // // phi(y) = y
    inline Basis identity() noexcept{
        return {&identity_fn, nullptr};
    }

} // namespace mrac::basis
