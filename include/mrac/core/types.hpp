#pragma once
#include <cmath>
#include <span>
#include <cstddef>
#include <type_traits>

namespace mrac{
    #if defined(MRAC_SCALAR_FLOAT)
        // // float for embedded/aarch64 tests
        using Scalar = float;
    #else
        using Scalar = double;
        static_assert(!std::is_same_v<Scalar, float>, "use double by default");
    #endif

    // // Problem size: ny measured outputs, nu inputs, nx plant state dimension
    // // The adaptive loop is SISO -> ny == nu == 1, nx >= 1
    struct Dims{
        std::size_t ny{}, nu{}, nx{};
    };

    inline bool is_finite(Scalar v) noexcept{
        return std::isfinite(v);
    }

    // // index of the first non-finite element, or x.size() when all are finite
    inline std::size_t first_non_finite(std::span<const Scalar> x) noexcept{
        for (std::size_t i=0; i<x.size(); ++i){
            if (!std::isfinite(x[i])) return i;
        }
        return x.size();
    }

} // namespace mrac
