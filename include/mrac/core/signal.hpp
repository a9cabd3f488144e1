#pragma once

#include "mrac/core/types.hpp"

namespace mrac{
    // //                          r(t); user = opaque cookie owned by the caller
    using SignalFn = Scalar(*)(Scalar t, const void* user) noexcept;

    // //                          phi(y) -> nonlinearity cancelled by the control law
    using BasisFn = Scalar(*)(Scalar y, const void* user) noexcept;

    // // Reference signal r(t): pure function of time, shared by the reference model and the control law
    struct ReferenceSignal{
        SignalFn fn{nullptr};
        const void* user{nullptr};

        Scalar operator()(Scalar t) const noexcept{
            return fn(t, user);
        }

        bool valid() const noexcept{
            return fn != nullptr;
        }
    };

    // // Pluggable basis function phi(y)
    struct Basis{
        BasisFn fn{nullptr};
        const void* user{nullptr};

        Scalar operator()(Scalar y) const noexcept{
            return fn(y, user);
        }

        bool valid() const noexcept{
            return fn != nullptr;
        }
    };

} // namespace mrac
