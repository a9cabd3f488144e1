#pragma once

#include <span>
#include <cstddef>

#include "mrac/core/types.hpp"
#include "mrac/core/status.hpp"

namespace mrac{
    // // Controlled system: opaque to the core. The scheduler injects u and reads back the state
    // // Output y is state component 0
    class IPlant{
        public:
            virtual ~IPlant() = default;

            // // state dimension, fixed for the plant's lifetime
            virtual std::size_t dim() const noexcept = 0;

            // // dx = f(t, x, u); any non-kOK status aborts the run unchanged
            [[nodiscard]] virtual Status rhs(
                Scalar t,
                std::span<const Scalar> x,
                Scalar u,
                std::span<Scalar> dx
            ) noexcept = 0;
    };
} // namespace mrac
