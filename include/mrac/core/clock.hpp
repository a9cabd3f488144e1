#pragma once
#include <cstdint>

#include "mrac/core/time.hpp"

namespace mrac{
    // // Fixed-step simulation clock. Time is k * dt exactly -> no floating accumulation drift
    struct SimulationClock{
        dt_ns dt{0};
        std::uint64_t tick{0};

        t_ns now() const noexcept{
            return static_cast<t_ns>(tick) * dt;
        }

        Scalar seconds() const noexcept{
            return to_seconds(now());
        }

        Scalar dt_seconds() const noexcept{
            return to_seconds(dt);
        }

        void advance() noexcept{
            ++tick;
        }

        void rewind() noexcept{
            tick = 0;
        }
    };

} // namespace mrac
