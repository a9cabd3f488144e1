#pragma once

#include <cstddef>
#include <cstdint>

namespace mrac::tools::detail{
    struct KpiAcc{
        // // Running sums over every tick (before decimation)
        double iae{0.0};    // integral |yr - y| dt
        double itae{0.0};   // integral t * |yr - y| dt
        double tvu{0.0};    // total variation of u
        double max_abs_e{0.0};
        double last_u{0.0};
        bool have_u{false};

        std::uint64_t ticks{0};
        std::uint64_t degenerate_ticks{0};

        // tick update; dt_s is the loop period (0 until it is known)
        void on_tick(double t_s, double dt_s, double yr, double y, double u, bool degenerate) noexcept;

        // reset accum
        void reset() noexcept;
    };
} // namespace mrac::tools::detail
