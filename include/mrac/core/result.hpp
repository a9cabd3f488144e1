#pragma once

#include <cstdint>

#include "mrac/core/time.hpp"
#include "mrac/core/types.hpp"
#include "mrac/core/health.hpp"

namespace mrac{
    // // One emitted tuple per tick: (t, y, yr, u, a_hat, b_hat)
    // // t, y, yr are sampled at tick start (what u was computed from), a_hat/b_hat are post-update
    struct TickRecord{
        std::uint64_t tick{0};
        t_ns time_ns{0};
        Scalar t{0};
        Scalar y{0};
        Scalar yr{0};
        Scalar u{0};
        Scalar a_hat{0};
        Scalar b_hat{0};
        bool degenerate{false};
    };

    // // Returned by a completed run
    struct RunSummary{
        std::uint64_t ticks{0};
        Scalar t_final{0};
        Scalar y_final{0};
        Scalar yr_final{0};
        Scalar a_hat{0};
        Scalar b_hat{0};
        LoopHealth health{};
    };

} // namespace mrac

namespace mrac{
    // //                  reporting subscriber; called synchronously once per completed tick
    using TickSink = void(*)(const TickRecord& rec, void* user);
} // namespace mrac
