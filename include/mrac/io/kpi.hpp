#pragma once

#include <cstdint>


namespace mrac{

    struct KpiCounters{
        // // Updates will increase monotonically (proves the loop is alive)
        std::uint64_t updates{0};

        // // degenerate_ticks > 0, means b_hat wandered near zero -> control was withheld on those ticks
        std::uint64_t degenerate_ticks{0};

        // // divergences > 0, means a run aborted on a non-finite value or integrator failure
        std::uint64_t divergences{0};

        // // runs stopped early by request_cancel()
        std::uint64_t cancellations{0};
    };


} // namespace mrac
